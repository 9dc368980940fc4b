#include <webshell/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace webshell::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view text) {
    std::string level(text);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> makeLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!config.logFile.empty()) {
        try {
            if (config.logFile.has_parent_path()) {
                std::filesystem::create_directories(config.logFile.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile.string(), config.maxFileBytes, config.maxFiles));
        } catch (const std::exception& e) {
            // Logger is not ready yet, report on stderr
            std::cerr << "webshell: cannot open log file '" << config.logFile.string()
                      << "': " << e.what() << '\n';
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kDefaultPattern);
    logger->set_level(parseLevel(config.level).value_or(spdlog::level::info));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace webshell::logging
