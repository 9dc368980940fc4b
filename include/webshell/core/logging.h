#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace webshell::logging {

inline constexpr const char* kLoggerName = "webshell";
inline constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S.%e [%n][%l] %v";

struct LoggingConfig {
    std::string level{"info"};
    // Empty path disables the file sink.
    std::filesystem::path logFile{"webshell.log"};
    std::size_t maxFileBytes{10 * 1024 * 1024};
    std::size_t maxFiles{3};
    bool console{true};
};

// Accepts trace/debug/info/warn/warning/error/critical/off, case-insensitive.
std::optional<spdlog::level::level_enum> parseLevel(std::string_view text);

// Builds the process logger: colored stderr sink plus optional rotating file sink.
// Falls back to console-only when the log file cannot be opened.
std::shared_ptr<spdlog::logger> makeLogger(const LoggingConfig& config);

// Components receive their logger explicitly; a null pointer means "use the default".
inline std::shared_ptr<spdlog::logger> orDefault(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : spdlog::default_logger();
}

} // namespace webshell::logging
