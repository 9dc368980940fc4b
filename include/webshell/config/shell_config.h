#pragma once

#include <webshell/config/config_helpers.h>
#include <webshell/core/logging.h>
#include <webshell/core/types.h>
#include <webshell/supervisor/server_supervisor.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace webshell::config {

/**
 * @brief Everything the webshell host can be configured with.
 *
 * Layers are applied in order: defaults, config file, WEBSHELL_* environment,
 * then command-line flags. Each layer only overrides what it sets.
 */
struct ShellConfig {
    // [server]
    std::string executable{"open-webui"};
    std::vector<std::string> args{"serve", "--port", "{port}"};
    std::string host{"localhost"};
    Port preferredPort{8080};
    std::optional<std::filesystem::path> workdir;
    bool quietOutput{false};
    bool verifyBinding{false};
    std::string hostEnv{"HOST"};
    std::string portEnv{"PORT"};
    std::string authEnv{"WEBUI_AUTH"};
    std::string authValue{"False"};
    std::map<std::string, std::string> extraEnv;

    // [port]
    bool evictBusyPort{true};
    Port rangeMin{1024};
    Port rangeMax{65535};
    // 0 means unbounded
    std::size_t maxPortAttempts{1000};
    std::chrono::milliseconds evictionSettle{1000};

    // [readiness]
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds probeTimeout{3000};
    // 0 means wait forever
    std::chrono::milliseconds maxWait{0};

    // [logging]
    std::string logLevel{"info"};
    std::filesystem::path logFile{"webshell.log"};
    bool logToConsole{true};

    bool openBrowser{false};
};

using EnvLookup = std::function<const char*(const char*)>;

Result<void> applyConfigTable(ShellConfig& config, const ConfigTable& table);

// Missing file is not an error.
Result<void> loadConfigFile(ShellConfig& config, const std::filesystem::path& path);

Result<void> applyEnvironment(ShellConfig& config, const EnvLookup& lookup = {});

// Range and consistency checks that no single layer can perform alone
Result<void> validate(const ShellConfig& config);

supervisor::SupervisorConfig toSupervisorConfig(const ShellConfig& config,
                                                std::shared_ptr<spdlog::logger> logger = {});
logging::LoggingConfig toLoggingConfig(const ShellConfig& config);

// TOML rendering used by --print-config
std::string toToml(const ShellConfig& config);

} // namespace webshell::config
