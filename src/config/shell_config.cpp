#include <webshell/config/shell_config.h>
#include <webshell/core/result_helpers.h>

#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <sstream>

namespace webshell::config {

namespace {

constexpr long long kMaxMillis = 24LL * 60 * 60 * 1000;

// Applies one setting, prefixing errors with where the value came from
class Setter {
public:
    explicit Setter(std::string origin) : origin_(std::move(origin)) {}

    Result<void> port(const std::string& key, const std::string& raw, Port& out) const {
        auto v = parse_integer(raw, 1, 65535);
        if (!v) {
            return wrap(key, v.error());
        }
        out = static_cast<Port>(v.value());
        return Result<void>();
    }

    Result<void> millis(const std::string& key, const std::string& raw,
                        std::chrono::milliseconds& out, long long min = 0) const {
        auto v = parse_integer(raw, min, kMaxMillis);
        if (!v) {
            return wrap(key, v.error());
        }
        out = std::chrono::milliseconds(v.value());
        return Result<void>();
    }

    Result<void> count(const std::string& key, const std::string& raw, std::size_t& out) const {
        auto v = parse_integer(raw, 0, 1'000'000'000LL);
        if (!v) {
            return wrap(key, v.error());
        }
        out = static_cast<std::size_t>(v.value());
        return Result<void>();
    }

    Result<void> flag(const std::string& key, const std::string& raw, bool& out) const {
        auto v = parse_bool(raw);
        if (!v) {
            return wrap(key, v.error());
        }
        out = v.value();
        return Result<void>();
    }

    Result<void> level(const std::string& key, const std::string& raw, std::string& out) const {
        if (!logging::parseLevel(raw)) {
            return wrap(key, Error{ErrorCode::InvalidArgument, "Unknown log level '" + raw + "'"});
        }
        out = raw;
        return Result<void>();
    }

private:
    Result<void> wrap(const std::string& key, const Error& e) const {
        return Error{e.code, origin_ + " " + key + ": " + e.message};
    }

    std::string origin_;
};

const std::string* lookupValue(const ConfigTable& table, const std::string& section,
                               const std::string& key) {
    auto sec = table.find(section);
    if (sec == table.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

} // namespace

Result<void> applyConfigTable(ShellConfig& config, const ConfigTable& table) {
    const Setter set("config");

    if (auto v = lookupValue(table, "server", "executable")) {
        config.executable = *v;
    }
    if (auto v = lookupValue(table, "server", "args")) {
        config.args = parse_string_list(*v);
    }
    if (auto v = lookupValue(table, "server", "host")) {
        config.host = *v;
    }
    if (auto v = lookupValue(table, "server", "port")) {
        WEBSHELL_TRY(set.port("server.port", *v, config.preferredPort));
    }
    if (auto v = lookupValue(table, "server", "workdir"); v && !v->empty()) {
        config.workdir = expand_tilde(*v);
    }
    if (auto v = lookupValue(table, "server", "quiet")) {
        WEBSHELL_TRY(set.flag("server.quiet", *v, config.quietOutput));
    }
    if (auto v = lookupValue(table, "server", "verify_binding")) {
        WEBSHELL_TRY(set.flag("server.verify_binding", *v, config.verifyBinding));
    }
    if (auto v = lookupValue(table, "server", "host_env")) {
        config.hostEnv = *v;
    }
    if (auto v = lookupValue(table, "server", "port_env")) {
        config.portEnv = *v;
    }
    if (auto v = lookupValue(table, "server", "auth_env")) {
        config.authEnv = *v;
    }
    if (auto v = lookupValue(table, "server", "auth_value")) {
        config.authValue = *v;
    }
    if (auto sec = table.find("server.env"); sec != table.end()) {
        for (const auto& [k, v] : sec->second) {
            config.extraEnv[k] = v;
        }
    }

    if (auto v = lookupValue(table, "port", "evict_busy_port")) {
        WEBSHELL_TRY(set.flag("port.evict_busy_port", *v, config.evictBusyPort));
    }
    if (auto v = lookupValue(table, "port", "range_min")) {
        WEBSHELL_TRY(set.port("port.range_min", *v, config.rangeMin));
    }
    if (auto v = lookupValue(table, "port", "range_max")) {
        WEBSHELL_TRY(set.port("port.range_max", *v, config.rangeMax));
    }
    if (auto v = lookupValue(table, "port", "max_attempts")) {
        WEBSHELL_TRY(set.count("port.max_attempts", *v, config.maxPortAttempts));
    }
    if (auto v = lookupValue(table, "port", "eviction_settle_ms")) {
        WEBSHELL_TRY(set.millis("port.eviction_settle_ms", *v, config.evictionSettle));
    }

    if (auto v = lookupValue(table, "readiness", "interval_ms")) {
        WEBSHELL_TRY(set.millis("readiness.interval_ms", *v, config.interval, 1));
    }
    if (auto v = lookupValue(table, "readiness", "probe_timeout_ms")) {
        WEBSHELL_TRY(set.millis("readiness.probe_timeout_ms", *v, config.probeTimeout, 1));
    }
    if (auto v = lookupValue(table, "readiness", "max_wait_ms")) {
        WEBSHELL_TRY(set.millis("readiness.max_wait_ms", *v, config.maxWait));
    }

    if (auto v = lookupValue(table, "logging", "level")) {
        WEBSHELL_TRY(set.level("logging.level", *v, config.logLevel));
    }
    if (auto v = lookupValue(table, "logging", "file")) {
        config.logFile = v->empty() ? std::filesystem::path{} : expand_tilde(*v);
    }
    if (auto v = lookupValue(table, "logging", "console")) {
        WEBSHELL_TRY(set.flag("logging.console", *v, config.logToConsole));
    }
    return Result<void>();
}

Result<void> loadConfigFile(ShellConfig& config, const std::filesystem::path& path) {
    auto table = parse_config_file(path);
    if (!table) {
        return table.error();
    }
    return applyConfigTable(config, table.value());
}

Result<void> applyEnvironment(ShellConfig& config, const EnvLookup& lookup) {
    const EnvLookup get = lookup ? lookup : EnvLookup([](const char* n) { return std::getenv(n); });
    const Setter set("environment");
    auto value = [&](const char* name) -> const char* {
        const char* v = get(name);
        return (v && *v) ? v : nullptr;
    };

    if (auto v = value("WEBSHELL_EXECUTABLE")) {
        config.executable = v;
    }
    if (auto v = value("WEBSHELL_HOST")) {
        config.host = v;
    }
    if (auto v = value("WEBSHELL_PORT")) {
        WEBSHELL_TRY(set.port("WEBSHELL_PORT", v, config.preferredPort));
    }
    if (auto v = value("WEBSHELL_EVICT")) {
        WEBSHELL_TRY(set.flag("WEBSHELL_EVICT", v, config.evictBusyPort));
    }
    if (auto v = value("WEBSHELL_MAX_PORT_ATTEMPTS")) {
        WEBSHELL_TRY(set.count("WEBSHELL_MAX_PORT_ATTEMPTS", v, config.maxPortAttempts));
    }
    if (auto v = value("WEBSHELL_INTERVAL_MS")) {
        WEBSHELL_TRY(set.millis("WEBSHELL_INTERVAL_MS", v, config.interval, 1));
    }
    if (auto v = value("WEBSHELL_PROBE_TIMEOUT_MS")) {
        WEBSHELL_TRY(set.millis("WEBSHELL_PROBE_TIMEOUT_MS", v, config.probeTimeout, 1));
    }
    if (auto v = value("WEBSHELL_MAX_WAIT_MS")) {
        WEBSHELL_TRY(set.millis("WEBSHELL_MAX_WAIT_MS", v, config.maxWait));
    }
    if (auto v = value("WEBSHELL_LOG_LEVEL")) {
        WEBSHELL_TRY(set.level("WEBSHELL_LOG_LEVEL", v, config.logLevel));
    }
    if (const char* v = get("WEBSHELL_LOG_FILE")) {
        // Set but empty disables the file sink
        config.logFile = *v ? expand_tilde(v) : std::filesystem::path{};
    }
    return Result<void>();
}

Result<void> validate(const ShellConfig& config) {
    if (config.executable.empty()) {
        return Error{ErrorCode::InvalidArgument, "No server executable configured"};
    }
    if (config.host.empty()) {
        return Error{ErrorCode::InvalidArgument, "No server host configured"};
    }
    if (config.rangeMin < 1024 || config.rangeMin > config.rangeMax) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid port range [{}, {}]", config.rangeMin, config.rangeMax)};
    }
    if (config.preferredPort < config.rangeMin || config.preferredPort > config.rangeMax) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Port {} outside [{}, {}]", config.preferredPort, config.rangeMin,
                                 config.rangeMax)};
    }
    return Result<void>();
}

supervisor::SupervisorConfig toSupervisorConfig(const ShellConfig& config,
                                                std::shared_ptr<spdlog::logger> logger) {
    supervisor::SupervisorConfig out;
    out.logger = logger;
    out.verifyBinding = config.verifyBinding;

    auto& server = out.server;
    server.executable = config.executable;
    server.args = config.args;
    server.extraEnv = config.extraEnv;
    server.host = config.host;
    server.preferredPort = config.preferredPort;
    server.hostEnv = config.hostEnv;
    server.portEnv = config.portEnv;
    server.authEnv = config.authEnv;
    server.authValue = config.authValue;
    server.workdir = config.workdir;
    server.quietOutput = config.quietOutput;

    auto& ports = out.ports;
    ports.rangeMin = config.rangeMin;
    ports.rangeMax = config.rangeMax;
    ports.evictBusyPort = config.evictBusyPort;
    ports.evictionSettle = config.evictionSettle;
    if (config.maxPortAttempts > 0) {
        ports.maxRandomAttempts = config.maxPortAttempts;
    }
    ports.host = config.host;
    ports.logger = logger;

    auto& readiness = out.readiness;
    readiness.interval = config.interval;
    readiness.probeTimeout = config.probeTimeout;
    if (config.maxWait.count() > 0) {
        readiness.maxWait = config.maxWait;
    }
    readiness.logger = logger;
    return out;
}

logging::LoggingConfig toLoggingConfig(const ShellConfig& config) {
    logging::LoggingConfig out;
    out.level = config.logLevel;
    out.logFile = config.logFile;
    out.console = config.logToConsole;
    return out;
}

std::string toToml(const ShellConfig& config) {
    auto quote = [](const std::string& s) { return "\"" + s + "\""; };
    auto onOff = [](bool b) { return b ? "true" : "false"; };

    std::ostringstream out;
    out << "[server]\n";
    out << "executable = " << quote(config.executable) << "\n";
    out << "args = [";
    for (std::size_t i = 0; i < config.args.size(); ++i) {
        out << (i ? ", " : "") << quote(config.args[i]);
    }
    out << "]\n";
    out << "host = " << quote(config.host) << "\n";
    out << "port = " << config.preferredPort << "\n";
    if (config.workdir) {
        out << "workdir = " << quote(config.workdir->string()) << "\n";
    }
    out << "quiet = " << onOff(config.quietOutput) << "\n";
    out << "verify_binding = " << onOff(config.verifyBinding) << "\n";
    out << "host_env = " << quote(config.hostEnv) << "\n";
    out << "port_env = " << quote(config.portEnv) << "\n";
    out << "auth_env = " << quote(config.authEnv) << "\n";
    out << "auth_value = " << quote(config.authValue) << "\n";
    if (!config.extraEnv.empty()) {
        out << "\n[server.env]\n";
        for (const auto& [k, v] : config.extraEnv) {
            out << k << " = " << quote(v) << "\n";
        }
    }

    out << "\n[port]\n";
    out << "evict_busy_port = " << onOff(config.evictBusyPort) << "\n";
    out << "range_min = " << config.rangeMin << "\n";
    out << "range_max = " << config.rangeMax << "\n";
    out << "max_attempts = " << config.maxPortAttempts << "\n";
    out << "eviction_settle_ms = " << config.evictionSettle.count() << "\n";

    out << "\n[readiness]\n";
    out << "interval_ms = " << config.interval.count() << "\n";
    out << "probe_timeout_ms = " << config.probeTimeout.count() << "\n";
    out << "max_wait_ms = " << config.maxWait.count() << "\n";

    out << "\n[logging]\n";
    out << "level = " << quote(config.logLevel) << "\n";
    out << "file = " << quote(config.logFile.string()) << "\n";
    out << "console = " << onOff(config.logToConsole) << "\n";
    return out.str();
}

} // namespace webshell::config
