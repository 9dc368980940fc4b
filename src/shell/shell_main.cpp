#include <webshell/config/shell_config.h>
#include <webshell/core/fatal_handler.h>
#include <webshell/core/logging.h>
#include <webshell/supervisor/process_owner.h>
#include <webshell/supervisor/server_supervisor.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <signal.h>

#ifndef WEBSHELL_VERSION
#define WEBSHELL_VERSION "0.0.0"
#endif

namespace {

std::string browser_command() {
#if defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

} // namespace

int main(int argc, char* argv[]) {
    webshell::fatal::installHandlers();

    namespace cfg = webshell::config;
    namespace sup = webshell::supervisor;

    CLI::App app{"webshell - launch a local web server and report when it is ready"};

    std::string configPath;
    std::optional<std::string> executable;
    std::vector<std::string> args;
    std::optional<std::string> host;
    std::optional<int> port;
    bool noEvict = false;
    std::optional<long long> intervalMs;
    std::optional<long long> probeTimeoutMs;
    std::optional<long long> maxWaitMs;
    std::optional<std::size_t> maxPortAttempts;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    bool openBrowser = false;
    bool printConfig = false;

    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--executable", executable, "Server executable (default: open-webui)");
    app.add_option("--arg", args,
                   "Server argument; repeatable, replaces the default template. "
                   "{port} and {host} are substituted");
    app.add_option("--host", host, "Host the server binds and is probed on");
    app.add_option("--port", port, "Preferred port")->check(CLI::Range(1024, 65535));
    app.add_flag("--no-evict", noEvict, "Do not kill processes holding the preferred port");
    app.add_option("--interval-ms", intervalMs, "Delay between readiness probes")
        ->check(CLI::PositiveNumber);
    app.add_option("--probe-timeout-ms", probeTimeoutMs, "Timeout of a single readiness probe")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-wait-ms", maxWaitMs, "Give up after this long (0 waits forever)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--max-port-attempts", maxPortAttempts,
                   "Random port candidates to try (0 is unbounded)");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error/critical/off)");
    app.add_option("--log-file", logFile, "Log file path (empty disables file logging)");
    app.add_flag("--open-browser", openBrowser, "Open the server URL in a browser once ready");
    app.add_flag("--print-config", printConfig, "Print the effective configuration and exit");
    app.set_version_flag("--version", std::string("webshell ") + WEBSHELL_VERSION);

    CLI11_PARSE(app, argc, argv);

    cfg::ShellConfig config;
    const auto path = cfg::get_config_path(configPath);
    if (auto r = cfg::loadConfigFile(config, path); !r) {
        std::cerr << "webshell: " << r.error().message << '\n';
        return 2;
    }
    if (auto r = cfg::applyEnvironment(config); !r) {
        std::cerr << "webshell: " << r.error().message << '\n';
        return 2;
    }

    if (executable)
        config.executable = *executable;
    if (!args.empty())
        config.args = args;
    if (host)
        config.host = *host;
    if (port)
        config.preferredPort = static_cast<webshell::Port>(*port);
    if (noEvict)
        config.evictBusyPort = false;
    if (intervalMs)
        config.interval = std::chrono::milliseconds(*intervalMs);
    if (probeTimeoutMs)
        config.probeTimeout = std::chrono::milliseconds(*probeTimeoutMs);
    if (maxWaitMs)
        config.maxWait = std::chrono::milliseconds(*maxWaitMs);
    if (maxPortAttempts)
        config.maxPortAttempts = *maxPortAttempts;
    if (logLevel) {
        if (!webshell::logging::parseLevel(*logLevel)) {
            std::cerr << "webshell: unknown log level '" << *logLevel << "'\n";
            return 2;
        }
        config.logLevel = *logLevel;
    }
    if (logFile)
        config.logFile = *logFile;
    if (openBrowser)
        config.openBrowser = true;

    if (auto r = cfg::validate(config); !r) {
        std::cerr << "webshell: " << r.error().message << '\n';
        return 2;
    }

    if (printConfig) {
        std::cout << "# " << path.string() << '\n' << cfg::toToml(config);
        return 0;
    }

    auto logger = webshell::logging::makeLogger(cfg::toLoggingConfig(config));
    spdlog::set_default_logger(logger);

    boost::asio::io_context io;
    int exitCode = 0;
    sup::ProcessOwner browser(logger);

    sup::SupervisorCallbacks callbacks;
    callbacks.onReady = [&](const std::string& url) {
        std::cout << url << std::endl;
        if (!config.openBrowser) {
            return;
        }
        boost::asio::post(io, [&, url] {
            sup::SpawnRequest req;
            req.executable = browser_command();
            req.withArg(url);
            req.quietOutput = true;
            // The opener and any browser it starts must outlive us
            req.detached = true;
            if (auto r = browser.spawn(req); !r) {
                logger->warn("Could not open a browser: {}", r.error().message);
            }
        });
    };
    callbacks.onFailure = [&](const webshell::Error& error) {
        boost::asio::post(io, [&, error] {
            if (sup::spawnFailureKind(error) == sup::SpawnFailureKind::NotFound) {
                std::cerr << "webshell: '" << config.executable
                          << "' was not found. Install it or pass --executable.\n";
            } else {
                std::cerr << "webshell: " << error.message << '\n';
            }
            exitCode = 1;
            io.stop();
        });
    };

    try {
        sup::ServerSupervisor supervisor(cfg::toSupervisorConfig(config, logger), callbacks);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM, SIGHUP);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            logger->info("Received signal {}, shutting down", signo);
            supervisor.stop();
            exitCode = 128 + signo;
            io.stop();
        });

        auto started = supervisor.start();
        if (!started) {
            // onFailure already queued the report
            io.run();
            return exitCode != 0 ? exitCode : 1;
        }
        if (auto child = supervisor.child()) {
            webshell::fatal::setKillTarget(child->processGroup > 0 ? -child->processGroup
                                                                   : child->pid);
        }

        io.run();
        supervisor.stop();
        webshell::fatal::setKillTarget(0);
    } catch (const std::exception& e) {
        webshell::fatal::killTargetNow();
        logger->critical("Unhandled exception: {}", e.what());
        return 1;
    }

    logger->flush();
    return exitCode;
}
