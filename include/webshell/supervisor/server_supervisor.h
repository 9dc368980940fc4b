#pragma once

#include <webshell/core/types.h>
#include <webshell/platform/process_probe.h>
#include <webshell/supervisor/http_prober.h>
#include <webshell/supervisor/port_allocator.h>
#include <webshell/supervisor/process_owner.h>
#include <webshell/supervisor/readiness_poller.h>
#include <webshell/supervisor/supervisor_state.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace spdlog {
class logger;
}

namespace webshell::supervisor {

/**
 * @brief What to launch and how the child learns where to listen.
 *
 * "{port}" and "{host}" inside args are replaced with the resolved values.
 * The host, port and auth variables are injected into the child environment
 * under the configured names; an empty name skips that variable.
 */
struct ServerLaunchConfig {
    std::string executable{"open-webui"};
    std::vector<std::string> args{"serve", "--port", "{port}"};
    std::map<std::string, std::string> extraEnv;
    std::string host{"localhost"};
    Port preferredPort{kDefaultPreferredPort};
    std::string hostEnv{"HOST"};
    std::string portEnv{"PORT"};
    std::string authEnv{"WEBUI_AUTH"};
    std::string authValue{"False"};
    std::optional<std::filesystem::path> workdir;
    bool quietOutput{false};
};

struct SupervisorConfig {
    ServerLaunchConfig server;
    PortAllocatorConfig ports;
    ReadinessPollerConfig readiness;
    // Warn when the ready port is not owned by the child or its process group
    bool verifyBinding{false};
    std::shared_ptr<spdlog::logger> logger;
};

// Collaborators; any null member is replaced with the system implementation.
struct SupervisorComponents {
    std::shared_ptr<platform::IProcessProbe> processProbe;
    PortInUseCheck portInUse;
    std::shared_ptr<IProcessOwner> processOwner;
    std::shared_ptr<IHttpProber> httpProber;
};

struct SupervisorCallbacks {
    std::function<void(const std::string& url)> onReady;
    std::function<void(const Error& error)> onFailure;
};

/**
 * @brief Owns one local server from port selection to teardown.
 *
 * start() allocates a port, spawns the child and begins readiness polling.
 * Exactly one of onReady/onFailure fires per accepted start(), unless stop()
 * comes first. Callbacks run without internal locks held, on the polling
 * executor or on the thread calling start(). A supervisor must not be
 * destroyed from inside its own callbacks.
 *
 * The instance is one-shot: after stop() it stays Stopped.
 */
class ServerSupervisor {
public:
    // Runs polling on an internal io_context with one worker thread.
    explicit ServerSupervisor(SupervisorConfig config, SupervisorCallbacks callbacks = {},
                              SupervisorComponents components = {});
    // Runs polling on a caller-supplied executor.
    ServerSupervisor(boost::asio::any_io_executor executor, SupervisorConfig config,
                     SupervisorCallbacks callbacks = {}, SupervisorComponents components = {});
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    /**
     * @brief Begin a session. Accepted only in Idle; InvalidState otherwise.
     *
     * Allocation and spawn errors are returned here and also delivered to
     * onFailure. A success return means polling has started.
     */
    Result<void> start();

    // Safe from any state and idempotent.
    void stop();

    SupervisorSnapshot snapshot() const { return fsm_.snapshot(); }
    SupervisorState state() const { return fsm_.state(); }
    std::string url() const { return fsm_.snapshot().url; }
    std::optional<ProcessHandle> child() const;

    static std::vector<std::string> expandArgs(const std::vector<std::string>& args,
                                               const std::string& host, Port port);

private:
    struct CallbackGate {
        std::mutex mutex;
        bool open{true};
    };

    ServerSupervisor(std::unique_ptr<boost::asio::io_context> io, SupervisorConfig config,
                     SupervisorCallbacks callbacks, SupervisorComponents components);

    void init(SupervisorComponents components);
    Result<void> runStartLocked();
    SpawnRequest buildSpawnRequest(Port port) const;
    // Runs on the polling executor; must not touch the supervisor itself
    static Result<void> checkChildAlive(IProcessOwner& owner);
    std::function<void()> onPollFinished(Result<void> result);
    void verifyBinding(Port port);

    std::unique_ptr<boost::asio::io_context> ownedIo_;
    boost::asio::any_io_executor executor_;
    SupervisorConfig config_;
    SupervisorCallbacks callbacks_;
    std::shared_ptr<spdlog::logger> logger_;

    std::shared_ptr<platform::IProcessProbe> probe_;
    std::shared_ptr<IProcessOwner> owner_;
    std::shared_ptr<IHttpProber> prober_;
    std::unique_ptr<PortAllocator> allocator_;
    std::unique_ptr<ReadinessPoller> poller_;
    SupervisorStateMachine fsm_;

    std::mutex opMutex_;
    std::shared_ptr<CallbackGate> gate_;

    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::thread ioThread_;
};

} // namespace webshell::supervisor
