#include <webshell/core/logging.h>
#include <webshell/supervisor/server_supervisor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string_view>

#include <unistd.h>

namespace webshell::supervisor {

namespace {

void replaceAll(std::string& s, std::string_view from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string joinCommand(const std::string& exe, const std::vector<std::string>& args) {
    std::string out = exe;
    for (const auto& a : args) {
        out += ' ';
        out += a;
    }
    return out;
}

} // namespace

ServerSupervisor::ServerSupervisor(SupervisorConfig config, SupervisorCallbacks callbacks,
                                   SupervisorComponents components)
    : ServerSupervisor(std::make_unique<boost::asio::io_context>(), std::move(config),
                       std::move(callbacks), std::move(components)) {}

ServerSupervisor::ServerSupervisor(std::unique_ptr<boost::asio::io_context> io,
                                   SupervisorConfig config, SupervisorCallbacks callbacks,
                                   SupervisorComponents components)
    : ownedIo_(std::move(io)), executor_(ownedIo_->get_executor()), config_(std::move(config)),
      callbacks_(std::move(callbacks)), logger_(logging::orDefault(config_.logger)),
      fsm_(logger_), gate_(std::make_shared<CallbackGate>()) {
    init(std::move(components));
    workGuard_.emplace(boost::asio::make_work_guard(*ownedIo_));
    ioThread_ = std::thread([io = ownedIo_.get(), logger = logger_] {
        try {
            io->run();
        } catch (const std::exception& e) {
            logger->error("Supervisor io thread terminated: {}", e.what());
        }
    });
}

ServerSupervisor::ServerSupervisor(boost::asio::any_io_executor executor, SupervisorConfig config,
                                   SupervisorCallbacks callbacks, SupervisorComponents components)
    : executor_(std::move(executor)), config_(std::move(config)),
      callbacks_(std::move(callbacks)), logger_(logging::orDefault(config_.logger)),
      fsm_(logger_), gate_(std::make_shared<CallbackGate>()) {
    init(std::move(components));
}

void ServerSupervisor::init(SupervisorComponents components) {
    if (!config_.ports.logger) {
        config_.ports.logger = logger_;
    }
    if (!config_.readiness.logger) {
        config_.readiness.logger = logger_;
    }
    config_.ports.host = config_.server.host;

    probe_ = components.processProbe ? std::move(components.processProbe)
                                     : platform::makeSystemProcessProbe(logger_);
    owner_ = components.processOwner ? std::move(components.processOwner)
                                     : std::make_shared<ProcessOwner>(logger_);
    prober_ = components.httpProber ? std::move(components.httpProber)
                                    : std::make_shared<CurlHttpProber>(logger_);

    allocator_ =
        std::make_unique<PortAllocator>(config_.ports, probe_, std::move(components.portInUse));
    poller_ = std::make_unique<ReadinessPoller>(executor_, prober_, config_.readiness);
}

ServerSupervisor::~ServerSupervisor() {
    stop();
    {
        std::lock_guard<std::mutex> lock(gate_->mutex);
        gate_->open = false;
    }
    if (ownedIo_) {
        workGuard_.reset();
        if (ioThread_.joinable()) {
            if (ioThread_.get_id() == std::this_thread::get_id()) {
                logger_->critical("ServerSupervisor destroyed on its own io thread; leaking it");
                ioThread_.detach();
                (void)ownedIo_.release();
            } else {
                ioThread_.join();
            }
        }
    }
}

std::vector<std::string> ServerSupervisor::expandArgs(const std::vector<std::string>& args,
                                                      const std::string& host, Port port) {
    std::vector<std::string> out;
    out.reserve(args.size());
    const auto portText = std::to_string(port);
    for (auto arg : args) {
        replaceAll(arg, "{port}", portText);
        replaceAll(arg, "{host}", host);
        out.push_back(std::move(arg));
    }
    return out;
}

SpawnRequest ServerSupervisor::buildSpawnRequest(Port port) const {
    const auto& server = config_.server;
    SpawnRequest req;
    req.executable = server.executable;
    req.args = expandArgs(server.args, server.host, port);
    req.env = server.extraEnv;
    if (!server.hostEnv.empty()) {
        req.withEnv(server.hostEnv, server.host);
    }
    if (!server.portEnv.empty()) {
        req.withEnv(server.portEnv, std::to_string(port));
    }
    if (!server.authEnv.empty()) {
        req.withEnv(server.authEnv, server.authValue);
    }
    req.workdir = server.workdir;
    req.quietOutput = server.quietOutput;
    return req;
}

std::optional<ProcessHandle> ServerSupervisor::child() const {
    return owner_->handle();
}

Result<void> ServerSupervisor::start() {
    std::function<void()> notify;
    Result<void> result;
    {
        std::lock_guard<std::mutex> lock(opMutex_);
        if (!fsm_.dispatch(StartRequestedEvent{})) {
            return Error{ErrorCode::InvalidState,
                         std::string("Cannot start supervisor in state ") +
                             toString(fsm_.state())};
        }
        result = runStartLocked();
        if (!result) {
            logger_->error("Failed to start server: {}", result.error().message);
            fsm_.dispatch(FailureEvent{result.error()});
            notify = [cb = callbacks_.onFailure, err = result.error()] {
                if (cb) {
                    cb(err);
                }
            };
        }
    }
    if (notify) {
        notify();
    }
    return result;
}

Result<void> ServerSupervisor::runStartLocked() {
    auto port = allocator_->allocate(config_.server.preferredPort);
    if (!port) {
        return port.error();
    }
    fsm_.dispatch(PortAllocatedEvent{port.value()});

    auto request = buildSpawnRequest(port.value());
    logger_->info("Starting server: {}", joinCommand(request.executable, request.args));
    auto spawned = owner_->spawn(request);
    if (!spawned) {
        if (spawnFailureKind(spawned.error()) == SpawnFailureKind::NotFound) {
            logger_->error("'{}' was not found on PATH; is it installed?", request.executable);
        }
        return spawned.error();
    }
    fsm_.dispatch(SpawnedEvent{});

    auto gate = gate_;
    auto polling = poller_->start(
        config_.server.host, port.value(),
        [this, gate](Result<void> r) {
            std::function<void()> notify;
            {
                std::lock_guard<std::mutex> lock(gate->mutex);
                if (!gate->open) {
                    return;
                }
                notify = onPollFinished(std::move(r));
            }
            if (notify) {
                notify();
            }
        },
        [gate, owner = owner_](const ReadinessResult&) -> Result<void> {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (!gate->open) {
                return Error{ErrorCode::OperationCancelled, "Supervisor is shutting down"};
            }
            return checkChildAlive(*owner);
        });
    if (!polling) {
        auto t = owner_->terminate();
        if (!t) {
            logger_->warn("Failed to terminate server after polling error: {}", t.error().message);
        }
        return polling.error();
    }
    return Result<void>();
}

Result<void> ServerSupervisor::checkChildAlive(IProcessOwner& owner) {
    if (auto code = owner.pollExit()) {
        return Error{ErrorCode::ProcessExited,
                     fmt::format("Server process exited with code {} before becoming ready",
                                 *code)};
    }
    return Result<void>();
}

std::function<void()> ServerSupervisor::onPollFinished(Result<void> result) {
    std::lock_guard<std::mutex> lock(opMutex_);
    if (fsm_.state() != SupervisorState::Polling) {
        return {};
    }

    if (result) {
        const auto snap = fsm_.snapshot();
        const Port port = snap.port.value_or(0);
        if (config_.verifyBinding) {
            verifyBinding(port);
        }
        const auto url = makeUrl(config_.server.host, port);
        if (!fsm_.dispatch(ReadyEvent{url})) {
            return {};
        }
        logger_->info("Server ready at {}", url);
        return [cb = callbacks_.onReady, url] {
            if (cb) {
                cb(url);
            }
        };
    }

    const auto& error = result.error();
    if (error.code == ErrorCode::OperationCancelled) {
        return {};
    }
    logger_->error("Server failed to become ready: {}", error.message);
    auto t = owner_->terminate();
    if (!t) {
        logger_->warn("Failed to terminate server: {}", t.error().message);
    }
    fsm_.dispatch(FailureEvent{error});
    return [cb = callbacks_.onFailure, error] {
        if (cb) {
            cb(error);
        }
    };
}

void ServerSupervisor::verifyBinding(Port port) {
    const auto handle = owner_->handle();
    if (!handle) {
        return;
    }
    auto owners = probe_->ownersOfPort(port);
    if (!owners) {
        logger_->warn("Cannot verify who listens on port {}: {}", port, owners.error().message);
        return;
    }
    for (pid_t pid : owners.value()) {
        if (pid == handle->pid) {
            return;
        }
        if (handle->processGroup > 0 && ::getpgid(pid) == handle->processGroup) {
            return;
        }
    }
    logger_->warn("Port {} answered but is not held by the server (pid={})", port, handle->pid);
}

void ServerSupervisor::stop() {
    std::lock_guard<std::mutex> lock(opMutex_);
    if (fsm_.state() == SupervisorState::Stopped) {
        return;
    }
    poller_->cancel();
    auto t = owner_->terminate();
    if (!t) {
        logger_->warn("Failed to terminate server: {}", t.error().message);
    }
    fsm_.dispatch(StopRequestedEvent{});
}

} // namespace webshell::supervisor
