#include <webshell/core/logging.h>
#include <webshell/supervisor/supervisor_state.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace webshell::supervisor {

const char* toString(SupervisorState state) {
    switch (state) {
        case SupervisorState::Idle:
            return "Idle";
        case SupervisorState::Allocating:
            return "Allocating";
        case SupervisorState::Spawning:
            return "Spawning";
        case SupervisorState::Polling:
            return "Polling";
        case SupervisorState::Ready:
            return "Ready";
        case SupervisorState::Failed:
            return "Failed";
        case SupervisorState::Stopped:
            return "Stopped";
    }
    return "Unknown";
}

SupervisorStateMachine::SupervisorStateMachine(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::orDefault(std::move(logger))) {
    snapshot_.lastTransition = std::chrono::steady_clock::now();
}

bool SupervisorStateMachine::transitionFrom(std::initializer_list<SupervisorState> allowed,
                                            SupervisorState next) {
    const auto prev = snapshot_.state;
    if (std::find(allowed.begin(), allowed.end(), prev) == allowed.end()) {
        logger_->debug("Supervisor ignoring transition {} -> {}", toString(prev), toString(next));
        return false;
    }
    snapshot_.state = next;
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    if (snapshot_.lastError && next == SupervisorState::Failed) {
        logger_->info("Supervisor transition: {} -> {} error={}", toString(prev), toString(next),
                      snapshot_.lastError->message);
    } else {
        logger_->info("Supervisor transition: {} -> {}", toString(prev), toString(next));
    }
    return true;
}

bool SupervisorStateMachine::dispatch(const StartRequestedEvent&) {
    MutexLock lock(mutex_);
    return transitionFrom({SupervisorState::Idle}, SupervisorState::Allocating);
}

bool SupervisorStateMachine::dispatch(const PortAllocatedEvent& ev) {
    MutexLock lock(mutex_);
    if (!transitionFrom({SupervisorState::Allocating}, SupervisorState::Spawning)) {
        return false;
    }
    snapshot_.port = ev.port;
    return true;
}

bool SupervisorStateMachine::dispatch(const SpawnedEvent&) {
    MutexLock lock(mutex_);
    return transitionFrom({SupervisorState::Spawning}, SupervisorState::Polling);
}

bool SupervisorStateMachine::dispatch(const ReadyEvent& ev) {
    MutexLock lock(mutex_);
    if (!transitionFrom({SupervisorState::Polling}, SupervisorState::Ready)) {
        return false;
    }
    snapshot_.url = ev.url;
    return true;
}

bool SupervisorStateMachine::dispatch(const FailureEvent& ev) {
    MutexLock lock(mutex_);
    const auto prev = snapshot_.state;
    if (prev != SupervisorState::Allocating && prev != SupervisorState::Spawning &&
        prev != SupervisorState::Polling) {
        logger_->debug("Supervisor ignoring failure in state {}: {}", toString(prev),
                       ev.error.message);
        return false;
    }
    snapshot_.lastError = ev.error;
    return transitionFrom({prev}, SupervisorState::Failed);
}

bool SupervisorStateMachine::dispatch(const StopRequestedEvent&) {
    MutexLock lock(mutex_);
    return transitionFrom({SupervisorState::Idle, SupervisorState::Allocating,
                           SupervisorState::Spawning, SupervisorState::Polling,
                           SupervisorState::Ready, SupervisorState::Failed},
                          SupervisorState::Stopped);
}

} // namespace webshell::supervisor
