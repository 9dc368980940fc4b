#pragma once

#include <webshell/core/types.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace spdlog {
class logger;
}

namespace webshell::supervisor {

// Lifecycle of one supervised server session.
enum class SupervisorState {
    Idle = 0,
    Allocating,
    Spawning,
    Polling,
    Ready,
    Failed,
    Stopped,
};

const char* toString(SupervisorState state);

struct SupervisorSnapshot {
    SupervisorState state{SupervisorState::Idle};
    std::optional<Port> port;
    std::string url; // set once Ready
    std::optional<Error> lastError;
    TimePoint lastTransition{};
};

// Events that can be dispatched to the state machine
struct StartRequestedEvent {};
struct PortAllocatedEvent {
    Port port;
};
struct SpawnedEvent {};
struct ReadyEvent {
    std::string url;
};
struct FailureEvent {
    Error error;
};
struct StopRequestedEvent {};

/**
 * @brief Thread-safe supervisor state machine.
 *
 * Each dispatch checks the current state and transitions atomically. It
 * returns false and leaves the state untouched when the event is not valid
 * in the current state.
 */
class SupervisorStateMachine {
public:
    explicit SupervisorStateMachine(std::shared_ptr<spdlog::logger> logger = {});

    SupervisorSnapshot snapshot() const {
        MutexLock lock(mutex_);
        return snapshot_;
    }

    SupervisorState state() const {
        MutexLock lock(mutex_);
        return snapshot_.state;
    }

    bool dispatch(const StartRequestedEvent&);
    bool dispatch(const PortAllocatedEvent&);
    bool dispatch(const SpawnedEvent&);
    bool dispatch(const ReadyEvent&);
    bool dispatch(const FailureEvent&);
    bool dispatch(const StopRequestedEvent&);

private:
    using MutexLock = std::scoped_lock<std::mutex>;

    // Caller holds mutex_
    bool transitionFrom(std::initializer_list<SupervisorState> allowed, SupervisorState next);

    std::shared_ptr<spdlog::logger> logger_;
    SupervisorSnapshot snapshot_{};
    mutable std::mutex mutex_;
};

} // namespace webshell::supervisor
