#pragma once

#include <webshell/core/types.h>
#include <webshell/supervisor/http_prober.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace spdlog {
class logger;
}

namespace webshell::supervisor {

struct ReadinessPollerConfig {
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds probeTimeout{3000};
    // Overall budget; poll forever when unset
    std::optional<std::chrono::milliseconds> maxWait;
    std::shared_ptr<spdlog::logger> logger;
};

/**
 * @brief Repeatedly probes http://host:port/ until it answers 200.
 *
 * Runs as a coroutine on a strand of the given executor. The completion
 * handler is invoked exactly once per successful start():
 *   - success when a probe reported ready
 *   - OperationCancelled after cancel()
 *   - ReadinessTimeout when maxWait elapsed
 *   - the hook's error when the attempt hook rejected an attempt
 */
class ReadinessPoller {
public:
    using CompletionHandler = std::function<void(Result<void>)>;
    // Runs after every not-ready probe; an error aborts the poll
    using AttemptHook = std::function<Result<void>(const ReadinessResult&)>;

    ReadinessPoller(boost::asio::any_io_executor executor, std::shared_ptr<IHttpProber> prober,
                    ReadinessPollerConfig config = {});
    ~ReadinessPoller();

    ReadinessPoller(const ReadinessPoller&) = delete;
    ReadinessPoller& operator=(const ReadinessPoller&) = delete;

    Result<void> start(std::string host, Port port, CompletionHandler onDone,
                       AttemptHook onAttempt = {});

    // Thread-safe. Wakes a pending wait and aborts an in-flight probe.
    void cancel();

    bool active() const;
    std::size_t attempts() const;

    const ReadinessPollerConfig& config() const { return config_; }

    struct PollState;

private:
    boost::asio::any_io_executor executor_;
    std::shared_ptr<IHttpProber> prober_;
    ReadinessPollerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::shared_ptr<PollState> current_;
};

} // namespace webshell::supervisor
