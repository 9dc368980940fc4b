#include <webshell/core/logging.h>
#include <webshell/supervisor/readiness_poller.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace webshell::supervisor {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

struct ReadinessPoller::PollState {
    explicit PollState(boost::asio::any_io_executor ex)
        : strand(boost::asio::make_strand(std::move(ex))), timer(strand) {}

    boost::asio::strand<boost::asio::any_io_executor> strand;
    boost::asio::steady_timer timer;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> active{true};
    std::atomic<std::size_t> attempts{0};
};

namespace {

awaitable<Result<void>> pollUntilReady(std::shared_ptr<ReadinessPoller::PollState> st,
                                       std::shared_ptr<IHttpProber> prober, std::string url,
                                       ReadinessPollerConfig config,
                                       std::shared_ptr<spdlog::logger> logger,
                                       ReadinessPoller::AttemptHook onAttempt) {
    const auto startedAt = std::chrono::steady_clock::now();
    std::optional<TimePoint> deadline;
    if (config.maxWait) {
        deadline = startedAt + *config.maxWait;
    }
    const ShouldCancel shouldCancel = [st] { return st->cancelled.load(); };

    while (true) {
        if (st->cancelled.load()) {
            co_return Error{ErrorCode::OperationCancelled, "Readiness polling cancelled"};
        }

        const auto attempt = ++st->attempts;
        auto result = prober->probe(url, config.probeTimeout, shouldCancel);

        if (st->cancelled.load()) {
            co_return Error{ErrorCode::OperationCancelled, "Readiness polling cancelled"};
        }
        if (result.ready) {
            logger->info("{} ready after {} attempt(s)", url, attempt);
            co_return Result<void>();
        }
        logger->debug("{} not ready (attempt {}): {}", url, attempt, result.detail);

        if (onAttempt) {
            auto hook = onAttempt(result);
            if (!hook) {
                co_return hook.error();
            }
        }

        auto wait = config.interval;
        if (deadline) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= *deadline) {
                co_return Error{ErrorCode::ReadinessTimeout,
                                fmt::format("{} not ready after {} attempt(s) in {}ms", url,
                                            attempt, config.maxWait->count())};
            }
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                                      *deadline - now));
        }

        boost::system::error_code ec;
        st->timer.expires_after(wait);
        co_await st->timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        // operation_aborted comes from cancel(); the flag check at the top handles it
    }
}

} // namespace

ReadinessPoller::ReadinessPoller(boost::asio::any_io_executor executor,
                                 std::shared_ptr<IHttpProber> prober, ReadinessPollerConfig config)
    : executor_(std::move(executor)), prober_(std::move(prober)), config_(std::move(config)),
      logger_(logging::orDefault(config_.logger)) {}

ReadinessPoller::~ReadinessPoller() {
    cancel();
}

Result<void> ReadinessPoller::start(std::string host, Port port, CompletionHandler onDone,
                                    AttemptHook onAttempt) {
    if (!prober_) {
        return Error{ErrorCode::InvalidArgument, "No HTTP prober configured"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ && current_->active.load()) {
        return Error{ErrorCode::OperationInProgress, "Readiness polling already active"};
    }

    auto st = std::make_shared<PollState>(executor_);
    current_ = st;
    const auto url = makeUrl(host, port);
    logger_->debug("Polling {} every {}ms", url, config_.interval.count());

    boost::asio::co_spawn(
        st->strand, pollUntilReady(st, prober_, url, config_, logger_, std::move(onAttempt)),
        [st, onDone = std::move(onDone), logger = logger_](std::exception_ptr ep,
                                                           Result<void> result) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    logger->error("Readiness poll failed: {}", e.what());
                    result = Error{ErrorCode::InternalError, e.what()};
                } catch (...) {
                    logger->error("Readiness poll failed with unknown exception");
                    result = Error{ErrorCode::InternalError, "Unknown exception while polling"};
                }
            }
            st->active.store(false);
            if (onDone) {
                onDone(std::move(result));
            }
        });
    return Result<void>();
}

void ReadinessPoller::cancel() {
    std::shared_ptr<PollState> st;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        st = current_;
    }
    if (!st || !st->active.load()) {
        return;
    }
    st->cancelled.store(true);
    boost::asio::post(st->strand, [st] { st->timer.cancel(); });
}

bool ReadinessPoller::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && current_->active.load();
}

std::size_t ReadinessPoller::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ ? current_->attempts.load() : 0;
}

} // namespace webshell::supervisor
