#include <gtest/gtest.h>

#include <webshell/supervisor/readiness_poller.h>

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <functional>
#include <optional>

using namespace webshell;
using namespace webshell::supervisor;

namespace {

// Reports not-ready for the first `failures` probes, then 200
class ScriptedProber : public IHttpProber {
public:
    explicit ScriptedProber(std::size_t failures) : failures_(failures) {}

    ReadinessResult probe(const std::string& url, std::chrono::milliseconds,
                          const ShouldCancel&) override {
        const auto n = ++calls;
        lastUrl = url;
        if (onProbe) {
            onProbe(n);
        }
        ReadinessResult r;
        if (n > failures_) {
            r.ready = true;
            r.httpStatus = 200;
            r.detail = "HTTP 200";
        } else {
            r.httpStatus = 503;
            r.detail = "HTTP 503";
        }
        return r;
    }

    std::atomic<std::size_t> calls{0};
    std::string lastUrl;
    std::function<void(std::size_t)> onProbe;

private:
    std::size_t failures_;
};

ReadinessPollerConfig fastConfig() {
    ReadinessPollerConfig cfg;
    cfg.interval = std::chrono::milliseconds(5);
    cfg.probeTimeout = std::chrono::milliseconds(100);
    return cfg;
}

} // namespace

TEST(ReadinessPollerTest, ReadyOnlyAfterFirstSuccessfulProbe) {
    boost::asio::io_context io;
    auto prober = std::make_shared<ScriptedProber>(4);
    ReadinessPoller poller(io.get_executor(), prober, fastConfig());

    std::optional<Result<void>> done;
    std::size_t probesAtCompletion = 0;
    ASSERT_TRUE(poller.start("localhost", 8080, [&](Result<void> r) {
        probesAtCompletion = prober->calls.load();
        done = std::move(r);
    }));
    io.run();

    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done->has_value());
    EXPECT_EQ(probesAtCompletion, 5u);
    EXPECT_EQ(poller.attempts(), 5u);
    EXPECT_EQ(prober->lastUrl, "http://localhost:8080");
    EXPECT_FALSE(poller.active());
}

TEST(ReadinessPollerTest, CancelStopsFurtherProbes) {
    boost::asio::io_context io;
    auto prober = std::make_shared<ScriptedProber>(100);
    ReadinessPoller poller(io.get_executor(), prober, fastConfig());
    prober->onProbe = [&](std::size_t n) {
        if (n == 2) {
            poller.cancel();
        }
    };

    std::optional<Result<void>> done;
    ASSERT_TRUE(poller.start("localhost", 8080, [&](Result<void> r) { done = std::move(r); }));
    io.run();

    ASSERT_TRUE(done.has_value());
    ASSERT_FALSE(done->has_value());
    EXPECT_EQ(done->error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(prober->calls.load(), 2u);
}

TEST(ReadinessPollerTest, CancelDuringProbeSuppressesReadyResult) {
    boost::asio::io_context io;
    // Second probe would succeed, but cancellation lands while it is in flight
    auto prober = std::make_shared<ScriptedProber>(1);
    ReadinessPoller poller(io.get_executor(), prober, fastConfig());
    prober->onProbe = [&](std::size_t n) {
        if (n == 2) {
            poller.cancel();
        }
    };

    std::optional<Result<void>> done;
    ASSERT_TRUE(poller.start("localhost", 8080, [&](Result<void> r) { done = std::move(r); }));
    io.run();

    ASSERT_TRUE(done.has_value());
    ASSERT_FALSE(done->has_value());
    EXPECT_EQ(done->error().code, ErrorCode::OperationCancelled);
}

TEST(ReadinessPollerTest, CancelWakesPendingWaitImmediately) {
    boost::asio::io_context io;
    auto prober = std::make_shared<ScriptedProber>(100);
    auto cfg = fastConfig();
    cfg.interval = std::chrono::hours(1);
    ReadinessPoller poller(io.get_executor(), prober, cfg);

    std::optional<Result<void>> done;
    ASSERT_TRUE(poller.start("localhost", 8080, [&](Result<void> r) { done = std::move(r); }));
    io.run_for(std::chrono::milliseconds(100)); // first probe, then parked on the timer
    EXPECT_EQ(prober->calls.load(), 1u);

    const auto before = std::chrono::steady_clock::now();
    poller.cancel();
    io.run_for(std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->error().code, ErrorCode::OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(2));
    EXPECT_EQ(prober->calls.load(), 1u);
}

TEST(ReadinessPollerTest, MaxWaitProducesReadinessTimeout) {
    boost::asio::io_context io;
    auto prober = std::make_shared<ScriptedProber>(1'000'000);
    auto cfg = fastConfig();
    cfg.maxWait = std::chrono::milliseconds(60);
    ReadinessPoller poller(io.get_executor(), prober, cfg);

    std::optional<Result<void>> done;
    ASSERT_TRUE(poller.start("localhost", 8080, [&](Result<void> r) { done = std::move(r); }));
    io.run();

    ASSERT_TRUE(done.has_value());
    ASSERT_FALSE(done->has_value());
    EXPECT_EQ(done->error().code, ErrorCode::ReadinessTimeout);
    EXPECT_GE(prober->calls.load(), 2u);
}

TEST(ReadinessPollerTest, AttemptHookErrorAbortsPoll) {
    boost::asio::io_context io;
    auto prober = std::make_shared<ScriptedProber>(100);
    ReadinessPoller poller(io.get_executor(), prober, fastConfig());

    std::size_t hookCalls = 0;
    std::optional<Result<void>> done;
    ASSERT_TRUE(poller.start(
        "localhost", 8080, [&](Result<void> r) { done = std::move(r); },
        [&](const ReadinessResult& r) -> Result<void> {
            EXPECT_FALSE(r.ready);
            if (++hookCalls == 3) {
                return Error{ErrorCode::ProcessExited, "child died"};
            }
            return Result<void>();
        }));
    io.run();

    ASSERT_TRUE(done.has_value());
    ASSERT_FALSE(done->has_value());
    EXPECT_EQ(done->error().code, ErrorCode::ProcessExited);
    EXPECT_EQ(prober->calls.load(), 3u);
}

TEST(ReadinessPollerTest, SecondStartWhileActiveIsRejected) {
    boost::asio::io_context io;
    auto prober = std::make_shared<ScriptedProber>(2);
    ReadinessPoller poller(io.get_executor(), prober, fastConfig());

    int completions = 0;
    ASSERT_TRUE(poller.start("localhost", 8080, [&](Result<void>) { ++completions; }));
    auto second = poller.start("localhost", 8081, [&](Result<void>) { ++completions; });
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::OperationInProgress);
    io.run();
    EXPECT_EQ(completions, 1);
}
