#include <gtest/gtest.h>

#include "../../common/test_helpers.h"
#include <webshell/supervisor/port_allocator.h>

#include <map>
#include <set>

#include <unistd.h>

using namespace webshell;
using namespace webshell::supervisor;

namespace {

// Port table shared between the fake probe and the in-use check
struct FakeHost {
    std::set<Port> busy;
    std::map<Port, pid_t> owners;
    bool killFrees = true;
    std::vector<pid_t> killed;
    std::size_t checks = 0;
};

class FakeProcessProbe : public platform::IProcessProbe {
public:
    explicit FakeProcessProbe(FakeHost& host) : host_(host) {}

    Result<std::vector<pid_t>> ownersOfPort(Port port) override {
        std::vector<pid_t> out;
        if (auto it = host_.owners.find(port); it != host_.owners.end()) {
            out.push_back(it->second);
        }
        return out;
    }

    Result<void> forceKill(pid_t pid) override {
        host_.killed.push_back(pid);
        if (!host_.killFrees) {
            return Error{ErrorCode::PermissionDenied, "not yours"};
        }
        for (auto it = host_.owners.begin(); it != host_.owners.end();) {
            if (it->second == pid) {
                host_.busy.erase(it->first);
                it = host_.owners.erase(it);
            } else {
                ++it;
            }
        }
        return Result<void>();
    }

private:
    FakeHost& host_;
};

PortAllocatorConfig fastConfig() {
    PortAllocatorConfig cfg;
    cfg.evictionSettle = std::chrono::milliseconds(20);
    cfg.settleStep = std::chrono::milliseconds(5);
    cfg.seed = 42;
    return cfg;
}

PortAllocator makeAllocator(FakeHost& host, PortAllocatorConfig cfg = fastConfig()) {
    return PortAllocator(std::move(cfg), std::make_shared<FakeProcessProbe>(host),
                         [&host](Port p) {
                             ++host.checks;
                             return host.busy.count(p) > 0;
                         });
}

} // namespace

TEST(PortAllocatorTest, ReturnsPreferredPortWhenFree) {
    FakeHost host;
    auto allocator = makeAllocator(host);
    auto port = allocator.allocate(8080);
    ASSERT_TRUE(port);
    EXPECT_EQ(port.value(), 8080);
    EXPECT_TRUE(host.killed.empty());
}

TEST(PortAllocatorTest, EvictsOwnerAndReusesPreferredPort) {
    FakeHost host;
    host.busy.insert(8080);
    host.owners[8080] = 4242;
    auto allocator = makeAllocator(host);

    auto port = allocator.allocate(8080);
    ASSERT_TRUE(port);
    EXPECT_EQ(port.value(), 8080);
    ASSERT_EQ(host.killed.size(), 1u);
    EXPECT_EQ(host.killed.front(), 4242);
}

TEST(PortAllocatorTest, FallsBackToRandomFreePortWhenEvictionFails) {
    FakeHost host;
    host.busy.insert(8080);
    host.owners[8080] = 4242;
    host.killFrees = false;
    auto allocator = makeAllocator(host);

    auto port = allocator.allocate(8080);
    ASSERT_TRUE(port);
    EXPECT_NE(port.value(), 8080);
    EXPECT_EQ(host.busy.count(port.value()), 0u);
    EXPECT_GE(port.value(), kMinCandidatePort);
}

TEST(PortAllocatorTest, NeverEvictsWhenDisabled) {
    FakeHost host;
    host.busy.insert(8080);
    host.owners[8080] = 4242;
    auto cfg = fastConfig();
    cfg.evictBusyPort = false;
    auto allocator = makeAllocator(host, cfg);

    auto port = allocator.allocate(8080);
    ASSERT_TRUE(port);
    EXPECT_NE(port.value(), 8080);
    EXPECT_TRUE(host.killed.empty());
}

TEST(PortAllocatorTest, NeverKillsItself) {
    FakeHost host;
    host.busy.insert(8080);
    host.owners[8080] = ::getpid();
    auto allocator = makeAllocator(host);

    auto port = allocator.allocate(8080);
    ASSERT_TRUE(port);
    EXPECT_NE(port.value(), 8080);
    EXPECT_TRUE(host.killed.empty());
}

TEST(PortAllocatorTest, RandomPortsStayInsideRange) {
    FakeHost host;
    host.busy.insert(8080);
    host.killFrees = false;
    auto cfg = fastConfig();
    cfg.evictBusyPort = false;
    for (std::uint64_t seed = 1; seed <= 50; ++seed) {
        cfg.seed = seed;
        auto allocator = makeAllocator(host, cfg);
        auto port = allocator.allocate(8080);
        ASSERT_TRUE(port);
        EXPECT_GE(port.value(), 1024);
        EXPECT_LE(port.value(), 65535);
    }
}

TEST(PortAllocatorTest, ExhaustedSearchReportsPortUnavailable) {
    FakeHost host;
    auto cfg = fastConfig();
    cfg.rangeMin = 2000;
    cfg.rangeMax = 2003;
    cfg.maxRandomAttempts = 25;
    cfg.evictBusyPort = false;
    for (Port p = 2000; p <= 2003; ++p) {
        host.busy.insert(p);
    }
    auto allocator = makeAllocator(host, cfg);

    auto port = allocator.allocate(2000);
    ASSERT_FALSE(port);
    EXPECT_EQ(port.error().code, ErrorCode::PortUnavailable);
    // one check for the preferred port plus at most the capped attempts
    EXPECT_LE(host.checks, 26u);
}

TEST(PortAllocatorTest, PreferredPortOutsideRangeIsRejected) {
    FakeHost host;
    auto allocator = makeAllocator(host);
    auto port = allocator.allocate(80);
    ASSERT_FALSE(port);
    EXPECT_EQ(port.error().code, ErrorCode::InvalidArgument);
}

TEST(PortAllocatorTest, DetectsRealListenerOnLoopback) {
    webshell::test::LoopbackListener listener;
    EXPECT_TRUE(isPortInUse(listener.port(), "127.0.0.1"));
}

TEST(PortAllocatorTest, ClosedPortIsNotInUse) {
    Port freed = 0;
    {
        webshell::test::LoopbackListener listener;
        freed = listener.port();
    }
    EXPECT_FALSE(isPortInUse(freed, "127.0.0.1"));
}
