#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <webshell/core/types.h>
#include <webshell/platform/process_probe.h>

namespace spdlog {
class logger;
}

namespace webshell::supervisor {

inline constexpr Port kDefaultPreferredPort = 8080;
inline constexpr Port kMinCandidatePort = 1024;
inline constexpr Port kMaxCandidatePort = 65535;

// Returns true when something accepts TCP connections on the port.
using PortInUseCheck = std::function<bool(Port)>;

/**
 * @brief True if a TCP connect to @p host:@p port succeeds.
 *
 * Every resolved address is tried; resolution failure counts as "not in use".
 */
bool isPortInUse(Port port, const std::string& host = "localhost");

struct PortAllocatorConfig {
    Port rangeMin = kMinCandidatePort;
    Port rangeMax = kMaxCandidatePort;
    // Kill whatever holds the preferred port before falling back to random search
    bool evictBusyPort = true;
    // How long to wait for a killed owner to release the port
    std::chrono::milliseconds evictionSettle{1000};
    std::chrono::milliseconds settleStep{50};
    // Unbounded when unset; the range size is a natural ceiling
    std::optional<std::size_t> maxRandomAttempts;
    std::optional<std::uint64_t> seed;
    std::string host = "localhost";
    std::shared_ptr<spdlog::logger> logger;
};

/**
 * @brief Chooses the TCP port the managed server will listen on.
 *
 * The preferred port wins when it is free or can be freed by evicting its
 * owner. Otherwise a uniformly random port inside the configured range is
 * chosen among those found free.
 *
 * The check is advisory: a port reported free can be taken by someone else
 * before the server binds it.
 */
class PortAllocator {
public:
    PortAllocator(PortAllocatorConfig config, std::shared_ptr<platform::IProcessProbe> probe,
                  PortInUseCheck inUse = {});

    Result<Port> allocate(Port preferred = kDefaultPreferredPort);

    const PortAllocatorConfig& config() const { return config_; }

private:
    bool inUse(Port port) const;
    void evictOwners(Port port);
    bool waitUntilFree(Port port) const;
    Result<Port> randomSearch(Port excluded);

    PortAllocatorConfig config_;
    std::shared_ptr<platform::IProcessProbe> probe_;
    PortInUseCheck inUse_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace webshell::supervisor
