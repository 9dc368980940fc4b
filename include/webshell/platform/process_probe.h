#pragma once

#include <memory>
#include <vector>

#include <webshell/core/types.h>

#include <sys/types.h>

namespace spdlog {
class logger;
}

namespace webshell::platform {

/**
 * @brief Host process control used for port eviction.
 *
 * Two primitives, kept behind an interface so allocation logic stays
 * platform-independent and can run against fakes in tests.
 */
class IProcessProbe {
public:
    virtual ~IProcessProbe() = default;

    /**
     * @brief Processes holding a listening TCP socket on @p port (IPv4 or IPv6).
     *
     * Processes the caller is not allowed to inspect are silently skipped, so an
     * empty list does not prove the port is free.
     */
    virtual Result<std::vector<pid_t>> ownersOfPort(Port port) = 0;

    /**
     * @brief Send SIGKILL to @p pid.
     *
     * Returns ErrorCode::NotFound when the process no longer exists and
     * ErrorCode::PermissionDenied when it belongs to someone else.
     */
    virtual Result<void> forceKill(pid_t pid) = 0;
};

// Probe for the platform this binary was built for (/proc on Linux, lsof elsewhere).
std::shared_ptr<IProcessProbe> makeSystemProcessProbe(std::shared_ptr<spdlog::logger> logger = {});

} // namespace webshell::platform
