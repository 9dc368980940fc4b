#pragma once

#include <webshell/platform/process_probe.h>

#include <cerrno>
#include <cstring>
#include <string>

#include <signal.h>

namespace webshell::platform::detail {

inline Result<void> sendKill(pid_t pid) {
    if (pid <= 0) {
        return Error{ErrorCode::InvalidArgument, "Refusing to signal PID " + std::to_string(pid)};
    }
    if (::kill(pid, SIGKILL) == 0) {
        return Result<void>();
    }
    const int err = errno;
    if (err == ESRCH) {
        return Error{ErrorCode::NotFound, "PID " + std::to_string(pid) + " no longer exists"};
    }
    if (err == EPERM) {
        return Error{ErrorCode::PermissionDenied,
                     "Not allowed to signal PID " + std::to_string(pid)};
    }
    return Error{ErrorCode::InternalError,
                 "kill(" + std::to_string(pid) + ") failed: " + std::strerror(err)};
}

} // namespace webshell::platform::detail
