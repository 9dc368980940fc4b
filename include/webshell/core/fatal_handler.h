#pragma once

#include <sys/types.h>

namespace webshell::fatal {

/**
 * @brief Install SIGSEGV/SIGABRT handlers and a std::terminate handler.
 *
 * On a fatal signal the registered kill target is sent SIGKILL first, then a
 * one-line reason and a raw backtrace go to stderr and the process exits with
 * 128+signal. The signal path only uses async-signal-safe calls.
 */
void installHandlers();

// Negative values address a process group. 0 clears the target.
void setKillTarget(pid_t target);

// SIGKILL the registered target, at most once.
void killTargetNow() noexcept;

} // namespace webshell::fatal
