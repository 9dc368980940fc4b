#include <webshell/core/fatal_handler.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <exception>

#include <execinfo.h>
#include <signal.h>
#include <unistd.h>

namespace webshell::fatal {

namespace {

std::atomic<pid_t> g_killTarget{0};

void writeStderr(const char* text) {
    ssize_t ignored = ::write(STDERR_FILENO, text, std::strlen(text));
    (void)ignored;
}

void signalHandler(int signo) {
    killTargetNow();
    writeStderr(signo == SIGSEGV   ? "FATAL: SIGSEGV\n"
                : signo == SIGABRT ? "FATAL: SIGABRT\n"
                                   : "FATAL: signal\n");
    void* frames[64];
    const int n = ::backtrace(frames, 64);
    ::backtrace_symbols_fd(frames, n, STDERR_FILENO);
    ::_exit(128 + signo);
}

} // namespace

void installHandlers() {
    // The first backtrace() call may allocate while loading the unwinder
    void* warmup[1];
    (void)::backtrace(warmup, 1);

    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    ::sigaction(SIGSEGV, &sa, nullptr);
    ::sigaction(SIGABRT, &sa, nullptr);

    std::set_terminate([]() noexcept {
        killTargetNow();
        try {
            spdlog::critical("FATAL: std::terminate called");
            spdlog::default_logger()->flush();
        } catch (const std::exception&) {
            writeStderr("FATAL: std::terminate called\n");
        }
        std::_Exit(1);
    });
}

void setKillTarget(pid_t target) {
    g_killTarget.store(target);
}

void killTargetNow() noexcept {
    const pid_t target = g_killTarget.exchange(0);
    if (target != 0) {
        ::kill(target, SIGKILL);
    }
}

} // namespace webshell::fatal
