#include <webshell/core/logging.h>
#include <webshell/supervisor/process_owner.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

extern char** environ;

namespace webshell::supervisor {

SpawnFailureKind spawnFailureKind(const Error& error) {
    return error.code == ErrorCode::ExecutableNotFound ? SpawnFailureKind::NotFound
                                                       : SpawnFailureKind::Other;
}

namespace {

// Written by the child to the error pipe. For kStageDetached, err carries the
// pid of the detached grandchild instead of an errno.
struct ChildFailure {
    int stage;
    int err;
};

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;
constexpr int kStageFork = 3;
constexpr int kStageDetached = 4;

// Both ends close-on-exec from the start, so no concurrent fork+exec elsewhere
// in the process can keep the write end open.
int openErrorPipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) < 0) {
        return -1;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::vector<std::string> out;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        std::string key(entry.substr(0, eq));
        if (overlay.find(key) == overlay.end()) {
            out.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : overlay) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> toPointers(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

[[noreturn]] void failChild(int fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}

void waitBlocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

ProcessOwner::ProcessOwner(std::shared_ptr<spdlog::logger> logger,
                           std::chrono::milliseconds reapTimeout)
    : logger_(logging::orDefault(std::move(logger))), reapTimeout_(reapTimeout) {}

ProcessOwner::~ProcessOwner() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        auto r = terminateLocked();
        if (!r) {
            logger_->warn("Failed to terminate child on destruction: {}", r.error().message);
        }
    }
}

Result<ProcessHandle> ProcessOwner::spawn(const SpawnRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ && !request.detached) {
        return Error{ErrorCode::InvalidState,
                     "A child process is already running (pid=" + std::to_string(handle_->pid) +
                         ")"};
    }
    if (request.executable.empty()) {
        return Error{ErrorCode::ExecutableNotFound, "No executable given"};
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> argvStrings;
    argvStrings.push_back(request.executable);
    argvStrings.insert(argvStrings.end(), request.args.begin(), request.args.end());
    auto argv = toPointers(argvStrings);

    auto envStrings = buildEnvironment(request.env);
    auto envp = toPointers(envStrings);

    const std::string workdir = request.workdir ? request.workdir->string() : std::string{};
    const pid_t parentPid = ::getpid();

    int errPipe[2];
    if (openErrorPipe(errPipe) < 0) {
        return Error{ErrorCode::SpawnFailed,
                     std::string("Failed to create pipe: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return Error{ErrorCode::SpawnFailed, std::string("fork() failed: ") + std::strerror(err)};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::close(errPipe[0]);
        if (request.detached) {
            const pid_t grandchild = ::fork();
            if (grandchild < 0) {
                failChild(errPipe[1], kStageFork);
            }
            if (grandchild > 0) {
                ChildFailure forked{kStageDetached, static_cast<int>(grandchild)};
                ssize_t ignored = ::write(errPipe[1], &forked, sizeof(forked));
                (void)ignored;
                ::_exit(0);
            }
            // Reparented to init once the intermediate child exits
            ::setsid();
        } else if (request.newProcessGroup) {
            ::setpgid(0, 0);
        }
#ifdef __linux__
        if (request.dieWithParent && !request.detached) {
            ::prctl(PR_SET_PDEATHSIG, SIGKILL);
            if (::getppid() != parentPid) {
                ::_exit(127);
            }
        }
#else
        (void)parentPid;
#endif
        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0) {
            failChild(errPipe[1], kStageChdir);
        }
        if (request.quietOutput) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) {
                    ::close(devnull);
                }
            }
        }
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        environ = envp.data();
        ::execvp(argv[0], argv.data());
        failChild(errPipe[1], kStageExec);
    }

    // Parent
    ::close(errPipe[1]);
    if (request.newProcessGroup && !request.detached) {
        // Also set from the parent so the group exists before we might signal it
        ::setpgid(pid, pid);
    }

    // EOF once every write end is gone: exec succeeded or the writer exited
    std::optional<ChildFailure> failure;
    pid_t detachedPid = -1;
    while (true) {
        ChildFailure record{};
        const ssize_t n = ::read(errPipe[0], &record, sizeof(record));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n != static_cast<ssize_t>(sizeof(record))) {
            break;
        }
        if (record.stage == kStageDetached) {
            detachedPid = static_cast<pid_t>(record.err);
        } else {
            failure = record;
        }
    }
    ::close(errPipe[0]);

    if (request.detached || failure) {
        // The intermediate child of a detached spawn exits right after forking
        waitBlocking(pid);
    }

    if (failure) {
        const std::string reason = std::strerror(failure->err);
        if (failure->stage == kStageFork) {
            return Error{ErrorCode::SpawnFailed, "fork() of detached child failed: " + reason};
        }
        if (failure->stage == kStageChdir) {
            return Error{ErrorCode::SpawnFailed,
                         "Cannot enter working directory '" + workdir + "': " + reason};
        }
        if (failure->err == ENOENT || failure->err == ENOTDIR) {
            return Error{ErrorCode::ExecutableNotFound,
                         "Executable '" + request.executable + "' not found: " + reason};
        }
        return Error{ErrorCode::SpawnFailed,
                     "Failed to execute '" + request.executable + "': " + reason};
    }

    ProcessHandle h;
    h.startedAt = std::chrono::steady_clock::now();
    if (request.detached) {
        if (detachedPid <= 0) {
            return Error{ErrorCode::SpawnFailed,
                         "Detached child of '" + request.executable + "' reported no pid"};
        }
        h.pid = detachedPid;
        h.processGroup = detachedPid;
        logger_->info("Launched '{}' detached (pid={})", request.executable, detachedPid);
        return h;
    }

    h.pid = pid;
    h.processGroup = request.newProcessGroup ? pid : 0;
    handle_ = h;

    logger_->info("Spawned '{}' (pid={})", request.executable, pid);
    return h;
}

Result<void> ProcessOwner::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminateLocked();
}

Result<void> ProcessOwner::terminateLocked() {
    if (!handle_) {
        return Result<void>();
    }
    const ProcessHandle h = *handle_;
    handle_.reset();

    int status = 0;
    pid_t reaped = ::waitpid(h.pid, &status, WNOHANG);
    if (reaped == h.pid || (reaped < 0 && errno == ECHILD)) {
        logger_->warn("Child pid={} had already exited", h.pid);
        if (h.processGroup > 0) {
            // Workers left in the group still hold the port
            ::kill(-h.processGroup, SIGKILL);
        }
        return Result<void>();
    }

    int rc = h.processGroup > 0 ? ::kill(-h.processGroup, SIGKILL) : ::kill(h.pid, SIGKILL);
    if (rc != 0 && errno == ESRCH && h.processGroup > 0) {
        rc = ::kill(h.pid, SIGKILL);
    }
    if (rc != 0) {
        const int err = errno;
        if (err == ESRCH) {
            logger_->warn("Child pid={} had already exited", h.pid);
            reapLocked(h.pid, reapTimeout_);
            return Result<void>();
        }
        return Error{ErrorCode::InternalError, "Failed to kill pid " + std::to_string(h.pid) +
                                                   ": " + std::strerror(err)};
    }

    if (!reapLocked(h.pid, reapTimeout_)) {
        logger_->warn("Child pid={} not reaped within {}ms", h.pid, reapTimeout_.count());
        return Error{ErrorCode::Timeout,
                     "Child pid " + std::to_string(h.pid) + " did not exit after SIGKILL"};
    }
    logger_->info("Terminated child pid={}", h.pid);
    return Result<void>();
}

bool ProcessOwner::reapLocked(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            logger_->debug("Reaped pid={} exit={}", pid, exitCodeFromStatus(status));
            return true;
        }
        if (r < 0 && errno != EINTR) {
            // ECHILD: reaped elsewhere
            return errno == ECHILD;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<ProcessHandle> ProcessOwner::handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_;
}

std::optional<int> ProcessOwner::pollExit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return std::nullopt;
    }
    int status = 0;
    pid_t r = ::waitpid(handle_->pid, &status, WNOHANG);
    const int waitErr = errno;
    if (r == 0 || (r < 0 && waitErr == EINTR)) {
        return std::nullopt;
    }
    const pid_t pid = handle_->pid;
    const pid_t group = handle_->processGroup;
    handle_.reset();
    if (group > 0) {
        ::kill(-group, SIGKILL);
    }
    if (r < 0) {
        logger_->warn("Lost track of child pid={}: {}", pid, std::strerror(waitErr));
        return -1;
    }
    const int code = exitCodeFromStatus(status);
    logger_->info("Child pid={} exited with code {}", pid, code);
    return code;
}

} // namespace webshell::supervisor
