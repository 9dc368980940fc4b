#pragma once

#include <webshell/core/types.h>
#include <webshell/platform/process_probe.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace webshell::supervisor {

/**
 * @brief Coarse classification of spawn errors for callers that only need
 * to tell "install the server" apart from everything else.
 */
enum class SpawnFailureKind { NotFound, Other };

SpawnFailureKind spawnFailureKind(const Error& error);

struct ProcessHandle {
    pid_t pid{-1};
    // Equal to pid when the child leads its own group, 0 otherwise
    pid_t processGroup{0};
    TimePoint startedAt{};
};

/**
 * @brief Description of the child process to launch.
 *
 * Example:
 * @code
 * SpawnRequest req{.executable = "open-webui", .args = {"serve"}};
 * req.withArg("--port").withArg("8080").withEnv("WEBUI_AUTH", "False");
 * @endcode
 */
struct SpawnRequest {
    std::string executable;                   ///< Name resolved through PATH, or a path
    std::vector<std::string> args;            ///< Arguments after argv[0]
    std::map<std::string, std::string> env;   ///< Overlaid on the current environment
    std::optional<std::filesystem::path> workdir;
    bool newProcessGroup{true};
    bool dieWithParent{true};
    bool quietOutput{false}; ///< Send child stdout/stderr to /dev/null
    /// Double-fork into a new session and do not track the child. Nothing the
    /// owner does later (terminate, pollExit, destruction) touches it.
    bool detached{false};

    auto& withEnv(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& withArg(std::string arg) {
        args.push_back(std::move(arg));
        return *this;
    }

    auto& inDirectory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief Owns at most one child process at a time.
 */
class IProcessOwner {
public:
    virtual ~IProcessOwner() = default;

    /**
     * @brief Launch the child described by @p request.
     *
     * Returns after fork and exec both succeeded. Fails with InvalidState while
     * a previous child is still tracked, ExecutableNotFound when exec reports
     * ENOENT/ENOTDIR, and SpawnFailed otherwise. A detached spawn is allowed
     * at any time and leaves the tracked child alone.
     */
    virtual Result<ProcessHandle> spawn(const SpawnRequest& request) = 0;

    /**
     * @brief Force-kill and reap the tracked child.
     *
     * A child that already exited is not an error. The handle is cleared in
     * every case, so repeated calls are no-ops.
     */
    virtual Result<void> terminate() = 0;

    virtual std::optional<ProcessHandle> handle() const = 0;

    /**
     * @brief Non-blocking reap. Returns the exit code (128+signal for signalled
     * children) if the child has exited, and stops tracking it.
     */
    virtual std::optional<int> pollExit() = 0;
};

class ProcessOwner final : public IProcessOwner {
public:
    explicit ProcessOwner(std::shared_ptr<spdlog::logger> logger = {},
                          std::chrono::milliseconds reapTimeout = std::chrono::seconds(2));
    ~ProcessOwner() override;

    ProcessOwner(const ProcessOwner&) = delete;
    ProcessOwner& operator=(const ProcessOwner&) = delete;

    Result<ProcessHandle> spawn(const SpawnRequest& request) override;
    Result<void> terminate() override;
    std::optional<ProcessHandle> handle() const override;
    std::optional<int> pollExit() override;

private:
    Result<void> terminateLocked();
    bool reapLocked(pid_t pid, std::chrono::milliseconds timeout);

    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::milliseconds reapTimeout_;
    mutable std::mutex mutex_;
    std::optional<ProcessHandle> handle_;
};

} // namespace webshell::supervisor
