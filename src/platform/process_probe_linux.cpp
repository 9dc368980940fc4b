#include "process_probe_common.h"

#include <webshell/core/logging.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace webshell::platform {

namespace {

constexpr std::string_view kTcpListenState = "0A";

// Parses "<hex address>:<hex port>" and returns the port.
std::optional<Port> parseLocalPort(std::string_view localAddress) {
    auto colon = localAddress.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto hex = localAddress.substr(colon + 1);
    unsigned value = 0;
    auto res = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (res.ec != std::errc{} || value > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<Port>(value);
}

// Collects socket inodes listening on the port from /proc/net/tcp or tcp6.
void collectListeningInodes(const std::filesystem::path& table, Port port,
                            std::set<std::string>& inodes) {
    std::ifstream in(table);
    if (!in) {
        return;
    }
    std::string line;
    std::getline(in, line); // header
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string slot, local, remote, state, queues, timer, retransmits, uid, timeout, inode;
        if (!(fields >> slot >> local >> remote >> state >> queues >> timer >> retransmits >>
              uid >> timeout >> inode)) {
            continue;
        }
        if (state != kTcpListenState || inode == "0") {
            continue;
        }
        if (auto p = parseLocalPort(local); p && *p == port) {
            inodes.insert(inode);
        }
    }
}

class LinuxProcessProbe final : public IProcessProbe {
public:
    explicit LinuxProcessProbe(std::shared_ptr<spdlog::logger> logger)
        : logger_(logging::orDefault(std::move(logger))) {}

    Result<std::vector<pid_t>> ownersOfPort(Port port) override {
        std::set<std::string> inodes;
        collectListeningInodes("/proc/net/tcp", port, inodes);
        collectListeningInodes("/proc/net/tcp6", port, inodes);
        if (inodes.empty()) {
            return std::vector<pid_t>{};
        }

        std::set<std::string> targets;
        for (const auto& inode : inodes) {
            targets.insert("socket:[" + inode + "]");
        }

        namespace fs = std::filesystem;
        std::error_code ec;
        fs::directory_iterator procIt("/proc", ec);
        if (ec) {
            return Error{ErrorCode::InternalError, "Cannot list /proc: " + ec.message()};
        }

        std::vector<pid_t> owners;
        for (const auto& entry : procIt) {
            const auto name = entry.path().filename().string();
            pid_t pid = 0;
            auto res = std::from_chars(name.data(), name.data() + name.size(), pid);
            if (res.ec != std::errc{} || res.ptr != name.data() + name.size()) {
                continue;
            }

            std::error_code fdEc;
            fs::directory_iterator fdIt(entry.path() / "fd", fdEc);
            if (fdEc) {
                // Other users' processes are not inspectable without privileges
                logger_->trace("Skipping PID {}: {}", pid, fdEc.message());
                continue;
            }
            for (const auto& fd : fdIt) {
                std::error_code linkEc;
                auto target = fs::read_symlink(fd.path(), linkEc);
                if (!linkEc && targets.count(target.string()) > 0) {
                    owners.push_back(pid);
                    break;
                }
            }
        }

        std::sort(owners.begin(), owners.end());
        logger_->debug("Port {} has {} listening owner(s)", port, owners.size());
        return owners;
    }

    Result<void> forceKill(pid_t pid) override { return detail::sendKill(pid); }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::shared_ptr<IProcessProbe> makeSystemProcessProbe(std::shared_ptr<spdlog::logger> logger) {
    return std::make_shared<LinuxProcessProbe>(std::move(logger));
}

} // namespace webshell::platform
