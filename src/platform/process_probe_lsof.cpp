#include "process_probe_common.h"

#include <webshell/core/logging.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <string_view>
#include <string>

namespace webshell::platform {

namespace {

// macOS and the BSDs have no /proc/net; ask lsof for listening owners.
class LsofProcessProbe final : public IProcessProbe {
public:
    explicit LsofProcessProbe(std::shared_ptr<spdlog::logger> logger)
        : logger_(logging::orDefault(std::move(logger))) {}

    Result<std::vector<pid_t>> ownersOfPort(Port port) override {
        const std::string command =
            "lsof -nP -t -iTCP:" + std::to_string(port) + " -sTCP:LISTEN 2>/dev/null";
        FILE* pipe = ::popen(command.c_str(), "r");
        if (pipe == nullptr) {
            return Error{ErrorCode::InternalError, "Failed to run lsof"};
        }

        std::vector<pid_t> owners;
        std::array<char, 64> buf{};
        while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe) != nullptr) {
            std::string_view line(buf.data());
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.remove_suffix(1);
            }
            pid_t pid = 0;
            auto res = std::from_chars(line.data(), line.data() + line.size(), pid);
            if (res.ec == std::errc{} && pid > 0) {
                owners.push_back(pid);
            }
        }
        const int status = ::pclose(pipe);
        // lsof exits 1 when nothing matched
        if (status == -1) {
            return Error{ErrorCode::InternalError, "lsof did not terminate cleanly"};
        }

        std::sort(owners.begin(), owners.end());
        owners.erase(std::unique(owners.begin(), owners.end()), owners.end());
        logger_->debug("Port {} has {} listening owner(s)", port, owners.size());
        return owners;
    }

    Result<void> forceKill(pid_t pid) override { return detail::sendKill(pid); }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::shared_ptr<IProcessProbe> makeSystemProcessProbe(std::shared_ptr<spdlog::logger> logger) {
    return std::make_shared<LsofProcessProbe>(std::move(logger));
}

} // namespace webshell::platform
