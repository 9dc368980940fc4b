#pragma once

#include <webshell/core/types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace spdlog {
class logger;
}

namespace webshell::supervisor {

// Outcome of a single readiness probe
struct ReadinessResult {
    bool ready{false};
    std::optional<long> httpStatus;
    std::string detail;
};

// Polled during a request; returning true aborts it
using ShouldCancel = std::function<bool()>;

class IHttpProber {
public:
    virtual ~IHttpProber() = default;

    /**
     * @brief Issue one GET to @p url.
     *
     * Never throws and never reports failure through an Error: connection
     * refused, timeouts and non-200 statuses all come back as ready=false.
     */
    virtual ReadinessResult probe(const std::string& url, std::chrono::milliseconds timeout,
                                  const ShouldCancel& shouldCancel) = 0;
};

/**
 * @brief libcurl-backed prober. Ready means HTTP status 200 exactly.
 *
 * Proxies are bypassed and redirects are followed, so a server that redirects
 * "/" to a login page is ready once the target answers 200.
 */
class CurlHttpProber final : public IHttpProber {
public:
    explicit CurlHttpProber(std::shared_ptr<spdlog::logger> logger = {});

    ReadinessResult probe(const std::string& url, std::chrono::milliseconds timeout,
                          const ShouldCancel& shouldCancel) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

std::string makeUrl(const std::string& host, Port port);

} // namespace webshell::supervisor
