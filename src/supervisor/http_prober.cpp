#include <webshell/core/logging.h>
#include <webshell/supervisor/http_prober.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace webshell::supervisor {

namespace {

std::once_flag g_curlInitOnce;

size_t discardBody(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

int cancelProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* shouldCancel = static_cast<const ShouldCancel*>(clientp);
    if (shouldCancel && *shouldCancel && (*shouldCancel)()) {
        return 1; // abort transfer
    }
    return 0;
}

} // namespace

std::string makeUrl(const std::string& host, Port port) {
    // Bare IPv6 literals need brackets
    if (!host.empty() && host.find(':') != std::string::npos && host.front() != '[') {
        return "http://[" + host + "]:" + std::to_string(port);
    }
    return "http://" + host + ":" + std::to_string(port);
}

CurlHttpProber::CurlHttpProber(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::orDefault(std::move(logger))) {
    std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

ReadinessResult CurlHttpProber::probe(const std::string& url, std::chrono::milliseconds timeout,
                                      const ShouldCancel& shouldCancel) {
    ReadinessResult result;
    if (shouldCancel && shouldCancel()) {
        result.detail = "cancelled";
        return result;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.detail = "curl_easy_init failed";
        return result;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "webshell/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, cancelProgress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<ShouldCancel*>(&shouldCancel));

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_easy_cleanup(curl);

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        result.detail = "cancelled";
        return result;
    }
    if (rc != CURLE_OK) {
        result.detail = curl_easy_strerror(rc);
        logger_->trace("Probe {} failed: {}", url, result.detail);
        return result;
    }

    result.httpStatus = status;
    result.ready = (status == 200);
    result.detail = "HTTP " + std::to_string(status);
    return result;
}

} // namespace webshell::supervisor
