#pragma once

#include "network/IHttpClient.h"
#include "network/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace instflow {
namespace network {

// libcurl session with an in-memory cookie jar. Requests are serialized on
// one easy handle so cookies set during warm-up are sent with later calls.
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(std::shared_ptr<RateLimiter> rate_limiter = nullptr);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {},
        long timeout_seconds = 30
    ) override;

    std::vector<std::string> cookieNames() const override;

    std::shared_ptr<RateLimiter> rateLimiter() const { return rate_limiter_; }

    // Rate limit group of a request: the URL host
    static std::string hostOf(const std::string& url);

private:
    CURL* curl_;
    mutable std::mutex mutex_;
    std::shared_ptr<RateLimiter> rate_limiter_;

    HttpResponse performRequest(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        long timeout_seconds
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace instflow
