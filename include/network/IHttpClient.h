#pragma once

#include <string>
#include <map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace instflow {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;     // keys lower-cased

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 403; }

    std::string contentType() const {
        auto it = headers.find("content-type");
        return it == headers.end() ? "" : it->second;
    }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET request. Throws std::runtime_error on transport failure
    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {},
        long timeout_seconds = 30
    ) = 0;

    // Names of the cookies currently held by the session
    virtual std::vector<std::string> cookieNames() const { return {}; }
};

// "k1=v1&k2=v2" in the given order; values are sent as-is
std::string buildQueryString(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace network
} // namespace instflow
