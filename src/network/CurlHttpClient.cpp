#include "network/CurlHttpClient.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include <sstream>
#include <stdexcept>

namespace instflow {
namespace network {

std::string buildQueryString(const std::vector<std::pair<std::string, std::string>>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

CurlHttpClient::CurlHttpClient(std::shared_ptr<RateLimiter> rate_limiter)
    : curl_(nullptr)
    , rate_limiter_(rate_limiter ? rate_limiter : std::make_shared<RateLimiter>())
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    long timeout_seconds
) {
    const std::string group = hostOf(url);
    rate_limiter_->acquire(group);

    auto response = performRequest(url, headers, timeout_seconds);

    if (response.isRateLimited() || response.isBlocked()) {
        rate_limiter_->handleRateLimitError(response.status_code);
    }

    return response;
}

std::vector<std::string> CurlHttpClient::cookieNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    struct curl_slist* cookies = nullptr;
    if (curl_easy_getinfo(curl_, CURLINFO_COOKIELIST, &cookies) != CURLE_OK) {
        return names;
    }

    // Netscape format: domain, tailmatch, path, secure, expires, name, value
    for (auto* node = cookies; node != nullptr; node = node->next) {
        std::istringstream fields(node->data);
        std::string field;
        int index = 0;
        while (std::getline(fields, field, '\t')) {
            if (index == 5) {
                names.push_back(field);
                break;
            }
            ++index;
        }
    }
    curl_slist_free_all(cookies);
    return names;
}

std::string CurlHttpClient::hostOf(const std::string& url) {
    auto start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    auto end = url.find_first_of(":/?#", start);
    std::string host = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return host.empty() ? "default" : utils::toLowerCopy(host);
}

HttpResponse CurlHttpClient::performRequest(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    long timeout_seconds
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    // reset keeps the cookie store; the engine has to be re-enabled though
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_COOKIEFILE, "");
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);

    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // a new status line starts the headers of a redirected response
    if (utils::startsWith(header_line, "HTTP/")) {
        headers->clear();
        return total_size;
    }

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = utils::toLowerCopy(utils::trimCopy(header_line.substr(0, colon_pos)));
        std::string value = utils::trimCopy(header_line.substr(colon_pos + 1));
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace instflow
