#pragma once

#include "network/IHttpClient.h"

#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace instflow {
namespace testing {

// Scripted IHttpClient. Each rule matches a URL substring and replays its
// steps in order; the last step repeats once the script runs out.
class FakeHttpClient : public network::IHttpClient {
public:
    struct Call {
        std::string url;
        std::map<std::string, std::string> headers;
        long timeout_seconds;
    };

    void respond(const std::string& url_part, int status, const std::string& body,
                 const std::string& content_type = "") {
        Step step;
        step.response.status_code = status;
        step.response.body = body;
        if (!content_type.empty()) {
            step.response.headers["content-type"] = content_type;
        }
        ruleFor(url_part).push_back(step);
    }

    void fail(const std::string& url_part, const std::string& error) {
        Step step;
        step.error = error;
        ruleFor(url_part).push_back(step);
    }

    network::HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {},
        long timeout_seconds = 30
    ) override {
        calls.push_back({url, headers, timeout_seconds});
        for (auto& rule : rules_) {
            if (url.find(rule.first) == std::string::npos || rule.second.empty()) continue;
            Step step = rule.second.front();
            if (rule.second.size() > 1) rule.second.pop_front();
            if (!step.error.empty()) {
                throw std::runtime_error(step.error);
            }
            return step.response;
        }
        network::HttpResponse not_found;
        not_found.status_code = 404;
        return not_found;
    }

    std::vector<std::string> cookieNames() const override { return cookies; }

    size_t callsMatching(const std::string& url_part) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.url.find(url_part) != std::string::npos) ++n;
        }
        return n;
    }

    std::vector<Call> calls;
    std::vector<std::string> cookies;

private:
    struct Step {
        network::HttpResponse response;
        std::string error;
    };
    std::vector<std::pair<std::string, std::deque<Step>>> rules_;

    std::deque<Step>& ruleFor(const std::string& url_part) {
        for (auto& rule : rules_) {
            if (rule.first == url_part) return rule.second;
        }
        rules_.emplace_back(url_part, std::deque<Step>{});
        return rules_.back().second;
    }
};

} // namespace testing
} // namespace instflow
