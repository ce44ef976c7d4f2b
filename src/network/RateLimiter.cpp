#include "network/RateLimiter.h"
#include "common/Logger.h"

namespace instflow {
namespace network {

RateLimiter::RateLimiter()
    : rate_limited_cooldown_(std::chrono::seconds(2))
    , blocked_cooldown_(std::chrono::seconds(5))
    , is_blocked_(false)
{
    configs_.emplace("default", RateLimitConfig("default", std::chrono::milliseconds(0)));
}

void RateLimiter::setMinInterval(const std::string& group, std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = configs_.find(group);
    if (it == configs_.end()) {
        configs_.emplace(group, RateLimitConfig(group, interval));
    } else {
        it->second.min_interval = interval;
    }
}

void RateLimiter::setCooldowns(std::chrono::milliseconds rate_limited, std::chrono::milliseconds blocked) {
    std::unique_lock<std::mutex> lock(mutex_);
    rate_limited_cooldown_ = rate_limited;
    blocked_cooldown_ = blocked;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            auto status = cv_.wait_until(lock, block_end_time_);
            if (status == std::cv_status::timeout) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        auto now = std::chrono::steady_clock::now();
        auto wake_time = readyAt(config);
        if (now >= wake_time) {
            config.last_request = now;
            config.used = true;
            return;
        }

        cv_.wait_until(lock, wake_time);
    }
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::unique_lock<std::mutex> lock(mutex_);

    std::chrono::milliseconds cooldown(0);
    if (status_code == 429) {
        LOG_WARN("429 Too Many Requests, pausing all requests for {} ms", rate_limited_cooldown_.count());
        cooldown = rate_limited_cooldown_;
    } else if (status_code == 403) {
        LOG_WARN("403 Forbidden, pausing all requests for {} ms", blocked_cooldown_.count());
        cooldown = blocked_cooldown_;
    } else {
        return;
    }

    is_blocked_ = true;
    block_end_time_ = std::chrono::steady_clock::now() + cooldown;
    cv_.notify_all();
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

std::chrono::steady_clock::time_point RateLimiter::readyAt(const RateLimitConfig& config) const {
    if (!config.used) {
        return std::chrono::steady_clock::time_point::min();
    }
    return config.last_request + config.min_interval;
}

} // namespace network
} // namespace instflow
