#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace instflow {
namespace network {

// Minimum spacing between two requests of the same group
struct RateLimitConfig {
    std::string group_name;
    std::chrono::milliseconds min_interval;
    std::chrono::steady_clock::time_point last_request;
    bool used;

    RateLimitConfig(const std::string& name, std::chrono::milliseconds interval)
        : group_name(name)
        , min_interval(interval)
        , last_request(std::chrono::steady_clock::now())
        , used(false)
    {}
};

// Politeness throttle shared by every request that goes through one client
class RateLimiter {
public:
    RateLimiter();

    void setMinInterval(const std::string& group, std::chrono::milliseconds interval);

    // Cool-down applied to every group after 429 / 403
    void setCooldowns(std::chrono::milliseconds rate_limited, std::chrono::milliseconds blocked);

    // Blocks until the group may send again
    void acquire(const std::string& group);

    void handleRateLimitError(int status_code);

private:
    std::map<std::string, RateLimitConfig> configs_;
    std::mutex mutex_;
    std::condition_variable cv_;

    std::chrono::milliseconds rate_limited_cooldown_;
    std::chrono::milliseconds blocked_cooldown_;
    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    RateLimitConfig& configFor(const std::string& group);
    std::chrono::steady_clock::time_point readyAt(const RateLimitConfig& config) const;
};

} // namespace network
} // namespace instflow
