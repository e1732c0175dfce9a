#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace riskguard {
namespace execution {

RateLimiter::RateLimiter()
    : total_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    // Bybit V5 기본 한도보다 보수적으로 설정 (UID 기준)
    configs_.emplace("order", RateLimitConfig("order", 10));        // create / cancel-all
    configs_.emplace("position", RateLimitConfig("position", 10));  // position/list
    configs_.emplace("account", RateLimitConfig("account", 10));    // wallet-balance
    configs_.emplace("market", RateLimitConfig("market", 20));      // instruments-info (공개)
    configs_.emplace("default", RateLimitConfig("default", 10));
}

std::string RateLimiter::groupFor(const std::string& endpoint) {
    if (endpoint.find("/v5/order/") != std::string::npos) return "order";
    if (endpoint.find("/v5/position/") != std::string::npos) return "position";
    if (endpoint.find("/v5/account/") != std::string::npos) return "account";
    if (endpoint.find("/v5/market/") != std::string::npos) return "market";
    return "default";
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            if (cv_.wait_until(lock, block_end_time_) == std::cv_status::timeout) {
                is_blocked_ = false;
            }
            continue;
        }

        resetWindowIfNeeded(config);
        if (config.current_count < config.max_per_second) {
            config.current_count++;
            total_requests_++;
            return;
        }

        // 다음 윈도우 시작까지 대기
        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);
        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

void RateLimiter::updateFromHeader(const std::string& group, const std::string& limit_status_header) {
    int remaining = -1;
    try {
        remaining = std::stoi(limit_status_header);
    } catch (const std::exception&) {
        return;
    }
    if (remaining < 0) {
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);
    resetWindowIfNeeded(config);
    // 서버 잔여량이 로컬 추정보다 적으면 보수적으로 맞춘다
    if (remaining < config.max_per_second - config.current_count) {
        config.current_count = config.max_per_second - remaining;
    }
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::unique_lock<std::mutex> lock(mutex_);

    std::chrono::seconds pause(0);
    if (status_code == 429) {
        pause = std::chrono::seconds(1);
        LOG_WARN("429 Too Many Requests: pausing all requests for 1s");
    } else if (status_code == 403) {
        pause = std::chrono::seconds(10);
        LOG_ERROR("403 from exchange (IP rate limit): pausing all requests for 10s");
    } else {
        return;
    }

    forced_waits_++;
    is_blocked_ = true;
    block_end_time_ = std::max(block_end_time_, std::chrono::steady_clock::now() + pause);
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    if (now - config.window_start >= std::chrono::seconds(1)) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace riskguard
