#pragma once

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include "common/GuardConfig.h"
#include "common/Logger.h"
#include "core/model/Errors.h"

namespace riskguard {
namespace core {
namespace execution {

// TransientGatewayError 만 재시도한다 (최대 max_retries 회, 지수 백오프).
// PrecisionError / GatewayError 는 즉시 호출자에게 전달.
template<typename Fn>
auto callWithRetry(const BackoffConfig& backoff, const std::string& what, Fn&& fn) -> decltype(fn()) {
    int delay_ms = std::max(0, backoff.initial_ms);
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransientGatewayError& e) {
            if (attempt > backoff.max_retries) {
                LOG_ERROR("{} failed after {} attempts: {}", what, attempt, e.what());
                throw;
            }
            LOG_WARN("{} transient failure (attempt {}/{}), retry in {} ms: {}",
                     what, attempt, backoff.max_retries + 1, delay_ms, e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            const double next = static_cast<double>(delay_ms) * backoff.multiplier;
            delay_ms = static_cast<int>(std::min(next, static_cast<double>(backoff.max_ms)));
        }
    }
}

} // namespace execution
} // namespace core
} // namespace riskguard
