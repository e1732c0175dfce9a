#include "core/risk/RiskMonitor.h"

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/model/Errors.h"
#include "core/model/RecordSchema.h"
#include "core/risk/RiskCommandPolicy.h"

#include <algorithm>
#include <cmath>

namespace riskguard {
namespace core {

RiskMonitor::RiskMonitor(
    std::shared_ptr<IExchangeGateway> gateway,
    std::shared_ptr<ICommandStore> store,
    RiskMonitorConfig config
)
    : gateway_(std::move(gateway))
    , store_(std::move(store))
    , config_(std::move(config))
    , poll_interval_(std::chrono::seconds(config_.poll_seconds))
    , max_backoff_(std::chrono::seconds(config_.max_backoff_seconds)) {}

RiskMonitor::~RiskMonitor() {
    stop();
}

std::chrono::milliseconds RiskMonitor::computeBackoff(
    int consecutive_failures,
    std::chrono::milliseconds poll_interval,
    std::chrono::milliseconds max_backoff
) {
    if (consecutive_failures <= 0) {
        return poll_interval;
    }
    const int exponent = std::min(consecutive_failures - 1, 30);
    const double scaled = static_cast<double>(poll_interval.count()) * std::pow(2.0, exponent);
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

MonitorPollResult RiskMonitor::poll() {
    MonitorPollResult result;

    AccountMarginState margin;
    try {
        margin = gateway_->getMarginState();
        if (!std::isfinite(margin.total_equity) || margin.total_equity <= 0.0 ||
            !std::isfinite(margin.used_initial_margin)) {
            throw GatewayError("invalid margin data: total_equity=" + std::to_string(margin.total_equity));
        }
    } catch (const std::exception& e) {
        onPollFailure(e.what(), result);
        return result;
    }

    margin.utilization = RiskCommandPolicy::clampUtilization(margin.used_initial_margin / margin.total_equity);
    const RiskMode mode = RiskCommandPolicy::classify(margin.utilization, config_.thresholds);
    RiskCommand cmd = RiskCommandPolicy::buildCommand(mode, margin, config_.thresholds, common::nowMs());

    result.ok = true;
    result.command = cmd;
    result.published = store_->publish(cmd);
    if (!result.published) {
        LOG_ERROR("Failed to publish risk command (mode={})", riskModeToString(mode));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (consecutive_failures_ > 0) {
        LOG_INFO("Margin poll recovered after {} failure(s)", consecutive_failures_);
    }
    consecutive_failures_ = 0;

    if (!last_mode_.has_value() || *last_mode_ != mode) {
        LOG_WARN("Risk mode change: {} -> {} (utilization {:.2f}%)",
                 last_mode_.has_value() ? riskModeToString(*last_mode_) : "NONE",
                 riskModeToString(mode), margin.utilization * 100.0);
    } else {
        LOG_DEBUG("Risk mode {} (utilization {:.2f}%)", riskModeToString(mode), margin.utilization * 100.0);
    }
    last_mode_ = mode;
    if (result.published) {
        last_command_ = cmd;
    }
    return result;
}

void RiskMonitor::onPollFailure(const std::string& reason, MonitorPollResult& result) {
    result.ok = false;
    result.error = reason;

    std::lock_guard<std::mutex> lock(state_mutex_);
    ++consecutive_failures_;
    LOG_ERROR("Margin poll failed ({}/{}): {}", consecutive_failures_, config_.failure_halt_after, reason);

    // 실패 시 마지막 명령을 더 느슨한 것으로 덮어쓰지 않는다
    if (consecutive_failures_ < config_.failure_halt_after) {
        return;
    }

    RiskCommand failsafe = RiskCommandPolicy::buildFailsafe(
        consecutive_failures_, config_.thresholds, common::nowMs());
    result.command = failsafe;
    result.published = store_->publish(failsafe);
    if (!result.published) {
        LOG_ERROR("Failed to publish fail-safe HALT command");
        return;
    }
    if (!last_mode_.has_value() || *last_mode_ != RiskMode::HALT) {
        LOG_WARN("Risk mode change: {} -> HALT (fail-safe)",
                 last_mode_.has_value() ? riskModeToString(*last_mode_) : "NONE");
    }
    last_mode_ = RiskMode::HALT;
    last_command_ = failsafe;
}

int RiskMonitor::consecutiveFailures() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return consecutive_failures_;
}

std::optional<RiskCommand> RiskMonitor::lastCommand() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_command_;
}

bool RiskMonitor::start() {
    if (running_) {
        LOG_WARN("Risk monitor is already running");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    LOG_INFO("Risk monitor started (poll {} ms, fail-safe after {} failures)",
             poll_interval_.count(), config_.failure_halt_after);
    worker_thread_ = std::make_unique<std::thread>(&RiskMonitor::run, this);
    return true;
}

void RiskMonitor::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    running_ = false;

    publishOffline();
    LOG_INFO("Risk monitor stopped");
}

void RiskMonitor::run() {
    while (true) {
        try {
            poll();
        } catch (const std::exception& e) {
            LOG_ERROR("Risk monitor loop error: {}", e.what());
        }

        const auto wait = computeBackoff(consecutiveFailures(), poll_interval_, max_backoff_);
        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (wake_cv_.wait_for(lock, wait, [this] { return stop_requested_; })) {
            break;
        }
    }
}

void RiskMonitor::publishOffline() {
    RiskCommand base;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (last_command_.has_value()) {
            base = *last_command_;
        }
    }
    const RiskCommand offline = RiskCommandPolicy::buildOffline(base, common::nowMs());
    if (!store_->publish(offline)) {
        LOG_ERROR("Failed to publish offline command");
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_command_ = offline;
}

} // namespace core
} // namespace riskguard
