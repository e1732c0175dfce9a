#include "core/risk/RiskCommandPolicy.h"

#include "core/model/RecordSchema.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace riskguard {
namespace core {

namespace {
std::string percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (ratio * 100.0) << "%";
    return oss.str();
}
} // namespace

double RiskCommandPolicy::clampUtilization(double utilization) {
    if (!std::isfinite(utilization) || utilization < 0.0) {
        return 0.0;
    }
    return std::min(utilization, 1.0);
}

RiskMode RiskCommandPolicy::classify(double utilization, const RiskThresholds& thresholds) {
    const double u = clampUtilization(utilization);
    if (u >= thresholds.halt_at) {
        return RiskMode::HALT;
    }
    if (u >= thresholds.emergency_at) {
        return RiskMode::EMERGENCY;
    }
    if (u >= thresholds.derisk_at) {
        return RiskMode::DERISK;
    }
    if (u >= thresholds.warn_at) {
        return RiskMode::ALERT;
    }
    return RiskMode::NORMAL;
}

RiskCommand RiskCommandPolicy::buildCommand(
    RiskMode mode,
    const AccountMarginState& margin,
    const RiskThresholds& thresholds,
    long long now_ms
) {
    RiskCommand cmd;
    cmd.mode = mode;
    cmd.utilization = clampUtilization(margin.utilization);
    cmd.timestamp_ms = now_ms;
    cmd.total_equity = margin.total_equity;
    cmd.used_initial_margin = margin.used_initial_margin;
    cmd.source = CommandSource::MONITOR;

    const std::string u = percent(cmd.utilization);

    switch (mode) {
        case RiskMode::NORMAL:
            cmd.allow_new_entries = true;
            cmd.priority = CommandPriority::NONE;
            cmd.message = "Margin utilization " + u + " is within normal range";
            break;
        case RiskMode::ALERT:
            cmd.allow_new_entries = true;
            cmd.priority = CommandPriority::LOW;
            cmd.message = "Margin utilization " + u + " crossed the alert threshold";
            break;
        case RiskMode::DERISK:
            cmd.allow_new_entries = false;
            cmd.cancel_all_orders = true;
            cmd.close_positions = true;
            cmd.close_fraction = thresholds.derisk_close_fraction;
            cmd.target_utilization = thresholds.target_after_derisk;
            cmd.priority = CommandPriority::MEDIUM;
            cmd.message = "De-risk: utilization " + u + ", reduce exposure to " +
                          percent(thresholds.target_after_derisk);
            break;
        case RiskMode::EMERGENCY:
            cmd.allow_new_entries = false;
            cmd.cancel_all_orders = true;
            cmd.close_positions = true;
            cmd.close_fraction = thresholds.emergency_close_fraction;
            cmd.target_utilization = thresholds.target_after_emergency;
            cmd.priority = CommandPriority::HIGH;
            cmd.message = "Emergency: utilization " + u + ", reduce exposure to " +
                          percent(thresholds.target_after_emergency);
            break;
        case RiskMode::HALT:
            cmd.allow_new_entries = false;
            cmd.cancel_all_orders = true;
            cmd.close_positions = true;
            cmd.close_fraction = 1.0;
            cmd.priority = CommandPriority::IMMEDIATE;
            cmd.message = "HALT: utilization " + u + ", close all positions";
            break;
    }
    return cmd;
}

RiskCommand RiskCommandPolicy::buildFailsafe(
    int consecutive_failures,
    const RiskThresholds& thresholds,
    long long now_ms
) {
    AccountMarginState unknown;
    RiskCommand cmd = buildCommand(RiskMode::HALT, unknown, thresholds, now_ms);
    cmd.source = CommandSource::FAILSAFE;
    cmd.utilization = 0.0;
    cmd.message = "Fail-safe HALT: margin state unavailable after " +
                  std::to_string(consecutive_failures) + " consecutive failures";
    return cmd;
}

RiskCommand RiskCommandPolicy::buildOffline(const RiskCommand& last, long long now_ms) {
    RiskCommand cmd = last;
    cmd.seq = 0;
    cmd.allow_new_entries = false;
    cmd.timestamp_ms = now_ms;
    cmd.source = CommandSource::OFFLINE;
    cmd.message = std::string("Risk monitor offline (last mode ") + riskModeToString(last.mode) + ")";
    return cmd;
}

} // namespace core
} // namespace riskguard
