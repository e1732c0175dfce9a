#include "core/model/RecordSchema.h"

#include "common/TimeUtils.h"

namespace riskguard {
namespace core {

const char* riskModeToString(RiskMode mode) {
    switch (mode) {
        case RiskMode::NORMAL: return "NORMAL";
        case RiskMode::ALERT: return "ALERT";
        case RiskMode::DERISK: return "DERISK";
        case RiskMode::EMERGENCY: return "EMERGENCY";
        case RiskMode::HALT: return "HALT";
    }
    return "HALT";
}

std::optional<RiskMode> riskModeFromString(const std::string& value) {
    if (value == "NORMAL") return RiskMode::NORMAL;
    if (value == "ALERT") return RiskMode::ALERT;
    if (value == "DERISK") return RiskMode::DERISK;
    if (value == "EMERGENCY") return RiskMode::EMERGENCY;
    if (value == "HALT") return RiskMode::HALT;
    return std::nullopt;
}

const char* priorityToString(CommandPriority priority) {
    switch (priority) {
        case CommandPriority::NONE: return "NONE";
        case CommandPriority::LOW: return "LOW";
        case CommandPriority::MEDIUM: return "MEDIUM";
        case CommandPriority::HIGH: return "HIGH";
        case CommandPriority::IMMEDIATE: return "IMMEDIATE";
    }
    return "IMMEDIATE";
}

CommandPriority priorityFromString(const std::string& value) {
    if (value == "NONE") return CommandPriority::NONE;
    if (value == "LOW") return CommandPriority::LOW;
    if (value == "MEDIUM") return CommandPriority::MEDIUM;
    if (value == "HIGH") return CommandPriority::HIGH;
    return CommandPriority::IMMEDIATE;
}

const char* commandSourceToString(CommandSource source) {
    switch (source) {
        case CommandSource::MONITOR: return "monitor";
        case CommandSource::FAILSAFE: return "failsafe";
        case CommandSource::OFFLINE: return "offline";
    }
    return "monitor";
}

CommandSource commandSourceFromString(const std::string& value) {
    if (value == "failsafe") return CommandSource::FAILSAFE;
    if (value == "offline") return CommandSource::OFFLINE;
    return CommandSource::MONITOR;
}

const char* panicStateToString(PanicState state) {
    switch (state) {
        case PanicState::IDLE: return "IDLE";
        case PanicState::DISABLING: return "DISABLING";
        case PanicState::CANCELING: return "CANCELING";
        case PanicState::FLATTENING: return "FLATTENING";
        case PanicState::VERIFYING: return "VERIFYING";
        case PanicState::LOCKED: return "LOCKED";
        case PanicState::FAILED_PARTIAL: return "FAILED_PARTIAL";
    }
    return "IDLE";
}

PanicState panicStateFromString(const std::string& value) {
    if (value == "DISABLING") return PanicState::DISABLING;
    if (value == "CANCELING") return PanicState::CANCELING;
    if (value == "FLATTENING") return PanicState::FLATTENING;
    if (value == "VERIFYING") return PanicState::VERIFYING;
    if (value == "LOCKED") return PanicState::LOCKED;
    if (value == "FAILED_PARTIAL") return PanicState::FAILED_PARTIAL;
    return PanicState::IDLE;
}

nlohmann::json toJson(const RiskCommand& command) {
    nlohmann::json raw;
    raw["seq"] = command.seq;
    raw["mode"] = riskModeToString(command.mode);
    raw["utilization"] = command.utilization;
    raw["allow_new_entries"] = command.allow_new_entries;
    raw["cancel_all_orders"] = command.cancel_all_orders;
    raw["close_positions"] = command.close_positions;
    raw["close_fraction"] = command.close_fraction;
    if (command.target_utilization) {
        raw["target_utilization"] = *command.target_utilization;
    } else {
        raw["target_utilization"] = nullptr;
    }
    raw["priority"] = priorityToString(command.priority);
    raw["message"] = command.message;
    raw["timestamp"] = common::toIso8601(command.timestamp_ms);
    raw["timestamp_ms"] = command.timestamp_ms;
    raw["total_equity"] = command.total_equity;
    raw["used_initial_margin"] = command.used_initial_margin;
    raw["source"] = commandSourceToString(command.source);
    return raw;
}

std::optional<RiskCommand> commandFromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    if (!raw.contains("mode") || !raw["mode"].is_string() ||
        !raw.contains("allow_new_entries") || !raw["allow_new_entries"].is_boolean()) {
        return std::nullopt;
    }
    const auto mode = riskModeFromString(raw["mode"].get<std::string>());
    if (!mode) {
        return std::nullopt;
    }

    try {
        RiskCommand command;
        command.mode = *mode;
        command.seq = raw.value("seq", static_cast<std::uint64_t>(0));
        command.utilization = raw.value("utilization", 0.0);
        command.allow_new_entries = raw["allow_new_entries"].get<bool>();
        command.cancel_all_orders = raw.value("cancel_all_orders", false);
        command.close_positions = raw.value("close_positions", false);
        command.close_fraction = raw.value("close_fraction", 0.0);
        if (raw.contains("target_utilization") && raw["target_utilization"].is_number()) {
            command.target_utilization = raw["target_utilization"].get<double>();
        }
        command.priority = priorityFromString(raw.value("priority", std::string("IMMEDIATE")));
        command.message = raw.value("message", std::string());
        command.timestamp_ms = raw.value("timestamp_ms", 0LL);
        command.total_equity = raw.value("total_equity", 0.0);
        command.used_initial_margin = raw.value("used_initial_margin", 0.0);
        command.source = commandSourceFromString(raw.value("source", std::string("monitor")));
        return command;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

nlohmann::json toJson(const Position& position) {
    return {
        {"symbol", position.symbol},
        {"side", positionSideToString(position.side)},
        {"size", position.size},
        {"entry_price", position.entry_price}
    };
}

nlohmann::json toJson(const OpenOrder& order) {
    return {
        {"order_id", order.order_id},
        {"symbol", order.symbol},
        {"side", orderSideToString(order.side)},
        {"qty", order.qty},
        {"reduce_only", order.reduce_only}
    };
}

nlohmann::json toJson(const PanicExecutionReport& report) {
    nlohmann::json raw;
    raw["started_at"] = common::toIso8601(report.started_at_ms);
    raw["started_at_ms"] = report.started_at_ms;
    raw["ended_at"] = report.ended_at_ms > 0 ? nlohmann::json(common::toIso8601(report.ended_at_ms))
                                             : nlohmann::json(nullptr);
    raw["ended_at_ms"] = report.ended_at_ms;
    raw["success"] = report.success;
    raw["final_state"] = panicStateToString(report.final_state);
    raw["orders_canceled"] = report.orders_canceled;
    raw["positions_closed"] = report.positions_closed;
    raw["symbols_touched"] = report.symbols_touched;

    raw["phase_timings"] = nlohmann::json::array();
    for (const auto& timing : report.phase_timings) {
        raw["phase_timings"].push_back({
            {"phase", timing.phase},
            {"duration_sec", timing.duration_sec},
            {"success", timing.success}
        });
    }

    raw["warnings"] = report.warnings;

    raw["remaining_positions"] = nlohmann::json::array();
    for (const auto& position : report.remaining_positions) {
        raw["remaining_positions"].push_back(toJson(position));
    }
    raw["remaining_orders"] = nlohmann::json::array();
    for (const auto& order : report.remaining_orders) {
        raw["remaining_orders"].push_back(toJson(order));
    }

    raw["locked"] = report.locked;
    raw["total_duration_sec"] = report.total_duration_sec;
    raw["error_message"] = report.error_message.empty() ? nlohmann::json(nullptr)
                                                        : nlohmann::json(report.error_message);
    return raw;
}

PanicExecutionReport reportFromJson(const nlohmann::json& raw) {
    PanicExecutionReport report;
    if (!raw.is_object()) {
        return report;
    }

    report.started_at_ms = raw.value("started_at_ms", 0LL);
    report.ended_at_ms = raw.value("ended_at_ms", 0LL);
    report.success = raw.value("success", false);
    report.final_state = panicStateFromString(raw.value("final_state", std::string("IDLE")));
    report.orders_canceled = raw.value("orders_canceled", 0);
    report.positions_closed = raw.value("positions_closed", 0);
    report.symbols_touched = raw.value("symbols_touched", std::vector<std::string>{});
    report.warnings = raw.value("warnings", std::vector<std::string>{});
    report.locked = raw.value("locked", false);
    report.total_duration_sec = raw.value("total_duration_sec", 0.0);
    if (raw.contains("error_message") && raw["error_message"].is_string()) {
        report.error_message = raw["error_message"].get<std::string>();
    }

    if (raw.contains("phase_timings") && raw["phase_timings"].is_array()) {
        for (const auto& item : raw["phase_timings"]) {
            PhaseTiming timing;
            timing.phase = item.value("phase", std::string());
            timing.duration_sec = item.value("duration_sec", 0.0);
            timing.success = item.value("success", false);
            report.phase_timings.push_back(std::move(timing));
        }
    }

    if (raw.contains("remaining_positions") && raw["remaining_positions"].is_array()) {
        for (const auto& item : raw["remaining_positions"]) {
            Position position;
            position.symbol = item.value("symbol", std::string());
            position.side = item.value("side", std::string("long")) == "short" ? PositionSide::SHORT
                                                                                : PositionSide::LONG;
            position.size = item.value("size", 0.0);
            position.entry_price = item.value("entry_price", 0.0);
            report.remaining_positions.push_back(std::move(position));
        }
    }

    if (raw.contains("remaining_orders") && raw["remaining_orders"].is_array()) {
        for (const auto& item : raw["remaining_orders"]) {
            OpenOrder order;
            order.order_id = item.value("order_id", std::string());
            order.symbol = item.value("symbol", std::string());
            order.side = item.value("side", std::string("Buy")) == "Sell" ? OrderSide::SELL : OrderSide::BUY;
            order.qty = item.value("qty", 0.0);
            order.reduce_only = item.value("reduce_only", false);
            report.remaining_orders.push_back(std::move(order));
        }
    }

    return report;
}

nlohmann::json toJson(const PanicLock& lock) {
    nlohmann::json raw;
    raw["armed"] = lock.armed;
    raw["armed_at"] = lock.armed_at_ms > 0 ? nlohmann::json(common::toIso8601(lock.armed_at_ms))
                                           : nlohmann::json(nullptr);
    raw["armed_at_ms"] = lock.armed_at_ms;
    raw["reason"] = lock.reason;
    raw["version"] = lock.version;
    raw["last_report"] = lock.last_report ? toJson(*lock.last_report) : nlohmann::json(nullptr);
    return raw;
}

PanicLock lockFromJson(const nlohmann::json& raw) {
    PanicLock lock;
    lock.armed = raw.value("armed", false);
    lock.armed_at_ms = raw.value("armed_at_ms", 0LL);
    lock.reason = raw.value("reason", std::string());
    lock.version = raw.value("version", static_cast<std::uint64_t>(0));
    if (raw.contains("last_report") && raw["last_report"].is_object()) {
        lock.last_report = reportFromJson(raw["last_report"]);
    }
    return lock;
}

nlohmann::json toJson(const TradingDisabledFlag& flag) {
    nlohmann::json raw;
    raw["trading_disabled"] = flag.disabled;
    raw["reason"] = flag.reason;
    raw["source"] = flag.source;
    raw["updated_at"] = common::toIso8601(flag.updated_at_ms);
    raw["updated_at_ms"] = flag.updated_at_ms;
    raw["version"] = flag.version;
    return raw;
}

TradingDisabledFlag disabledFlagFromJson(const nlohmann::json& raw) {
    TradingDisabledFlag flag;
    flag.disabled = raw.value("trading_disabled", false);
    flag.reason = raw.value("reason", std::string());
    flag.source = raw.value("source", std::string());
    flag.updated_at_ms = raw.value("updated_at_ms", 0LL);
    flag.version = raw.value("version", static_cast<std::uint64_t>(0));
    return flag;
}

} // namespace core
} // namespace riskguard
