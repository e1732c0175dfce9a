#include "core/gate/TradingPermissionGate.h"

#include "core/model/RecordSchema.h"

namespace riskguard {
namespace core {

TradingPermissionGate::TradingPermissionGate(
    std::shared_ptr<ICommandStore> command_store,
    std::shared_ptr<ILockStore> lock_store,
    CommandGateConfig config
)
    : command_store_(std::move(command_store))
    , lock_store_(std::move(lock_store))
    , config_(config) {}

GateVerdict TradingPermissionGate::evaluate(long long now_ms) {
    GateVerdict verdict;

    const auto lock = lock_store_->loadLock();
    const auto flag = lock_store_->loadTradingDisabled();
    verdict.panic_armed = lock.armed;
    verdict.trading_disabled = flag.disabled || lock.armed;

    verdict.command = command_store_->latest();
    if (verdict.command.has_value()) {
        const auto& cmd = *verdict.command;
        verdict.mode = cmd.mode;
        const long long max_age_ms = static_cast<long long>(config_.max_staleness_seconds) * 1000;
        verdict.command_stale = (cmd.timestamp_ms <= 0) || (now_ms - cmd.timestamp_ms > max_age_ms);
        verdict.cancel_all_orders = cmd.cancel_all_orders;
        verdict.close_positions = cmd.close_positions;
        verdict.close_fraction = cmd.close_fraction;
        verdict.target_utilization = cmd.target_utilization;
    }

    if (lock.armed) {
        verdict.reason = "panic lock armed";
        return verdict;
    }
    if (flag.disabled) {
        verdict.reason = "trading disabled by " + (flag.source.empty() ? std::string("unknown") : flag.source) +
                         (flag.reason.empty() ? std::string() : ": " + flag.reason);
        return verdict;
    }
    if (!verdict.command.has_value()) {
        verdict.reason = "no readable risk command";
        return verdict;
    }
    if (verdict.command_stale) {
        verdict.reason = "risk command is stale";
        return verdict;
    }

    verdict.allow_new_entries = verdict.command->allow_new_entries;
    verdict.reason = std::string(riskModeToString(verdict.command->mode)) + ": " + verdict.command->message;
    return verdict;
}

} // namespace core
} // namespace riskguard
