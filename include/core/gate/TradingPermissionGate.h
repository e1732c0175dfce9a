#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/GuardConfig.h"
#include "core/contracts/ICommandStore.h"
#include "core/contracts/ILockStore.h"

namespace riskguard {
namespace core {

struct GateVerdict {
    bool allow_new_entries = false;
    bool cancel_all_orders = false;
    bool close_positions = false;
    double close_fraction = 0.0;
    std::optional<double> target_utilization;
    std::optional<RiskMode> mode;
    bool panic_armed = false;
    bool trading_disabled = false;
    bool command_stale = false;
    std::optional<RiskCommand> command;
    std::string reason;
};

// 주문 관련 결정 전에 소비자 프로세스가 호출한다.
// 잠금/거래 중지/명령 부재/명령 만료 중 하나라도 해당하면 신규 진입 거부.
class TradingPermissionGate {
public:
    TradingPermissionGate(
        std::shared_ptr<ICommandStore> command_store,
        std::shared_ptr<ILockStore> lock_store,
        CommandGateConfig config
    );

    GateVerdict evaluate(long long now_ms);

private:
    std::shared_ptr<ICommandStore> command_store_;
    std::shared_ptr<ILockStore> lock_store_;
    CommandGateConfig config_;
};

} // namespace core
} // namespace riskguard
