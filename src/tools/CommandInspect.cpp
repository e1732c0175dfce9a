#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"
#include "core/gate/TradingPermissionGate.h"
#include "core/model/RecordSchema.h"
#include "core/state/CommandStoreJson.h"
#include "core/state/LockStoreJson.h"

#include <iostream>

// 소비자 관점에서 현재 진입 허용 여부를 출력한다 (읽기 전용)
int main(int argc, char* argv[]) {
    const std::string config_path = (argc >= 2) ? argv[1] : "config/riskguard.json";

    try {
        using namespace riskguard;
        auto& cfg = Config::getInstance();
        cfg.load(config_path);

        const auto monitor = cfg.getRiskMonitorConfig();
        const auto panic = cfg.getPanicConfig();
        auto commands = std::make_shared<core::CommandStoreJson>(
            utils::PathUtils::resolveRelativePath(monitor.command_file));
        auto locks = std::make_shared<core::LockStoreJson>(
            utils::PathUtils::resolveRelativePath(panic.lock_file),
            utils::PathUtils::resolveRelativePath(panic.trading_disabled_file));

        core::TradingPermissionGate gate(commands, locks, cfg.getCommandGateConfig());
        const auto verdict = gate.evaluate(common::nowMs());

        nlohmann::json out = {
            {"allow_new_entries", verdict.allow_new_entries},
            {"cancel_all_orders", verdict.cancel_all_orders},
            {"close_positions", verdict.close_positions},
            {"close_fraction", verdict.close_fraction},
            {"panic_armed", verdict.panic_armed},
            {"trading_disabled", verdict.trading_disabled},
            {"command_stale", verdict.command_stale},
            {"reason", verdict.reason}
        };
        out["mode"] = verdict.mode.has_value() ? nlohmann::json(core::riskModeToString(*verdict.mode))
                                               : nlohmann::json(nullptr);
        out["target_utilization"] = verdict.target_utilization.has_value()
            ? nlohmann::json(*verdict.target_utilization)
            : nlohmann::json(nullptr);
        out["command"] = verdict.command.has_value() ? core::toJson(*verdict.command) : nlohmann::json(nullptr);

        std::cout << out.dump(2) << "\n";
        return verdict.allow_new_entries ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "Command check failed: " << e.what() << "\n";
        return 1;
    }
}
