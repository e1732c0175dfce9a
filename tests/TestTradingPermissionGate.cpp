#include "core/gate/TradingPermissionGate.h"
#include "core/state/CommandStoreJson.h"
#include "core/state/LockStoreJson.h"
#include "support/TempDir.h"

#include <cassert>
#include <iostream>

using namespace riskguard;
using riskguard::testing::TempDir;

namespace {

constexpr long long kNow = 1'800'000'000'000LL;

struct GateFixture {
    explicit GateFixture(const std::string& name)
        : dir(name)
        , commands(std::make_shared<core::CommandStoreJson>(dir.file("risk_commands.json")))
        , locks(std::make_shared<core::LockStoreJson>(dir.file("panic.lock"), dir.file("trading_disabled.json"))) {
        CommandGateConfig cfg;
        cfg.max_staleness_seconds = 180;
        gate = std::make_unique<core::TradingPermissionGate>(commands, locks, cfg);
    }

    void publish(RiskMode mode, bool allow, long long ts) {
        core::RiskCommand cmd;
        cmd.mode = mode;
        cmd.allow_new_entries = allow;
        cmd.timestamp_ms = ts;
        cmd.message = "test command";
        assert(commands->publish(cmd));
    }

    TempDir dir;
    std::shared_ptr<core::CommandStoreJson> commands;
    std::shared_ptr<core::LockStoreJson> locks;
    std::unique_ptr<core::TradingPermissionGate> gate;
};

void testAbsentCommandDenies() {
    GateFixture f("gate_absent");
    const auto verdict = f.gate->evaluate(kNow);
    assert(!verdict.allow_new_entries);
    assert(!verdict.command.has_value());
    assert(verdict.reason == "no readable risk command");

    std::cout << "[TEST] absent command PASSED\n";
}

void testFreshCommandFollowed() {
    GateFixture f("gate_fresh");
    f.publish(RiskMode::NORMAL, true, kNow - 5'000);
    auto verdict = f.gate->evaluate(kNow);
    assert(verdict.allow_new_entries);
    assert(verdict.mode.has_value() && *verdict.mode == RiskMode::NORMAL);
    assert(!verdict.command_stale);

    f.publish(RiskMode::DERISK, false, kNow - 1'000);
    verdict = f.gate->evaluate(kNow);
    assert(!verdict.allow_new_entries);
    assert(verdict.reason.find("DERISK") == 0);

    std::cout << "[TEST] fresh command PASSED\n";
}

void testStaleCommandDenies() {
    GateFixture f("gate_stale");
    f.publish(RiskMode::NORMAL, true, kNow - 181'000);
    const auto verdict = f.gate->evaluate(kNow);
    assert(!verdict.allow_new_entries);
    assert(verdict.command_stale);
    assert(verdict.reason == "risk command is stale");

    GateFixture g("gate_no_ts");
    g.publish(RiskMode::NORMAL, true, 0);
    assert(g.gate->evaluate(kNow).command_stale);
    assert(!g.gate->evaluate(kNow).allow_new_entries);

    std::cout << "[TEST] stale command PASSED\n";
}

void testLockAndFlagOverrideCommand() {
    GateFixture f("gate_lock");
    f.publish(RiskMode::NORMAL, true, kNow);

    assert(f.locks->setTradingDisabled(true, "loss limit", core::disable_source::kDailyLoss));
    auto verdict = f.gate->evaluate(kNow);
    assert(!verdict.allow_new_entries);
    assert(verdict.trading_disabled);
    assert(!verdict.panic_armed);
    assert(verdict.reason == "trading disabled by daily_loss_breaker: loss limit");

    assert(f.locks->armLock("panic", core::PanicExecutionReport{}));
    verdict = f.gate->evaluate(kNow);
    assert(!verdict.allow_new_entries);
    assert(verdict.panic_armed);
    assert(verdict.reason == "panic lock armed");

    std::cout << "[TEST] lock and flag override PASSED\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TradingPermissionGate Test..." << std::endl;

    testAbsentCommandDenies();
    testFreshCommandFollowed();
    testStaleCommandDenies();
    testLockAndFlagOverrideCommand();

    std::cout << "[TEST] TradingPermissionGate Test PASSED!" << std::endl;
    return 0;
}
