#include "core/orchestration/PanicOrchestrator.h"
#include "core/state/LockStoreJson.h"
#include "core/state/RunJournalJsonl.h"
#include "support/FakeAlertSink.h"
#include "support/FakeExchangeGateway.h"
#include "support/TempDir.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <thread>

using namespace riskguard;
using riskguard::testing::FakeAlertSink;
using riskguard::testing::FakeExchangeGateway;
using riskguard::testing::TempDir;

namespace {

struct Harness {
    explicit Harness(const std::string& name)
        : dir(name)
        , gateway(std::make_shared<FakeExchangeGateway>())
        , alerts(std::make_shared<FakeAlertSink>()) {
        config.verify_timeout_sec = 1;
        config.verify_poll_ms = 20;
        config.worker_threads = 4;
        config.lock_file = dir.file("panic.lock").string();
        config.trading_disabled_file = dir.file("trading_disabled.json").string();
        config.journal_file = dir.file("panic_runs.jsonl").string();

        backoff.initial_ms = 1;
        backoff.max_ms = 5;
        backoff.multiplier = 2.0;
        backoff.max_retries = 2;

        locks = std::make_shared<core::LockStoreJson>(config.lock_file, config.trading_disabled_file);
        journal = std::make_shared<core::RunJournalJsonl>(config.journal_file);
    }

    std::shared_ptr<core::PanicOrchestrator> make(std::vector<std::string> symbols = {}) {
        return std::make_shared<core::PanicOrchestrator>(
            gateway, locks, journal, alerts, config, backoff, std::move(symbols));
    }

    TempDir dir;
    PanicConfig config;
    BackoffConfig backoff;
    std::shared_ptr<FakeExchangeGateway> gateway;
    std::shared_ptr<FakeAlertSink> alerts;
    std::shared_ptr<core::LockStoreJson> locks;
    std::shared_ptr<core::RunJournalJsonl> journal;
};

bool anyWarningContains(const core::PanicExecutionReport& report, const std::string& needle) {
    return std::any_of(report.warnings.begin(), report.warnings.end(), [&needle](const std::string& w) {
        return w.find(needle) != std::string::npos;
    });
}

void testFlattensAndLocks() {
    Harness h("panic_flatten");
    h.gateway->addPosition("BTCUSDT", PositionSide::LONG, 0.01);
    h.gateway->addPosition("ETHUSDT", PositionSide::SHORT, 0.5);
    h.gateway->setSpec("BTCUSDT", 0.001, 0.001);
    h.gateway->setSpec("ETHUSDT", 0.01, 0.01);
    h.gateway->addOrder("o1", "BTCUSDT");
    h.gateway->addOrder("o2", "BTCUSDT");
    h.gateway->addOrder("o3", "ETHUSDT");

    auto orchestrator = h.make();
    assert(orchestrator->state() == core::PanicState::IDLE);

    const auto outcome = orchestrator->trigger("test");
    assert(outcome.accepted);
    assert(outcome.state == core::PanicState::LOCKED);
    assert(outcome.report.success);
    assert(outcome.report.locked);
    assert(outcome.report.orders_canceled == 3);
    assert(outcome.report.positions_closed == 2);
    assert((outcome.report.symbols_touched == std::vector<std::string>{"BTCUSDT", "ETHUSDT"}));
    assert(outcome.report.remaining_positions.empty());
    assert(outcome.report.remaining_orders.empty());
    assert(outcome.report.ended_at_ms >= outcome.report.started_at_ms);

    const auto& timings = outcome.report.phase_timings;
    assert(timings.size() == 4);
    assert(timings[0].phase == "DISABLING");
    assert(timings[3].phase == "VERIFYING");
    for (const auto& t : timings) {
        assert(t.success);
    }

    const auto placed = h.gateway->placedOrders();
    assert(placed.size() == 2);
    for (const auto& order : placed) {
        if (order.symbol == "BTCUSDT") {
            assert(order.side == OrderSide::SELL);
            assert(std::fabs(order.qty - 0.01) < 1e-12);
        } else {
            assert(order.symbol == "ETHUSDT");
            assert(order.side == OrderSide::BUY);
            assert(std::fabs(order.qty - 0.5) < 1e-12);
        }
    }

    const auto lock = h.locks->loadLock();
    assert(lock.armed);
    assert(lock.last_report.has_value());
    const auto flag = h.locks->loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.source == core::disable_source::kPanic);

    assert(h.journal->lastSeq() == 1);
    assert(h.alerts->started == 1);
    assert(h.alerts->completed == 1);
    assert(h.alerts->failed == 0);

    // 잠긴 상태에서 재트리거: 거래소 호출 없이 마지막 보고서 반환
    const int mutations = h.gateway->mutationCount();
    const auto again = orchestrator->trigger("again");
    assert(!again.accepted);
    assert(again.state == core::PanicState::LOCKED);
    assert(again.report.orders_canceled == 3);
    assert(h.gateway->mutationCount() == mutations);
    assert(h.journal->lastSeq() == 1);

    std::cout << "[TEST] flatten and lock PASSED\n";
}

void testStuckPositionAndReset() {
    Harness h("panic_stuck");
    h.gateway->addPosition("BTCUSDT", PositionSide::LONG, 0.01);
    h.gateway->setSpec("BTCUSDT", 0.001, 0.001);
    h.gateway->setStuck("BTCUSDT");

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("stuck");
    assert(outcome.accepted);
    assert(outcome.state == core::PanicState::FAILED_PARTIAL);
    assert(!outcome.report.success);
    assert(outcome.report.locked);
    assert(outcome.report.remaining_positions.size() == 1);
    assert(anyWarningContains(outcome.report, "stuck position after verify timeout: BTCUSDT"));
    assert(!outcome.report.error_message.empty());
    assert(std::find(outcome.report.symbols_touched.begin(), outcome.report.symbols_touched.end(), "BTCUSDT") !=
           outcome.report.symbols_touched.end());
    assert(h.locks->loadLock().armed);
    assert(h.alerts->failed == 1);

    // 포지션이 남아 있으면 reset 거부
    const auto rejected = orchestrator->reset();
    assert(rejected.code == core::ResetCode::NOT_FLAT);
    assert(rejected.positions_remaining == 1);
    assert(orchestrator->state() == core::PanicState::FAILED_PARTIAL);
    assert(h.locks->loadLock().armed);
    assert(h.alerts->resets_rejected == 1);

    h.gateway->clearPositions();
    const auto ok = orchestrator->reset();
    assert(ok.ok());
    assert(orchestrator->state() == core::PanicState::IDLE);
    assert(!h.locks->loadLock().armed);
    assert(!h.locks->loadTradingDisabled().disabled);
    assert(h.alerts->resets_ok == 1);

    const auto not_armed = orchestrator->reset();
    assert(not_armed.code == core::ResetCode::NOT_ARMED);

    std::cout << "[TEST] stuck position and reset PASSED\n";
}

void testConcurrentTriggerRunsOnce() {
    Harness h("panic_concurrent");
    h.gateway->addOrder("o1", "BTCUSDT");
    h.gateway->setCancelDelay(std::chrono::milliseconds(300));

    auto orchestrator = h.make();
    core::TriggerOutcome first;
    std::thread runner([&]() { first = orchestrator->trigger("first"); });

    for (int i = 0; i < 200 && !orchestrator->isRunning(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(orchestrator->isRunning());

    const auto second = orchestrator->trigger("second");
    assert(!second.accepted);
    assert(!core::execution::PanicStateMachine::isTerminal(second.state));

    const auto reset_during_run = orchestrator->reset();
    assert(reset_during_run.code == core::ResetCode::RUN_IN_PROGRESS);

    runner.join();
    assert(first.accepted);
    assert(first.state == core::PanicState::LOCKED);
    assert(h.alerts->started == 1);
    assert(h.journal->lastSeq() == 1);
    assert(h.gateway->canceledSymbols().size() == 1);

    std::cout << "[TEST] concurrent trigger PASSED\n";
}

void testGatewayDownStillLocks() {
    Harness h("panic_down");
    h.gateway->setDown(true);

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("down");
    assert(outcome.accepted);
    assert(outcome.state == core::PanicState::FAILED_PARTIAL);
    assert(outcome.report.locked);
    assert(outcome.report.error_message.find("gateway unreachable") != std::string::npos);
    assert(h.gateway->mutationCount() == 0);
    assert(h.locks->loadLock().armed);
    assert(h.locks->loadTradingDisabled().disabled);

    const auto reset = orchestrator->reset();
    assert(reset.code == core::ResetCode::GATEWAY_UNAVAILABLE);
    assert(h.locks->loadLock().armed);

    std::cout << "[TEST] gateway down PASSED\n";
}

void testFlagPersistedBeforeFirstMutation() {
    Harness h("panic_flag_first");
    h.gateway->addOrder("o1", "SOLUSDT");
    h.gateway->addPosition("SOLUSDT", PositionSide::LONG, 3.0);
    h.gateway->setSpec("SOLUSDT", 0.1, 0.1);

    bool hook_ran = false;
    bool disabled_at_first_mutation = false;
    auto locks = h.locks;
    h.gateway->onFirstMutation([&]() {
        hook_ran = true;
        disabled_at_first_mutation = locks->loadTradingDisabled().disabled;
    });

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("ordering");
    assert(outcome.state == core::PanicState::LOCKED);
    assert(hook_ran);
    assert(disabled_at_first_mutation);

    std::cout << "[TEST] trading disabled before first mutation PASSED\n";
}

void testStartAlertAfterFlagPersisted() {
    Harness h("panic_alert_order");
    h.gateway->addOrder("o1", "BTCUSDT");

    bool disabled_at_alert = false;
    std::string source_at_alert;
    auto locks = h.locks;
    h.alerts->on_started = [&]() {
        const auto flag = locks->loadTradingDisabled();
        disabled_at_alert = flag.disabled;
        source_at_alert = flag.source;
    };

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("alert order");
    assert(outcome.state == core::PanicState::LOCKED);
    assert(h.alerts->started == 1);
    assert(disabled_at_alert);
    assert(source_at_alert == core::disable_source::kPanic);
    assert(outcome.report.phase_timings[0].phase == "DISABLING");
    assert(outcome.report.phase_timings[0].success);

    std::cout << "[TEST] flag persisted before start alert PASSED\n";
}

void testRejectedSymbolsAreIsolated() {
    Harness h("panic_rejected");
    h.gateway->addPosition("BTCUSDT", PositionSide::LONG, 0.01);
    h.gateway->addPosition("ETHUSDT", PositionSide::SHORT, 0.5);
    h.gateway->setSpec("BTCUSDT", 0.001, 0.001);
    h.gateway->setSpec("ETHUSDT", 0.01, 0.01);
    h.gateway->addOrder("o1", "BTCUSDT");
    h.gateway->addOrder("o2", "ETHUSDT");
    // BTCUSDT 청산은 매번 거부, ETHUSDT 주문 취소는 거부
    h.gateway->setRejectClose("BTCUSDT", true);
    h.gateway->setRejectCancel("ETHUSDT");

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("rejections");
    assert(outcome.accepted);
    assert(outcome.state == core::PanicState::FAILED_PARTIAL);
    assert(!outcome.report.success);
    assert(outcome.report.locked);

    // 다른 종목은 정상 처리
    assert(outcome.report.orders_canceled == 1);
    assert(outcome.report.positions_closed == 1);
    const auto placed = h.gateway->placedOrders();
    assert(placed.size() == 1);
    assert(placed[0].symbol == "ETHUSDT" && placed[0].side == OrderSide::BUY);
    assert(h.gateway->rejectedCloses() == h.backoff.max_retries + 1);

    assert(anyWarningContains(outcome.report, "cancel failed for ETHUSDT"));
    assert(anyWarningContains(outcome.report, "close failed for BTCUSDT"));
    assert(anyWarningContains(outcome.report, "stuck position after verify timeout: BTCUSDT"));
    assert(anyWarningContains(outcome.report, "stuck order after verify timeout: ETHUSDT"));
    assert(outcome.report.remaining_positions.size() == 1);
    assert(outcome.report.remaining_positions[0].symbol == "BTCUSDT");
    assert(outcome.report.remaining_orders.size() == 1);
    assert(outcome.report.remaining_orders[0].symbol == "ETHUSDT");

    assert(h.locks->loadLock().armed);
    assert(h.locks->loadTradingDisabled().disabled);
    assert(h.alerts->failed == 1);

    std::cout << "[TEST] rejected symbols isolated PASSED\n";
}

void testPrecisionAdjustedOnce() {
    Harness h("panic_precision");
    h.gateway->addPosition("XRPUSDT", PositionSide::LONG, 0.02);
    h.gateway->setSpec("XRPUSDT", 0.003, 0.001);
    h.gateway->setTrueStep("XRPUSDT", 0.01);

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("precision");
    assert(outcome.state == core::PanicState::LOCKED);
    assert(outcome.report.positions_closed == 1);

    const auto placed = h.gateway->placedOrders();
    assert(placed.size() == 2);
    assert(std::fabs(placed[0].qty - 0.018) < 1e-9);
    assert(std::fabs(placed[1].qty - 0.02) < 1e-9);

    std::cout << "[TEST] precision adjusted once PASSED\n";
}

void testBelowMinimumIsSkipped() {
    Harness h("panic_min_qty");
    h.gateway->addPosition("DOGEUSDT", PositionSide::SHORT, 0.5);
    h.gateway->setSpec("DOGEUSDT", 1.0, 1.0);

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("dust");
    assert(outcome.state == core::PanicState::FAILED_PARTIAL);
    assert(h.gateway->placedOrders().empty());
    assert(anyWarningContains(outcome.report, "below the minimum order quantity"));
    assert(anyWarningContains(outcome.report, "DOGEUSDT"));

    std::cout << "[TEST] below minimum skipped PASSED\n";
}

void testFlagWriteFailureMakesNoExchangeCalls() {
    Harness h("panic_flag_fail");
    // 부모 경로가 일반 파일이면 디렉토리를 만들 수 없다
    const auto blocker = h.dir.file("blocker");
    {
        std::ofstream out(blocker);
        out << "x";
    }
    h.config.trading_disabled_file = (blocker / "trading_disabled.json").string();
    h.locks = std::make_shared<core::LockStoreJson>(h.config.lock_file, h.config.trading_disabled_file);
    h.gateway->addOrder("o1", "BTCUSDT");

    auto orchestrator = h.make();
    const auto outcome = orchestrator->trigger("no disk");
    assert(outcome.accepted);
    assert(outcome.state == core::PanicState::FAILED_PARTIAL);
    assert(outcome.report.error_message == "failed to persist trading-disabled flag");
    assert(h.gateway->mutationCount() == 0);

    // 메모리 상태로 잠금 유지
    const auto again = orchestrator->trigger("retry");
    assert(!again.accepted);

    std::cout << "[TEST] flag write failure PASSED\n";
}

void testRecoversLockAfterRestart() {
    Harness h("panic_restart");
    h.gateway->addOrder("o1", "BTCUSDT");
    {
        auto orchestrator = h.make();
        assert(orchestrator->trigger("before restart").state == core::PanicState::LOCKED);
    }

    auto restarted = h.make();
    assert(restarted->state() == core::PanicState::LOCKED);
    assert(restarted->lastReport().has_value());
    assert(restarted->lastReport()->orders_canceled == 1);

    const auto outcome = restarted->trigger("after restart");
    assert(!outcome.accepted);
    assert(h.gateway->canceledSymbols().size() == 1);

    const auto status = restarted->status();
    assert(status.lock.armed);
    assert(status.trading_disabled.disabled);
    assert(!status.running);

    std::cout << "[TEST] lock recovered after restart PASSED\n";
}

void testConfiguredSymbolsAlwaysSwept() {
    Harness h("panic_configured");
    auto orchestrator = h.make({"BTCUSDT", "ETHUSDT"});
    const auto outcome = orchestrator->trigger("sweep");
    assert(outcome.state == core::PanicState::LOCKED);

    auto canceled = h.gateway->canceledSymbols();
    std::sort(canceled.begin(), canceled.end());
    assert((canceled == std::vector<std::string>{"BTCUSDT", "ETHUSDT"}));
    assert(outcome.report.orders_canceled == 0);

    std::cout << "[TEST] configured symbols swept PASSED\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PanicOrchestrator Test..." << std::endl;

    testFlattensAndLocks();
    testStuckPositionAndReset();
    testConcurrentTriggerRunsOnce();
    testGatewayDownStillLocks();
    testFlagPersistedBeforeFirstMutation();
    testStartAlertAfterFlagPersisted();
    testRejectedSymbolsAreIsolated();
    testPrecisionAdjustedOnce();
    testBelowMinimumIsSkipped();
    testFlagWriteFailureMakesNoExchangeCalls();
    testRecoversLockAfterRestart();
    testConfiguredSymbolsAlwaysSwept();

    std::cout << "[TEST] PanicOrchestrator Test PASSED!" << std::endl;
    return 0;
}
