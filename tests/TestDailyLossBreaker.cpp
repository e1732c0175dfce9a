#include "core/risk/DailyLossBreaker.h"
#include "core/state/LockStoreJson.h"
#include "support/TempDir.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace riskguard;
using riskguard::testing::TempDir;

namespace {

// 2027-01-15T12:00:00Z
constexpr long long kDay1 = 1'800'014'400'000LL;
constexpr long long kDayMs = 86'400'000LL;

DailyLossConfig breakerConfig(const TempDir& dir) {
    DailyLossConfig cfg;
    cfg.enabled = true;
    cfg.equity_usdt = 120.0;
    cfg.max_loss_pct = 5.0;    // -6 USDT
    cfg.target_pct = 3.0;      // +3.6 USDT
    cfg.state_file = dir.file("daily_pnl.json").string();
    return cfg;
}

void testLossLimitDisablesTrading() {
    TempDir dir("daily_loss");
    auto locks = std::make_shared<core::LockStoreJson>(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    core::DailyLossBreaker breaker(breakerConfig(dir), locks);

    auto s = breaker.recordRealizedPnl(-2.5, kDay1);
    assert(!s.stopped);
    assert(s.trades == 1);
    assert(s.loss_streak == 1);
    assert(std::fabs(s.loss_limit + 6.0) < 1e-9);
    assert(!locks->loadTradingDisabled().disabled);

    s = breaker.recordRealizedPnl(-3.6, kDay1 + 1000);
    assert(s.stopped);
    assert(s.loss_streak == 2);
    assert(std::fabs(s.realized_pnl + 6.1) < 1e-9);
    assert(s.stop_reason.find("daily loss limit") != std::string::npos);

    const auto flag = locks->loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.source == core::disable_source::kDailyLoss);

    // 상태 파일에서 다시 읽어도 동일
    const auto reread = breaker.stats(kDay1 + 2000);
    assert(reread.stopped);
    assert(reread.trades == 2);

    std::cout << "[TEST] loss limit PASSED\n";
}

void testProfitTargetStopsAndWinResetsStreak() {
    TempDir dir("daily_target");
    auto locks = std::make_shared<core::LockStoreJson>(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    core::DailyLossBreaker breaker(breakerConfig(dir), locks);

    auto s = breaker.recordRealizedPnl(-0.4, kDay1);
    assert(s.loss_streak == 1);
    s = breaker.recordRealizedPnl(2.0, kDay1 + 1);
    assert(s.loss_streak == 0);
    assert(!s.stopped);
    assert(std::fabs(s.progress_pct - (1.6 / 3.6 * 100.0)) < 1e-6);

    s = breaker.recordRealizedPnl(2.5, kDay1 + 2);
    assert(s.stopped);
    assert(s.stop_reason.find("profit target") != std::string::npos);
    assert(locks->loadTradingDisabled().disabled);

    std::cout << "[TEST] profit target PASSED\n";
}

void testRolloverReenablesOnlyOwnFlag() {
    TempDir dir("daily_rollover");
    auto locks = std::make_shared<core::LockStoreJson>(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    core::DailyLossBreaker breaker(breakerConfig(dir), locks);

    breaker.recordRealizedPnl(-7.0, kDay1);
    assert(locks->loadTradingDisabled().disabled);
    assert(!breaker.rolloverIfNewDay(kDay1 + 1000));

    assert(breaker.rolloverIfNewDay(kDay1 + kDayMs));
    assert(!locks->loadTradingDisabled().disabled);
    const auto fresh = breaker.stats(kDay1 + kDayMs);
    assert(fresh.trades == 0);
    assert(!fresh.stopped);

    // 수동 차단은 다음 날에도 유지
    assert(locks->setTradingDisabled(true, "operator", core::disable_source::kManual));
    assert(breaker.rolloverIfNewDay(kDay1 + 2 * kDayMs));
    assert(locks->loadTradingDisabled().disabled);
    assert(locks->loadTradingDisabled().source == core::disable_source::kManual);

    std::cout << "[TEST] rollover PASSED\n";
}

// 다른 출처의 차단 위에서 손실 한도에 걸려도 출처를 덮어쓰지 않고, 다음 날에도 풀지 않는다
void testForeignDisableSurvivesTripAndRollover(const std::string& source) {
    TempDir dir("daily_foreign_" + source);
    auto locks = std::make_shared<core::LockStoreJson>(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    core::DailyLossBreaker breaker(breakerConfig(dir), locks);

    assert(locks->setTradingDisabled(true, "held by " + source, source));
    const auto before = locks->loadTradingDisabled();

    const auto s = breaker.recordRealizedPnl(-7.0, kDay1);
    assert(s.stopped);
    auto flag = locks->loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.source == source);
    assert(flag.reason == "held by " + source);
    assert(flag.version == before.version);

    assert(breaker.rolloverIfNewDay(kDay1 + kDayMs));
    flag = locks->loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.source == source);

    std::cout << "[TEST] " << source << " disable kept PASSED\n";
}

void testDisabledBreakerOnlyRecords() {
    TempDir dir("daily_disabled");
    auto locks = std::make_shared<core::LockStoreJson>(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    auto cfg = breakerConfig(dir);
    cfg.enabled = false;
    core::DailyLossBreaker breaker(cfg, locks);

    const auto s = breaker.recordRealizedPnl(-50.0, kDay1);
    assert(!s.stopped);
    assert(!locks->loadTradingDisabled().disabled);

    std::cout << "[TEST] disabled breaker PASSED\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting DailyLossBreaker Test..." << std::endl;

    testLossLimitDisablesTrading();
    testProfitTargetStopsAndWinResetsStreak();
    testRolloverReenablesOnlyOwnFlag();
    testForeignDisableSurvivesTripAndRollover(core::disable_source::kPanic);
    testForeignDisableSurvivesTripAndRollover(core::disable_source::kManual);
    testDisabledBreakerOnlyRecords();

    std::cout << "[TEST] DailyLossBreaker Test PASSED!" << std::endl;
    return 0;
}
