#include "core/state/LockStoreJson.h"
#include "support/TempDir.h"

#include <cassert>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace riskguard;
using riskguard::testing::TempDir;

namespace {

void testArmAndClear() {
    TempDir dir("lockstore_arm");
    core::LockStoreJson store(dir.file("panic.lock"), dir.file("trading_disabled.json"));

    assert(!store.loadLock().armed);
    assert(!store.loadTradingDisabled().disabled);

    core::PanicExecutionReport report;
    report.final_state = core::PanicState::LOCKED;
    report.success = true;
    report.orders_canceled = 2;
    report.symbols_touched = {"BTCUSDT"};
    assert(store.armLock("manual", report));

    const auto lock = store.loadLock();
    assert(lock.armed);
    assert(lock.reason == "manual");
    assert(lock.version == 1);
    assert(lock.armed_at_ms > 0);
    assert(lock.last_report.has_value());
    assert(lock.last_report->orders_canceled == 2);
    assert(lock.last_report->final_state == core::PanicState::LOCKED);

    // armed => disabled
    const auto flag = store.loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.source == core::disable_source::kPanic);

    // 잠금 중에는 거래 재개 불가
    assert(!store.setTradingDisabled(false, "too early", core::disable_source::kManual));
    assert(store.loadTradingDisabled().disabled);

    assert(store.clearLock());
    const auto cleared = store.loadLock();
    assert(!cleared.armed);
    assert(cleared.version == 2);
    assert(cleared.last_report.has_value());
    assert(store.loadTradingDisabled().disabled);

    assert(store.setTradingDisabled(false, "reset", core::disable_source::kPanic));
    assert(!store.loadTradingDisabled().disabled);

    std::cout << "[TEST] arm and clear PASSED\n";
}

void testCorruptRecordsFailLocked() {
    TempDir dir("lockstore_corrupt");
    const auto lock_path = dir.file("panic.lock");
    const auto flag_path = dir.file("trading_disabled.json");
    {
        std::ofstream out(lock_path);
        out << "{\"armed\": fal";
    }
    {
        std::ofstream out(flag_path);
        out << "garbage";
    }

    core::LockStoreJson store(lock_path, flag_path);
    assert(store.loadLock().armed);
    assert(store.loadTradingDisabled().disabled);

    std::cout << "[TEST] corrupt records fail locked PASSED\n";
}

void testSharedBetweenInstances() {
    TempDir dir("lockstore_shared");
    core::LockStoreJson writer(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    core::LockStoreJson reader(dir.file("panic.lock"), dir.file("trading_disabled.json"));

    assert(writer.setTradingDisabled(true, "daily loss", core::disable_source::kDailyLoss));
    const auto flag = reader.loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.reason == "daily loss");
    assert(flag.source == core::disable_source::kDailyLoss);
    assert(flag.version == 1);

    assert(writer.armLock("panic", core::PanicExecutionReport{}));
    assert(reader.loadLock().armed);

    std::cout << "[TEST] shared between instances PASSED\n";
}

void testConditionalFlagTransitions() {
    TempDir dir("lockstore_conditional");
    core::LockStoreJson store(dir.file("panic.lock"), dir.file("trading_disabled.json"));

    // 해제 상태에서는 아무것도 하지 않음
    assert(!store.clearTradingDisabledIfSource(core::disable_source::kDailyLoss, "new day"));
    assert(store.loadTradingDisabled().version == 0);

    assert(store.disableTradingIfEnabled("operator", core::disable_source::kManual));
    assert(store.disableTradingIfEnabled("loss limit", core::disable_source::kDailyLoss));
    auto flag = store.loadTradingDisabled();
    assert(flag.source == core::disable_source::kManual);
    assert(flag.version == 1);

    assert(!store.clearTradingDisabledIfSource(core::disable_source::kDailyLoss, "new day"));
    assert(store.loadTradingDisabled().disabled);

    assert(store.setTradingDisabled(true, "loss limit", core::disable_source::kDailyLoss));
    assert(store.armLock("panic", core::PanicExecutionReport{}));
    assert(!store.clearTradingDisabledIfSource(core::disable_source::kDailyLoss, "new day"));
    assert(store.clearLock());
    assert(store.clearTradingDisabledIfSource(core::disable_source::kDailyLoss, "new day"));
    flag = store.loadTradingDisabled();
    assert(!flag.disabled);
    assert(flag.reason == "new day");
    assert(std::filesystem::exists(dir.file("trading_disabled.json.lock")));

    std::cout << "[TEST] conditional flag transitions PASSED\n";
}

// 인스턴스마다 mutex 가 따로라서 직렬화는 파일 락에만 의존한다
void testConcurrentDisableKeepsFirstSource() {
    TempDir dir("lockstore_concurrent");
    const std::vector<std::string> sources = {
        core::disable_source::kPanic, core::disable_source::kDailyLoss, core::disable_source::kManual,
        core::disable_source::kPanic, core::disable_source::kDailyLoss, core::disable_source::kManual};

    std::vector<std::thread> threads;
    for (const auto& source : sources) {
        threads.emplace_back([&dir, source]() {
            core::LockStoreJson store(dir.file("panic.lock"), dir.file("trading_disabled.json"));
            const bool ok = store.disableTradingIfEnabled("by " + source, source);
            assert(ok);
            (void)ok;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    core::LockStoreJson reader(dir.file("panic.lock"), dir.file("trading_disabled.json"));
    const auto flag = reader.loadTradingDisabled();
    assert(flag.disabled);
    assert(flag.version == 1);
    assert(flag.reason == "by " + flag.source);

    std::cout << "[TEST] concurrent disable PASSED\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting LockStore Test..." << std::endl;

    testArmAndClear();
    testCorruptRecordsFailLocked();
    testSharedBetweenInstances();
    testConditionalFlagTransitions();
    testConcurrentDisableKeepsFirstSource();

    std::cout << "[TEST] LockStore Test PASSED!" << std::endl;
    return 0;
}
