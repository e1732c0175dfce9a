#pragma once

#include <filesystem>
#include <mutex>

#include "core/contracts/ILockStore.h"

namespace riskguard {
namespace core {

// state/panic.lock + state/trading_disabled.json
// 레코드를 읽을 수 없으면 잠긴 것으로 간주한다 (fail-locked).
// 쓰기 구간은 프로세스 내 mutex 와 trading_disabled.json.lock 의 flock 으로 보호한다.
class LockStoreJson : public ILockStore {
public:
    LockStoreJson(std::filesystem::path lock_path, std::filesystem::path disabled_path);

    PanicLock loadLock() override;
    bool armLock(const std::string& reason, const PanicExecutionReport& report) override;
    bool clearLock() override;

    TradingDisabledFlag loadTradingDisabled() override;
    bool setTradingDisabled(bool disabled, const std::string& reason, const std::string& source) override;
    bool disableTradingIfEnabled(const std::string& reason, const std::string& source) override;
    bool clearTradingDisabledIfSource(const std::string& source, const std::string& reason) override;

private:
    PanicLock loadLockUnlocked();
    TradingDisabledFlag loadDisabledUnlocked();
    bool writeDisabledUnlocked(bool disabled, const std::string& reason, const std::string& source);

    std::filesystem::path lock_path_;
    std::filesystem::path disabled_path_;
    std::mutex mutex_;
};

} // namespace core
} // namespace riskguard
