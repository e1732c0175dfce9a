#include "core/state/LockStoreJson.h"

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/model/RecordSchema.h"
#include "core/state/AtomicJsonFile.h"

namespace riskguard {
namespace core {

LockStoreJson::LockStoreJson(std::filesystem::path lock_path, std::filesystem::path disabled_path)
    : lock_path_(std::move(lock_path))
    , disabled_path_(std::move(disabled_path)) {}

PanicLock LockStoreJson::loadLock() {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadLockUnlocked();
}

PanicLock LockStoreJson::loadLockUnlocked() {
    const auto raw = readJsonFile(lock_path_);
    if (!raw.exists) {
        return PanicLock{};
    }
    if (raw.parse_failed || !raw.value.is_object()) {
        PanicLock corrupt;
        corrupt.armed = true;
        corrupt.reason = "unreadable lock record";
        return corrupt;
    }
    try {
        return lockFromJson(raw.value);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Lock record has invalid fields, treating as armed: {}", e.what());
        PanicLock corrupt;
        corrupt.armed = true;
        corrupt.reason = "invalid lock record";
        return corrupt;
    }
}

bool LockStoreJson::armLock(const std::string& reason, const PanicExecutionReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    // 잠그는 쪽은 프로세스 락 없이도 진행
    FileLockGuard file_lock(disabled_path_);

    // armed => disabled 불변식: 잠금보다 플래그를 먼저 기록
    const auto flag = loadDisabledUnlocked();
    if (!flag.disabled) {
        if (!writeDisabledUnlocked(true, reason, disable_source::kPanic)) {
            return false;
        }
    }

    const auto previous = loadLockUnlocked();

    PanicLock next;
    next.armed = true;
    next.armed_at_ms = common::nowMs();
    next.reason = reason;
    next.version = previous.version + 1;
    next.last_report = report;

    if (!writeJsonAtomically(lock_path_, toJson(next))) {
        return false;
    }
    LOG_INFO("Panic lock armed (v{}): {}", next.version, reason);
    return true;
}

bool LockStoreJson::clearLock() {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLockGuard file_lock(disabled_path_);
    if (!file_lock.locked()) {
        LOG_ERROR("Refusing to clear the panic lock without the store file lock");
        return false;
    }

    const auto previous = loadLockUnlocked();

    PanicLock next;
    next.armed = false;
    next.version = previous.version + 1;
    next.reason = "reset";
    next.last_report = previous.last_report;

    if (!writeJsonAtomically(lock_path_, toJson(next))) {
        return false;
    }
    LOG_INFO("Panic lock cleared (v{})", next.version);
    return true;
}

TradingDisabledFlag LockStoreJson::loadTradingDisabled() {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadDisabledUnlocked();
}

TradingDisabledFlag LockStoreJson::loadDisabledUnlocked() {
    const auto raw = readJsonFile(disabled_path_);
    if (!raw.exists) {
        return TradingDisabledFlag{};
    }
    if (raw.parse_failed || !raw.value.is_object()) {
        TradingDisabledFlag corrupt;
        corrupt.disabled = true;
        corrupt.reason = "unreadable trading-disabled record";
        return corrupt;
    }
    try {
        return disabledFlagFromJson(raw.value);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Trading-disabled record has invalid fields, treating as disabled: {}", e.what());
        TradingDisabledFlag corrupt;
        corrupt.disabled = true;
        corrupt.reason = "invalid trading-disabled record";
        return corrupt;
    }
}

bool LockStoreJson::setTradingDisabled(bool disabled, const std::string& reason, const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLockGuard file_lock(disabled_path_);
    if (!disabled && !file_lock.locked()) {
        LOG_ERROR("Refusing to enable trading without the store file lock");
        return false;
    }
    if (!disabled && loadLockUnlocked().armed) {
        LOG_WARN("Refusing to enable trading while the panic lock is armed");
        return false;
    }
    return writeDisabledUnlocked(disabled, reason, source);
}

bool LockStoreJson::disableTradingIfEnabled(const std::string& reason, const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLockGuard file_lock(disabled_path_);

    const auto current = loadDisabledUnlocked();
    if (current.disabled) {
        LOG_INFO("Trading already disabled by {} ({}), keeping it", current.source, current.reason);
        return true;
    }
    return writeDisabledUnlocked(true, reason, source);
}

bool LockStoreJson::clearTradingDisabledIfSource(const std::string& source, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLockGuard file_lock(disabled_path_);
    if (!file_lock.locked()) {
        LOG_ERROR("Refusing to enable trading without the store file lock");
        return false;
    }

    const auto current = loadDisabledUnlocked();
    if (!current.disabled) {
        return false;
    }
    if (current.source != source) {
        LOG_INFO("Trading stays disabled: owned by {} ({})", current.source, current.reason);
        return false;
    }
    if (loadLockUnlocked().armed) {
        LOG_WARN("Refusing to enable trading while the panic lock is armed");
        return false;
    }
    return writeDisabledUnlocked(false, reason, source);
}

bool LockStoreJson::writeDisabledUnlocked(bool disabled, const std::string& reason, const std::string& source) {
    const auto previous = loadDisabledUnlocked();

    TradingDisabledFlag next;
    next.disabled = disabled;
    next.reason = reason;
    next.source = source;
    next.updated_at_ms = common::nowMs();
    next.version = previous.version + 1;

    if (!writeJsonAtomically(disabled_path_, toJson(next))) {
        return false;
    }
    LOG_INFO("Trading {} by {}: {}", disabled ? "disabled" : "enabled", source, reason);
    return true;
}

} // namespace core
} // namespace riskguard
