#pragma once

#include <string>

#include "core/model/PanicTypes.h"

namespace riskguard {
namespace core {

// 패닉 잠금 + 거래 중지 플래그. armed 이면 항상 disabled 여야 한다.
class ILockStore {
public:
    virtual ~ILockStore() = default;

    virtual PanicLock loadLock() = 0;
    // 쓰기 전에 거래 중지 플래그도 켠다
    virtual bool armLock(const std::string& reason, const PanicExecutionReport& report) = 0;
    virtual bool clearLock() = 0;

    virtual TradingDisabledFlag loadTradingDisabled() = 0;
    virtual bool setTradingDisabled(bool disabled, const std::string& reason, const std::string& source) = 0;
    // 이미 중지 상태면 기존 사유/출처를 그대로 둔다. 호출 후 중지 상태이면 true
    virtual bool disableTradingIfEnabled(const std::string& reason, const std::string& source) = 0;
    // 현재 출처가 source 이고 잠금이 해제된 경우에만 허용으로 바꾼다 (검사와 쓰기가 한 잠금 구간)
    virtual bool clearTradingDisabledIfSource(const std::string& source, const std::string& reason) = 0;
};

} // namespace core
} // namespace riskguard
