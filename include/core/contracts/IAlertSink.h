#pragma once

#include <string>

#include "core/model/PanicTypes.h"

namespace riskguard {
namespace core {

class IAlertSink {
public:
    virtual ~IAlertSink() = default;

    // 전송 실패 시 false. 알림 실패가 패닉 결과를 바꾸지는 않는다.
    virtual bool notifyPanicStarted(long long started_at_ms) = 0;
    virtual bool notifyPanicCompleted(const PanicExecutionReport& report) = 0;
    virtual bool notifyPanicFailed(const PanicExecutionReport& report) = 0;
    virtual bool notifyReset(bool success, const std::string& message) = 0;
};

} // namespace core
} // namespace riskguard
