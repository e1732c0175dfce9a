#pragma once

#include <string>

#include "core/model/PanicTypes.h"

namespace riskguard {
namespace core {

// 알림 본문 (Telegram / 로그 공용)
class AlertMessages {
public:
    static std::string panicStarted(const std::string& bot_name, long long started_at_ms);
    static std::string panicCompleted(const std::string& bot_name, const PanicExecutionReport& report);
    static std::string panicFailed(const std::string& bot_name, const PanicExecutionReport& report);
    static std::string reset(const std::string& bot_name, bool success, const std::string& message, long long now_ms);

    static std::string phaseTimings(const PanicExecutionReport& report);
    // 50자를 넘으면 "N symbols" 로 축약
    static std::string symbolSummary(const PanicExecutionReport& report);
};

} // namespace core
} // namespace riskguard
