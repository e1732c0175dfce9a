#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace riskguard {
namespace core {

enum class PanicState {
    IDLE,
    DISABLING,
    CANCELING,
    FLATTENING,
    VERIFYING,
    LOCKED,
    FAILED_PARTIAL
};

struct PhaseTiming {
    std::string phase;
    double duration_sec = 0.0;
    bool success = false;
};

struct PanicExecutionReport {
    long long started_at_ms = 0;
    long long ended_at_ms = 0;
    bool success = false;
    PanicState final_state = PanicState::IDLE;
    int orders_canceled = 0;
    int positions_closed = 0;
    std::vector<std::string> symbols_touched;
    std::vector<PhaseTiming> phase_timings;
    std::vector<std::string> warnings;
    std::vector<Position> remaining_positions;
    std::vector<OpenOrder> remaining_orders;
    bool locked = false;
    double total_duration_sec = 0.0;
    std::string error_message;
};

struct PanicLock {
    bool armed = false;
    long long armed_at_ms = 0;
    std::string reason;
    std::uint64_t version = 0;
    std::optional<PanicExecutionReport> last_report;
};

// 패닉 잠금과 별개로 일일 손실 차단기 등이 설정할 수 있는 플래그
struct TradingDisabledFlag {
    bool disabled = false;
    std::string reason;
    std::string source;
    long long updated_at_ms = 0;
    std::uint64_t version = 0;
};

namespace disable_source {
constexpr const char* kPanic = "panic";
constexpr const char* kDailyLoss = "daily_loss_breaker";
constexpr const char* kManual = "manual";
}

struct TriggerOutcome {
    // false: 이미 실행 중이거나 잠긴 상태 (중복 실행 없음)
    bool accepted = false;
    PanicState state = PanicState::IDLE;
    PanicExecutionReport report;
};

enum class ResetCode {
    OK,
    NOT_ARMED,
    RUN_IN_PROGRESS,
    NOT_FLAT,
    GATEWAY_UNAVAILABLE,
    STORE_WRITE_FAILED
};

struct ResetOutcome {
    ResetCode code = ResetCode::OK;
    std::string message;
    int positions_remaining = 0;
    int orders_remaining = 0;

    bool ok() const { return code == ResetCode::OK; }
};

} // namespace core
} // namespace riskguard
