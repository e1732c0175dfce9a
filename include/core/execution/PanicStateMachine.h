#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "core/model/PanicTypes.h"

namespace riskguard {
namespace core {
namespace execution {

// IDLE -> DISABLING -> CANCELING -> FLATTENING -> VERIFYING -> LOCKED
// DISABLING..VERIFYING -> FAILED_PARTIAL, LOCKED/FAILED_PARTIAL -> IDLE (reset)
class PanicStateMachine {
public:
    explicit PanicStateMachine(PanicState initial = PanicState::IDLE);

    static bool canTransition(PanicState from, PanicState to);
    static bool isTerminal(PanicState state);

    // 전이표에 없으면 InvalidTransition
    void transition(PanicState to);

    // 재시작 시 저장된 잠금 상태 복원. IDLE 이나 종료 상태만 허용
    void restore(PanicState state);

    // 진행 중인 단계의 소요 시간을 기록하고 닫는다
    void closePhase(bool success);
    std::vector<PhaseTiming> phaseTimings() const;

    PanicState state() const;

private:
    mutable std::mutex mutex_;
    PanicState state_;
    std::vector<PhaseTiming> timings_;
    bool phase_open_ = false;
    std::chrono::steady_clock::time_point phase_started_;
};

} // namespace execution
} // namespace core
} // namespace riskguard
