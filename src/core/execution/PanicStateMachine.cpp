#include "core/execution/PanicStateMachine.h"

#include "core/model/Errors.h"
#include "core/model/RecordSchema.h"

namespace riskguard {
namespace core {
namespace execution {

namespace {
bool isWorkingPhase(PanicState state) {
    return state == PanicState::DISABLING || state == PanicState::CANCELING ||
           state == PanicState::FLATTENING || state == PanicState::VERIFYING;
}
} // namespace

PanicStateMachine::PanicStateMachine(PanicState initial)
    : state_(initial) {}

bool PanicStateMachine::canTransition(PanicState from, PanicState to) {
    switch (from) {
        case PanicState::IDLE:
            return to == PanicState::DISABLING;
        case PanicState::DISABLING:
            return to == PanicState::CANCELING || to == PanicState::FAILED_PARTIAL;
        case PanicState::CANCELING:
            return to == PanicState::FLATTENING || to == PanicState::FAILED_PARTIAL;
        case PanicState::FLATTENING:
            return to == PanicState::VERIFYING || to == PanicState::FAILED_PARTIAL;
        case PanicState::VERIFYING:
            return to == PanicState::LOCKED || to == PanicState::FAILED_PARTIAL;
        case PanicState::LOCKED:
        case PanicState::FAILED_PARTIAL:
            return to == PanicState::IDLE;
    }
    return false;
}

bool PanicStateMachine::isTerminal(PanicState state) {
    return state == PanicState::LOCKED || state == PanicState::FAILED_PARTIAL;
}

void PanicStateMachine::transition(PanicState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!canTransition(state_, to)) {
        throw InvalidTransition(std::string("illegal panic transition ") +
                                panicStateToString(state_) + " -> " + panicStateToString(to));
    }

    const auto now = std::chrono::steady_clock::now();
    if (phase_open_ && !timings_.empty()) {
        // 닫히지 않은 단계는 다음 상태로 성공 여부를 판단
        timings_.back().duration_sec = std::chrono::duration<double>(now - phase_started_).count();
        timings_.back().success = (to != PanicState::FAILED_PARTIAL);
        phase_open_ = false;
    }

    state_ = to;
    if (to == PanicState::IDLE) {
        timings_.clear();
        phase_open_ = false;
        return;
    }
    if (isWorkingPhase(to)) {
        PhaseTiming timing;
        timing.phase = panicStateToString(to);
        timings_.push_back(timing);
        phase_open_ = true;
        phase_started_ = now;
    }
}

void PanicStateMachine::restore(PanicState state) {
    if (state != PanicState::IDLE && !isTerminal(state)) {
        throw InvalidTransition(std::string("cannot restore into working phase ") + panicStateToString(state));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    timings_.clear();
    phase_open_ = false;
}

void PanicStateMachine::closePhase(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!phase_open_ || timings_.empty()) {
        return;
    }
    auto& timing = timings_.back();
    timing.duration_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - phase_started_).count();
    timing.success = success;
    phase_open_ = false;
}

std::vector<PhaseTiming> PanicStateMachine::phaseTimings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timings_;
}

PanicState PanicStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace execution
} // namespace core
} // namespace riskguard
