#include "core/execution/PanicStateMachine.h"
#include "core/model/Errors.h"

#include <cassert>
#include <iostream>

using namespace riskguard;
using core::PanicState;
using core::execution::PanicStateMachine;

namespace {

bool throwsInvalid(PanicStateMachine& fsm, PanicState to) {
    try {
        fsm.transition(to);
    } catch (const InvalidTransition&) {
        return true;
    }
    return false;
}

void testTransitionTable() {
    assert(PanicStateMachine::canTransition(PanicState::IDLE, PanicState::DISABLING));
    assert(!PanicStateMachine::canTransition(PanicState::IDLE, PanicState::LOCKED));
    assert(!PanicStateMachine::canTransition(PanicState::IDLE, PanicState::FAILED_PARTIAL));
    assert(PanicStateMachine::canTransition(PanicState::DISABLING, PanicState::CANCELING));
    assert(!PanicStateMachine::canTransition(PanicState::DISABLING, PanicState::FLATTENING));
    assert(PanicStateMachine::canTransition(PanicState::CANCELING, PanicState::FAILED_PARTIAL));
    assert(PanicStateMachine::canTransition(PanicState::FLATTENING, PanicState::VERIFYING));
    assert(PanicStateMachine::canTransition(PanicState::VERIFYING, PanicState::LOCKED));
    assert(!PanicStateMachine::canTransition(PanicState::LOCKED, PanicState::DISABLING));
    assert(PanicStateMachine::canTransition(PanicState::LOCKED, PanicState::IDLE));
    assert(PanicStateMachine::canTransition(PanicState::FAILED_PARTIAL, PanicState::IDLE));
    assert(!PanicStateMachine::canTransition(PanicState::FAILED_PARTIAL, PanicState::LOCKED));

    assert(PanicStateMachine::isTerminal(PanicState::LOCKED));
    assert(PanicStateMachine::isTerminal(PanicState::FAILED_PARTIAL));
    assert(!PanicStateMachine::isTerminal(PanicState::VERIFYING));

    std::cout << "[TEST] transition table PASSED\n";
}

void testHappyPathTimings() {
    PanicStateMachine fsm;
    fsm.transition(PanicState::DISABLING);
    fsm.closePhase(true);
    fsm.transition(PanicState::CANCELING);
    fsm.transition(PanicState::FLATTENING);
    fsm.closePhase(false);
    fsm.transition(PanicState::VERIFYING);
    fsm.transition(PanicState::LOCKED);

    const auto timings = fsm.phaseTimings();
    assert(timings.size() == 4);
    assert(timings[0].phase == "DISABLING" && timings[0].success);
    // 열린 단계는 다음 전이로 닫힌다
    assert(timings[1].phase == "CANCELING" && timings[1].success);
    assert(timings[2].phase == "FLATTENING" && !timings[2].success);
    assert(timings[3].phase == "VERIFYING" && timings[3].success);
    for (const auto& t : timings) {
        assert(t.duration_sec >= 0.0);
    }

    assert(throwsInvalid(fsm, PanicState::DISABLING));
    assert(fsm.state() == PanicState::LOCKED);

    fsm.transition(PanicState::IDLE);
    assert(fsm.phaseTimings().empty());

    std::cout << "[TEST] happy path timings PASSED\n";
}

void testFailureFromAnyWorkingPhase() {
    const PanicState working[] = {
        PanicState::DISABLING, PanicState::CANCELING, PanicState::FLATTENING, PanicState::VERIFYING
    };
    for (std::size_t stop_at = 0; stop_at < 4; ++stop_at) {
        PanicStateMachine fsm;
        for (std::size_t i = 0; i <= stop_at; ++i) {
            fsm.transition(working[i]);
        }
        fsm.transition(PanicState::FAILED_PARTIAL);
        assert(fsm.state() == PanicState::FAILED_PARTIAL);
        assert(!fsm.phaseTimings().back().success);
    }

    std::cout << "[TEST] failure from working phase PASSED\n";
}

void testRestore() {
    PanicStateMachine fsm;
    fsm.restore(PanicState::LOCKED);
    assert(fsm.state() == PanicState::LOCKED);
    assert(throwsInvalid(fsm, PanicState::DISABLING));

    bool threw = false;
    try {
        fsm.restore(PanicState::CANCELING);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    assert(threw);
    assert(fsm.state() == PanicState::LOCKED);

    std::cout << "[TEST] restore PASSED\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PanicStateMachine Test..." << std::endl;

    testTransitionTable();
    testHappyPathTimings();
    testFailureFromAnyWorkingPhase();
    testRestore();

    std::cout << "[TEST] PanicStateMachine Test PASSED!" << std::endl;
    return 0;
}
