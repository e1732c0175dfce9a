#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/GuardConfig.h"
#include "core/contracts/IAlertSink.h"
#include "core/contracts/IExchangeGateway.h"
#include "core/contracts/ILockStore.h"
#include "core/contracts/IRunJournal.h"
#include "core/execution/PanicStateMachine.h"

namespace riskguard {
namespace core {

struct PanicStatus {
    PanicState state = PanicState::IDLE;
    bool running = false;
    PanicLock lock;
    TradingDisabledFlag trading_disabled;
    std::optional<PanicExecutionReport> last_report;
};

// 긴급 정지 오케스트레이터 (프로세스 내 단일 실행)
//   disable -> cancel -> flatten -> verify -> lock
// 어떤 결과로 끝나든 잠금을 건다. 해제는 reset() 으로만 가능.
class PanicOrchestrator {
public:
    PanicOrchestrator(
        std::shared_ptr<IExchangeGateway> gateway,
        std::shared_ptr<ILockStore> lock_store,
        std::shared_ptr<IRunJournal> journal,
        std::shared_ptr<IAlertSink> alerts,
        PanicConfig config,
        BackoffConfig backoff,
        std::vector<std::string> configured_symbols = {}
    );

    // IDLE 이 아니면 실행하지 않고 진행 중/마지막 보고서를 돌려준다
    TriggerOutcome trigger(const std::string& reason = "manual trigger");
    ResetOutcome reset();

    PanicStatus status();
    PanicState state() const { return fsm_.state(); }
    bool isRunning() const { return running_; }
    std::optional<PanicExecutionReport> lastReport() const;

private:
    void recoverFromStore();

    PanicExecutionReport execute(const std::string& reason);
    bool runCancelPhase();
    bool runFlattenPhase();
    bool runVerifyPhase();
    void closeOnePosition(const Position& position);
    void finish(PanicState terminal, const std::string& reason);

    void addWarning(const std::string& warning);
    void touchSymbol(const std::string& symbol);
    void deliverAlert(const char* what, bool delivered);

    std::shared_ptr<IExchangeGateway> gateway_;
    std::shared_ptr<ILockStore> lock_store_;
    std::shared_ptr<IRunJournal> journal_;
    std::shared_ptr<IAlertSink> alerts_;
    PanicConfig config_;
    BackoffConfig backoff_;
    std::vector<std::string> configured_symbols_;

    execution::PanicStateMachine fsm_;
    std::mutex run_mutex_;
    std::atomic<bool> running_{false};

    mutable std::mutex report_mutex_;
    PanicExecutionReport current_;
    std::set<std::string> touched_;
    std::optional<PanicExecutionReport> last_report_;
};

} // namespace core
} // namespace riskguard
