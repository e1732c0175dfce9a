#include "core/orchestration/PanicOrchestrator.h"

#include "common/BoundedParallel.h"
#include "common/Logger.h"
#include "common/QtyStepHelper.h"
#include "common/TimeUtils.h"
#include "core/execution/RetryPolicy.h"
#include "core/model/Errors.h"
#include "core/model/RecordSchema.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

namespace riskguard {
namespace core {

namespace {
std::string describePosition(const Position& p) {
    std::ostringstream oss;
    oss << p.symbol << " " << positionSideToString(p.side) << " size=" << p.size;
    return oss.str();
}

std::vector<Position> livePositions(const std::vector<Position>& positions) {
    std::vector<Position> out;
    for (const auto& p : positions) {
        if (p.size > 0.0) {
            out.push_back(p);
        }
    }
    return out;
}
} // namespace

PanicOrchestrator::PanicOrchestrator(
    std::shared_ptr<IExchangeGateway> gateway,
    std::shared_ptr<ILockStore> lock_store,
    std::shared_ptr<IRunJournal> journal,
    std::shared_ptr<IAlertSink> alerts,
    PanicConfig config,
    BackoffConfig backoff,
    std::vector<std::string> configured_symbols
)
    : gateway_(std::move(gateway))
    , lock_store_(std::move(lock_store))
    , journal_(std::move(journal))
    , alerts_(std::move(alerts))
    , config_(std::move(config))
    , backoff_(backoff)
    , configured_symbols_(std::move(configured_symbols)) {
    recoverFromStore();
}

void PanicOrchestrator::recoverFromStore() {
    const auto lock = lock_store_->loadLock();
    if (lock.armed) {
        const bool failed = lock.last_report.has_value() && !lock.last_report->success;
        fsm_.restore(failed ? PanicState::FAILED_PARTIAL : PanicState::LOCKED);
        last_report_ = lock.last_report;
        LOG_WARN("Panic lock is armed on disk (v{}, reason: {}); starting in {}",
                 lock.version, lock.reason, panicStateToString(fsm_.state()));
        return;
    }

    const auto flag = lock_store_->loadTradingDisabled();
    if (flag.disabled && flag.source == disable_source::kPanic) {
        LOG_ERROR("Trading disabled by panic without an armed lock: a previous run was interrupted. "
                  "Trading stays disabled until an operator runs reset or triggers a new run");
    }
    if (lock.last_report.has_value()) {
        last_report_ = lock.last_report;
    }
}

TriggerOutcome PanicOrchestrator::trigger(const std::string& reason) {
    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        TriggerOutcome outcome;
        outcome.accepted = false;
        outcome.state = fsm_.state();
        std::lock_guard<std::mutex> lock(report_mutex_);
        outcome.report = current_;
        LOG_WARN("Panic trigger ignored: a run is already in flight ({})", panicStateToString(outcome.state));
        return outcome;
    }

    if (fsm_.state() != PanicState::IDLE) {
        TriggerOutcome outcome;
        outcome.accepted = false;
        outcome.state = fsm_.state();
        std::lock_guard<std::mutex> lock(report_mutex_);
        if (last_report_.has_value()) {
            outcome.report = *last_report_;
        }
        LOG_WARN("Panic trigger ignored: already {}", panicStateToString(outcome.state));
        return outcome;
    }

    running_ = true;
    PanicExecutionReport report;
    try {
        report = execute(reason);
    } catch (const std::exception& e) {
        // 단계 밖에서 예기치 않은 예외: 잠금 없이 끝내지 않는다
        LOG_ERROR("Panic run aborted by unexpected error: {}", e.what());
        {
            std::lock_guard<std::mutex> lock(report_mutex_);
            current_.error_message = e.what();
        }
        if (!execution::PanicStateMachine::isTerminal(fsm_.state())) {
            finish(PanicState::FAILED_PARTIAL, reason);
        }
        std::lock_guard<std::mutex> lock(report_mutex_);
        report = current_;
    }
    running_ = false;

    TriggerOutcome outcome;
    outcome.accepted = true;
    outcome.state = fsm_.state();
    outcome.report = report;
    return outcome;
}

PanicExecutionReport PanicOrchestrator::execute(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        current_ = PanicExecutionReport{};
        current_.started_at_ms = common::nowMs();
        touched_.clear();
    }

    LOG_WARN("========================================");
    LOG_WARN("PANIC triggered: {}", reason);
    LOG_WARN("========================================");

    // 거래소 호출과 알림 전에 거래 중지 플래그를 먼저 기록
    const bool flag_persisted = lock_store_->setTradingDisabled(true, "panic: " + reason, disable_source::kPanic);
    fsm_.transition(PanicState::DISABLING);

    if (!flag_persisted) {
        LOG_ERROR("Could not persist trading-disabled flag; no exchange call will be made");
        {
            std::lock_guard<std::mutex> lock(report_mutex_);
            current_.error_message = "failed to persist trading-disabled flag";
        }
        fsm_.closePhase(false);
        finish(PanicState::FAILED_PARTIAL, reason);
        std::lock_guard<std::mutex> lock(report_mutex_);
        return current_;
    }

    try {
        deliverAlert("panic started", alerts_->notifyPanicStarted(current_.started_at_ms));
    } catch (const std::exception& e) {
        addWarning(std::string("alert delivery failed (panic started): ") + e.what());
    }
    fsm_.closePhase(true);

    fsm_.transition(PanicState::CANCELING);
    if (!runCancelPhase()) {
        finish(PanicState::FAILED_PARTIAL, reason);
        std::lock_guard<std::mutex> lock(report_mutex_);
        return current_;
    }

    fsm_.transition(PanicState::FLATTENING);
    if (!runFlattenPhase()) {
        finish(PanicState::FAILED_PARTIAL, reason);
        std::lock_guard<std::mutex> lock(report_mutex_);
        return current_;
    }

    fsm_.transition(PanicState::VERIFYING);
    const bool verified = runVerifyPhase();
    finish(verified ? PanicState::LOCKED : PanicState::FAILED_PARTIAL, reason);

    std::lock_guard<std::mutex> lock(report_mutex_);
    return current_;
}

bool PanicOrchestrator::runCancelPhase() {
    std::vector<OpenOrder> orders;
    try {
        orders = execution::callWithRetry(backoff_, "list open orders", [this]() {
            return gateway_->listOpenOrders();
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Gateway unreachable while listing open orders: {}", e.what());
        std::lock_guard<std::mutex> lock(report_mutex_);
        current_.error_message = std::string("gateway unreachable (list open orders): ") + e.what();
        fsm_.closePhase(false);
        return false;
    }

    std::set<std::string> symbol_set(configured_symbols_.begin(), configured_symbols_.end());
    for (const auto& order : orders) {
        symbol_set.insert(order.symbol);
    }
    const std::vector<std::string> symbols(symbol_set.begin(), symbol_set.end());
    LOG_INFO("Canceling {} open order(s) across {} symbol(s)", orders.size(), symbols.size());

    std::atomic<int> failures{0};
    common::forEachBounded(symbols, static_cast<std::size_t>(config_.worker_threads),
        [this, &failures](const std::string& symbol) {
            try {
                const int canceled = execution::callWithRetry(backoff_, "cancel orders " + symbol, [this, &symbol]() {
                    return gateway_->cancelAllOrders(symbol);
                });
                Logger::getInstance().logAudit("cancel_all", symbol, "", canceled, "ok");
                std::lock_guard<std::mutex> lock(report_mutex_);
                current_.orders_canceled += canceled;
                if (canceled > 0) {
                    touched_.insert(symbol);
                }
            } catch (const std::exception& e) {
                ++failures;
                Logger::getInstance().logAudit("cancel_all", symbol, "", 0, std::string("error: ") + e.what());
                addWarning("cancel failed for " + symbol + ": " + e.what());
            }
        });

    fsm_.closePhase(failures == 0);
    return true;
}

bool PanicOrchestrator::runFlattenPhase() {
    std::vector<Position> positions;
    try {
        positions = livePositions(execution::callWithRetry(backoff_, "list positions", [this]() {
            return gateway_->listPositions();
        }));
    } catch (const std::exception& e) {
        LOG_ERROR("Gateway unreachable while listing positions: {}", e.what());
        std::lock_guard<std::mutex> lock(report_mutex_);
        current_.error_message = std::string("gateway unreachable (list positions): ") + e.what();
        fsm_.closePhase(false);
        return false;
    }

    LOG_INFO("Flattening {} position(s)", positions.size());

    const std::size_t warnings_before = [this]() {
        std::lock_guard<std::mutex> lock(report_mutex_);
        return current_.warnings.size();
    }();

    common::forEachBounded(positions, static_cast<std::size_t>(config_.worker_threads),
        [this](const Position& position) {
            try {
                closeOnePosition(position);
            } catch (const std::exception& e) {
                Logger::getInstance().logAudit("close", position.symbol,
                                               orderSideToString(closingSide(position.side)),
                                               position.size, std::string("error: ") + e.what());
                addWarning("close failed for " + position.symbol + ": " + e.what());
            }
        });

    std::lock_guard<std::mutex> lock(report_mutex_);
    fsm_.closePhase(current_.warnings.size() == warnings_before);
    return true;
}

void PanicOrchestrator::closeOnePosition(const Position& position) {
    const std::string& symbol = position.symbol;
    const OrderSide side = closingSide(position.side);
    touchSymbol(symbol);

    InstrumentSpec spec;
    spec.symbol = symbol;
    try {
        spec = execution::callWithRetry(backoff_, "instrument spec " + symbol, [this, &symbol]() {
            return gateway_->getInstrumentSpec(symbol);
        });
    } catch (const std::exception& e) {
        // 거래소 보고 수량은 이미 거래소 정밀도이므로 그대로 시도
        LOG_WARN("Instrument spec unavailable for {}, using live size as-is: {}", symbol, e.what());
    }

    Quantity qty = common::roundDownToStep(position.size, spec.qty_step);
    if (qty <= 0.0 || common::isBelowMinQty(qty, spec.min_qty)) {
        addWarning("position " + describePosition(position) + " is below the minimum order quantity, skipped");
        return;
    }

    const auto submit = [this, &symbol, side](Quantity q) {
        return execution::callWithRetry(backoff_, "close " + symbol, [this, &symbol, side, q]() {
            return gateway_->placeReduceOnlyMarket(symbol, side, q);
        });
    };

    try {
        const std::string order_id = submit(qty);
        Logger::getInstance().logAudit("close", symbol, orderSideToString(side), qty, "ok " + order_id);
        std::lock_guard<std::mutex> lock(report_mutex_);
        current_.positions_closed++;
        return;
    } catch (const PrecisionError& e) {
        LOG_WARN("Precision rejected for {} qty={}: {}. Re-fetching live size and step", symbol, qty, e.what());
        Logger::getInstance().logAudit("close", symbol, orderSideToString(side), qty,
                                       std::string("precision: ") + e.what());
    }

    // 한 번만 보정 후 재시도
    const auto refreshed = livePositions(execution::callWithRetry(backoff_, "list positions", [this]() {
        return gateway_->listPositions();
    }));
    const auto it = std::find_if(refreshed.begin(), refreshed.end(), [&position](const Position& p) {
        return p.symbol == position.symbol && p.side == position.side;
    });
    if (it == refreshed.end()) {
        LOG_INFO("{} {} already flat after precision rejection", symbol, positionSideToString(position.side));
        return;
    }

    const InstrumentSpec fresh_spec = execution::callWithRetry(backoff_, "instrument spec " + symbol, [this, &symbol]() {
        return gateway_->getInstrumentSpec(symbol);
    });
    const Quantity adjusted = common::roundDownToStep(it->size, fresh_spec.qty_step);
    if (adjusted <= 0.0 || common::isBelowMinQty(adjusted, fresh_spec.min_qty)) {
        addWarning("position " + describePosition(*it) + " cannot be expressed at the instrument step, skipped");
        return;
    }

    try {
        const std::string order_id = submit(adjusted);
        Logger::getInstance().logAudit("close", symbol, orderSideToString(side), adjusted, "ok " + order_id);
        std::lock_guard<std::mutex> lock(report_mutex_);
        current_.positions_closed++;
    } catch (const PrecisionError& e) {
        Logger::getInstance().logAudit("close", symbol, orderSideToString(side), adjusted,
                                       std::string("precision: ") + e.what());
        addWarning("precision error persists for " + symbol + " after adjustment (qty=" +
                   common::qtyToString(adjusted, fresh_spec.qty_step) + "), skipped: " + e.what());
    }
}

bool PanicOrchestrator::runVerifyPhase() {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.verify_timeout_sec);
    const auto poll = std::chrono::milliseconds(config_.verify_poll_ms);

    std::vector<Position> remaining_positions;
    std::vector<OpenOrder> remaining_orders;
    bool any_poll_succeeded = false;
    std::string last_error;

    while (true) {
        try {
            auto positions = livePositions(gateway_->listPositions());
            auto orders = gateway_->listOpenOrders();
            any_poll_succeeded = true;
            remaining_positions = std::move(positions);
            remaining_orders = std::move(orders);
            if (remaining_positions.empty() && remaining_orders.empty()) {
                LOG_INFO("Verification passed: no positions and no open orders");
                std::lock_guard<std::mutex> lock(report_mutex_);
                current_.remaining_positions.clear();
                current_.remaining_orders.clear();
                fsm_.closePhase(true);
                return true;
            }
        } catch (const std::exception& e) {
            // 조회 실패는 "아직 확인 안 됨"
            last_error = e.what();
        }

        if (std::chrono::steady_clock::now() + poll > deadline) {
            break;
        }
        std::this_thread::sleep_for(poll);
    }

    LOG_ERROR("Verification timed out after {}s: {} position(s), {} order(s) remain",
              config_.verify_timeout_sec, remaining_positions.size(), remaining_orders.size());

    std::set<std::string> stuck;
    for (const auto& p : remaining_positions) {
        stuck.insert(p.symbol);
        addWarning("stuck position after verify timeout: " + describePosition(p));
    }
    for (const auto& o : remaining_orders) {
        stuck.insert(o.symbol);
        addWarning("stuck order after verify timeout: " + o.symbol + " " + o.order_id);
    }
    if (!any_poll_succeeded) {
        addWarning("verification could not query the exchange: " + last_error);
    }

    std::lock_guard<std::mutex> lock(report_mutex_);
    current_.remaining_positions = remaining_positions;
    current_.remaining_orders = remaining_orders;
    for (const auto& s : stuck) {
        touched_.insert(s);
    }
    if (current_.error_message.empty()) {
        current_.error_message = any_poll_succeeded ? "verification timed out with exposure remaining"
                                                    : "verification could not query the exchange";
    }
    fsm_.closePhase(false);
    return false;
}

void PanicOrchestrator::finish(PanicState terminal, const std::string& reason) {
    fsm_.transition(terminal);

    PanicExecutionReport snapshot;
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        current_.final_state = terminal;
        current_.success = (terminal == PanicState::LOCKED);
        current_.ended_at_ms = common::nowMs();
        current_.total_duration_sec = static_cast<double>(current_.ended_at_ms - current_.started_at_ms) / 1000.0;
        current_.symbols_touched.assign(touched_.begin(), touched_.end());
        current_.phase_timings = fsm_.phaseTimings();
        current_.locked = true;
        snapshot = current_;
    }

    if (!lock_store_->armLock(reason, snapshot)) {
        // 메모리 상태는 이미 종료 상태이므로 trigger 는 계속 거부된다
        LOG_ERROR("Failed to persist panic lock; lock is held in memory only");
        addWarning("panic lock could not be persisted; held in memory only");
    }

    try {
        if (terminal == PanicState::LOCKED) {
            deliverAlert("panic completed", alerts_->notifyPanicCompleted(snapshot));
        } else {
            deliverAlert("panic failed", alerts_->notifyPanicFailed(snapshot));
        }
    } catch (const std::exception& e) {
        addWarning(std::string("alert delivery failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        snapshot = current_;
    }
    if (!journal_->append(snapshot)) {
        LOG_ERROR("Failed to append panic report to the run journal");
        addWarning("run journal append failed");
    }

    std::lock_guard<std::mutex> lock(report_mutex_);
    last_report_ = current_;

    if (terminal == PanicState::LOCKED) {
        LOG_WARN("PANIC complete: LOCKED (canceled={}, closed={}, {:.2f}s)",
                 current_.orders_canceled, current_.positions_closed, current_.total_duration_sec);
    } else {
        LOG_ERROR("PANIC ended FAILED_PARTIAL (canceled={}, closed={}, warnings={}): {}",
                  current_.orders_canceled, current_.positions_closed,
                  current_.warnings.size(), current_.error_message);
    }
}

ResetOutcome PanicOrchestrator::reset() {
    ResetOutcome outcome;

    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        outcome.code = ResetCode::RUN_IN_PROGRESS;
        outcome.message = "a panic run is in progress";
        return outcome;
    }

    const auto lock = lock_store_->loadLock();
    const bool memory_locked = execution::PanicStateMachine::isTerminal(fsm_.state());
    if (!lock.armed && !memory_locked) {
        outcome.code = ResetCode::NOT_ARMED;
        outcome.message = "panic lock is not armed";
        return outcome;
    }

    std::vector<Position> positions;
    std::vector<OpenOrder> orders;
    try {
        positions = livePositions(execution::callWithRetry(backoff_, "reset: list positions", [this]() {
            return gateway_->listPositions();
        }));
        orders = execution::callWithRetry(backoff_, "reset: list open orders", [this]() {
            return gateway_->listOpenOrders();
        });
    } catch (const std::exception& e) {
        outcome.code = ResetCode::GATEWAY_UNAVAILABLE;
        outcome.message = std::string("cannot verify account state: ") + e.what();
        LOG_ERROR("Reset rejected: {}", outcome.message);
        return outcome;
    }

    outcome.positions_remaining = static_cast<int>(positions.size());
    outcome.orders_remaining = static_cast<int>(orders.size());
    if (!positions.empty() || !orders.empty()) {
        outcome.code = ResetCode::NOT_FLAT;
        outcome.message = "account is not flat: " + std::to_string(positions.size()) + " position(s), " +
                          std::to_string(orders.size()) + " open order(s)";
        LOG_WARN("Reset rejected: {}", outcome.message);
        try {
            alerts_->notifyReset(false, outcome.message);
        } catch (const std::exception& e) {
            LOG_WARN("Reset alert failed: {}", e.what());
        }
        return outcome;
    }

    // 잠금 해제 후 거래 중지 플래그 해제 (armed => disabled 유지)
    if (!lock_store_->clearLock()) {
        outcome.code = ResetCode::STORE_WRITE_FAILED;
        outcome.message = "failed to clear panic lock";
        return outcome;
    }
    if (!lock_store_->setTradingDisabled(false, "panic reset", disable_source::kPanic)) {
        outcome.code = ResetCode::STORE_WRITE_FAILED;
        outcome.message = "panic lock cleared but trading-disabled flag could not be cleared";
        LOG_ERROR("{}", outcome.message);
        return outcome;
    }

    if (memory_locked) {
        fsm_.transition(PanicState::IDLE);
    }
    outcome.code = ResetCode::OK;
    outcome.message = "panic lock cleared, trading enabled";
    LOG_WARN("Panic reset: {}", outcome.message);

    try {
        if (!alerts_->notifyReset(true, outcome.message)) {
            LOG_WARN("Reset alert was not delivered");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Reset alert failed: {}", e.what());
    }
    return outcome;
}

PanicStatus PanicOrchestrator::status() {
    PanicStatus s;
    s.state = fsm_.state();
    s.running = running_;
    s.lock = lock_store_->loadLock();
    s.trading_disabled = lock_store_->loadTradingDisabled();
    s.last_report = lastReport();
    return s;
}

std::optional<PanicExecutionReport> PanicOrchestrator::lastReport() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

void PanicOrchestrator::addWarning(const std::string& warning) {
    LOG_WARN("{}", warning);
    std::lock_guard<std::mutex> lock(report_mutex_);
    current_.warnings.push_back(warning);
}

void PanicOrchestrator::touchSymbol(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(report_mutex_);
    touched_.insert(symbol);
}

void PanicOrchestrator::deliverAlert(const char* what, bool delivered) {
    if (!delivered) {
        addWarning(std::string("alert delivery failed (") + what + ")");
    }
}

} // namespace core
} // namespace riskguard
