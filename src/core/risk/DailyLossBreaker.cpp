#include "core/risk/DailyLossBreaker.h"

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/model/PanicTypes.h"
#include "core/state/AtomicJsonFile.h"

#include <cmath>
#include <sstream>

namespace riskguard {
namespace core {

namespace {
nlohmann::json emptyDay() {
    return {
        {"realized", 0.0},
        {"stopped", false},
        {"stop_reason", ""},
        {"loss_streak", 0},
        {"trades", 0}
    };
}

double round6(double v) {
    return std::round(v * 1e6) / 1e6;
}
} // namespace

DailyLossBreaker::DailyLossBreaker(DailyLossConfig config, std::shared_ptr<ILockStore> lock_store)
    : config_(std::move(config))
    , lock_store_(std::move(lock_store))
    , state_path_(config_.state_file) {}

double DailyLossBreaker::targetUsdt() const {
    return config_.equity_usdt * config_.target_pct / 100.0;
}

double DailyLossBreaker::lossLimitUsdt() const {
    return -config_.equity_usdt * config_.max_loss_pct / 100.0;
}

nlohmann::json DailyLossBreaker::loadState() {
    const auto raw = readJsonFile(state_path_);
    if (!raw.exists) {
        return nlohmann::json::object();
    }
    if (raw.parse_failed || !raw.value.is_object()) {
        LOG_WARN("Daily PnL state unreadable, starting a fresh ledger: {}", state_path_.string());
        return nlohmann::json::object();
    }
    return raw.value;
}

DailyPnlStats DailyLossBreaker::toStats(const std::string& day, const nlohmann::json& day_data) const {
    DailyPnlStats s;
    s.date = day;
    s.realized_pnl = day_data.value("realized", 0.0);
    s.target_pnl = targetUsdt();
    s.loss_limit = lossLimitUsdt();
    s.progress_pct = (s.target_pnl > 0.0) ? (s.realized_pnl / s.target_pnl * 100.0) : 0.0;
    s.trades = day_data.value("trades", 0);
    s.loss_streak = day_data.value("loss_streak", 0);
    s.stopped = day_data.value("stopped", false);
    s.stop_reason = day_data.value("stop_reason", std::string());
    return s;
}

DailyPnlStats DailyLossBreaker::recordRealizedPnl(double delta_usdt, long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLockGuard state_lock(state_path_);

    const std::string day = common::utcDayKey(now_ms);
    nlohmann::json state = loadState();
    nlohmann::json day_data = state.contains(day) ? state[day] : emptyDay();

    day_data["realized"] = round6(day_data.value("realized", 0.0) + delta_usdt);
    day_data["trades"] = day_data.value("trades", 0) + 1;
    day_data["loss_streak"] = (delta_usdt < 0.0) ? day_data.value("loss_streak", 0) + 1 : 0;

    DailyPnlStats s = toStats(day, day_data);
    LOG_INFO("[DAILY-PNL] Trade #{}: {:+.2f} USDT | Total: {:+.2f} USDT | Loss streak: {}",
             s.trades, delta_usdt, s.realized_pnl, s.loss_streak);

    if (config_.enabled && !s.stopped) {
        std::string reason;
        if (s.realized_pnl <= s.loss_limit) {
            std::ostringstream oss;
            oss.setf(std::ios::fixed);
            oss.precision(2);
            oss << "daily loss limit reached: " << s.realized_pnl << " <= " << s.loss_limit << " USDT";
            reason = oss.str();
        } else if (s.target_pnl > 0.0 && s.realized_pnl >= s.target_pnl) {
            std::ostringstream oss;
            oss.setf(std::ios::fixed);
            oss.precision(2);
            oss << "daily profit target reached: " << s.realized_pnl << " >= " << s.target_pnl << " USDT";
            reason = oss.str();
        }

        if (!reason.empty()) {
            day_data["stopped"] = true;
            day_data["stop_reason"] = reason;
            s.stopped = true;
            s.stop_reason = reason;
            LOG_WARN("[DAILY-PNL] Stopping trading for {}: {}", day, reason);
            // 패닉/수동 차단이 이미 걸려 있으면 그 출처를 유지
            if (!lock_store_->disableTradingIfEnabled(reason, disable_source::kDailyLoss)) {
                LOG_ERROR("[DAILY-PNL] Failed to persist trading-disabled flag");
            }
        }
    }

    state[day] = day_data;
    if (!writeJsonAtomically(state_path_, state)) {
        LOG_ERROR("[DAILY-PNL] Failed to persist daily PnL state: {}", state_path_.string());
    }
    return s;
}

DailyPnlStats DailyLossBreaker::stats(long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string day = common::utcDayKey(now_ms);
    const nlohmann::json state = loadState();
    return toStats(day, state.contains(day) ? state[day] : emptyDay());
}

bool DailyLossBreaker::rolloverIfNewDay(long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLockGuard state_lock(state_path_);

    const std::string day = common::utcDayKey(now_ms);
    nlohmann::json state = loadState();
    if (state.contains(day)) {
        return false;
    }

    state[day] = emptyDay();
    if (!writeJsonAtomically(state_path_, state)) {
        LOG_ERROR("[DAILY-PNL] Failed to persist daily PnL state: {}", state_path_.string());
        return false;
    }
    LOG_INFO("[DAILY-PNL] New trading day started: {}", day);

    // 패닉이나 수동 차단은 여기서 해제하지 않는다
    if (lock_store_->clearTradingDisabledIfSource(disable_source::kDailyLoss, "new trading day " + day)) {
        LOG_INFO("[DAILY-PNL] Trading re-enabled for {}", day);
    }
    return true;
}

} // namespace core
} // namespace riskguard
