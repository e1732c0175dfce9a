#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "common/GuardConfig.h"
#include "core/contracts/ILockStore.h"

namespace riskguard {
namespace core {

struct DailyPnlStats {
    std::string date;
    double realized_pnl = 0.0;
    double target_pnl = 0.0;
    double loss_limit = 0.0;      // 음수 (예: -6.0 USDT)
    double progress_pct = 0.0;
    int trades = 0;
    int loss_streak = 0;
    bool stopped = false;
    std::string stop_reason;
};

// UTC 일 단위 실현 손익 집계. 손실 한도나 목표 수익에 도달하면 거래 중지 플래그를 켠다.
// 패닉 잠금은 건드리지 않는다.
class DailyLossBreaker {
public:
    DailyLossBreaker(DailyLossConfig config, std::shared_ptr<ILockStore> lock_store);

    DailyPnlStats recordRealizedPnl(double delta_usdt, long long now_ms);
    DailyPnlStats stats(long long now_ms);

    // 새 UTC 일이 시작됐고 어제 차단기가 거래를 막았다면 다시 허용한다
    bool rolloverIfNewDay(long long now_ms);

private:
    nlohmann::json loadState();
    DailyPnlStats toStats(const std::string& day, const nlohmann::json& day_data) const;
    double targetUsdt() const;
    double lossLimitUsdt() const;

    DailyLossConfig config_;
    std::shared_ptr<ILockStore> lock_store_;
    std::filesystem::path state_path_;
    std::mutex mutex_;
};

} // namespace core
} // namespace riskguard
