#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "common/GuardConfig.h"
#include "core/contracts/ICommandStore.h"
#include "core/contracts/IExchangeGateway.h"

namespace riskguard {
namespace core {

struct MonitorPollResult {
    bool ok = false;            // 증거금 조회 성공 여부
    bool published = false;     // 명령 기록 여부
    RiskCommand command;
    std::string error;
};

// 주기적으로 증거금 사용률을 측정해 리스크 명령을 발행한다.
// 취소/청산은 하지 않는다. 유일한 부수효과는 Command Store 쓰기.
class RiskMonitor {
public:
    RiskMonitor(
        std::shared_ptr<IExchangeGateway> gateway,
        std::shared_ptr<ICommandStore> store,
        RiskMonitorConfig config
    );
    ~RiskMonitor();

    MonitorPollResult poll();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    int consecutiveFailures() const;
    std::optional<RiskCommand> lastCommand() const;

    void setPollInterval(std::chrono::milliseconds interval) { poll_interval_ = interval; }
    void setMaxBackoff(std::chrono::milliseconds max_backoff) { max_backoff_ = max_backoff; }

    // min(poll * 2^(failures-1), max). failures == 0 이면 poll 주기
    static std::chrono::milliseconds computeBackoff(
        int consecutive_failures,
        std::chrono::milliseconds poll_interval,
        std::chrono::milliseconds max_backoff
    );

private:
    void run();
    void publishOffline();
    void onPollFailure(const std::string& reason, MonitorPollResult& result);

    std::shared_ptr<IExchangeGateway> gateway_;
    std::shared_ptr<ICommandStore> store_;
    RiskMonitorConfig config_;

    std::chrono::milliseconds poll_interval_;
    std::chrono::milliseconds max_backoff_;

    mutable std::mutex state_mutex_;
    int consecutive_failures_ = 0;
    std::optional<RiskCommand> last_command_;
    std::optional<RiskMode> last_mode_;

    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace core
} // namespace riskguard
