#pragma once

#include <string>
#include <vector>

namespace riskguard {

// 거래소 연결 설정
struct ExchangeConfig {
    std::string base_url = "https://api.bybit.com";
    std::string category = "linear";
    std::string settle_coin = "USDT";
    std::string account_type = "UNIFIED";
    bool testnet = false;
    long recv_window_ms = 5000;
    long timeout_ms = 10000;
    // 설정된 종목은 주문이 없어도 취소 대상에 포함
    std::vector<std::string> symbols;
};

// 재시도 백오프
struct BackoffConfig {
    int initial_ms = 200;
    int max_ms = 5000;
    double multiplier = 2.0;
    int max_retries = 3;
};

struct RiskThresholds {
    double warn_at = 0.60;
    double derisk_at = 0.70;
    double emergency_at = 0.80;
    double halt_at = 0.90;
    double target_after_derisk = 0.60;
    double target_after_emergency = 0.58;
    double derisk_close_fraction = 0.25;
    double emergency_close_fraction = 0.33;
};

struct RiskMonitorConfig {
    RiskThresholds thresholds;
    int poll_seconds = 60;
    int failure_halt_after = 3;
    int max_backoff_seconds = 300;
    std::string command_file = "state/risk_commands.json";
};

struct CommandGateConfig {
    int max_staleness_seconds = 180;
};

struct PanicConfig {
    int verify_timeout_sec = 120;
    int verify_poll_ms = 200;
    int worker_threads = 4;
    std::string lock_file = "state/panic.lock";
    std::string trading_disabled_file = "state/trading_disabled.json";
    std::string journal_file = "state/panic_runs.jsonl";
};

struct HttpConfig {
    std::string host = "127.0.0.1";
    int port = 8787;
    std::vector<std::string> allowlist{"127.0.0.1", "::1"};
};

struct AlertConfig {
    std::string channel = "log";   // "telegram" | "log"
    std::string bot_name = "RiskGuard";
    std::string telegram_bot_token;
    std::string telegram_chat_id;
};

struct DailyLossConfig {
    bool enabled = true;
    double equity_usdt = 120.0;
    double max_loss_pct = 5.0;
    double target_pct = 3.0;
    std::string state_file = "state/daily_pnl.json";
};

} // namespace riskguard
