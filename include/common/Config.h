#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/GuardConfig.h"

namespace riskguard {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // 임계값 순서, 타임아웃 < 폴링 주기 등 검증. 위반 시 ConfigError
    void validate() const;
    // 실거래 프로세스용: API 키가 없으면 ConfigError
    void requireCredentials() const;

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

    ExchangeConfig getExchangeConfig() const { return exchange_; }
    BackoffConfig getBackoffConfig() const { return backoff_; }
    RiskMonitorConfig getRiskMonitorConfig() const { return risk_monitor_; }
    CommandGateConfig getCommandGateConfig() const { return command_gate_; }
    PanicConfig getPanicConfig() const { return panic_; }
    HttpConfig getHttpConfig() const { return http_; }
    AlertConfig getAlertConfig() const { return alert_; }
    DailyLossConfig getDailyLossConfig() const { return daily_loss_; }

    nlohmann::json summary() const;

private:
    Config() = default;

    std::string api_key_;
    std::string api_secret_;
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";

    ExchangeConfig exchange_;
    BackoffConfig backoff_;
    RiskMonitorConfig risk_monitor_;
    CommandGateConfig command_gate_;
    PanicConfig panic_;
    HttpConfig http_;
    AlertConfig alert_;
    DailyLossConfig daily_loss_;
};

} // namespace riskguard
