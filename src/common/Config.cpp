#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/model/Errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace riskguard {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

bool envFlag(const char* name) {
    std::string value = readEnvVar(name);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "y";
}

std::string upperSymbol(std::string symbol) {
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(symbol);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    nlohmann::json j = nlohmann::json::object();
    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config file: " + config_path.string());
        }
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Malformed config file: " + std::string(e.what()));
        }
    }

    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("exchange")) {
        const auto& e = j["exchange"];
        if (!e.value("api_key", std::string()).empty() || !e.value("api_secret", std::string()).empty()) {
            std::cout << "Warning: API keys in the config file are ignored. "
                         "Use BYBIT_API_KEY / BYBIT_API_SECRET." << std::endl;
        }
        exchange_.base_url = e.value("base_url", exchange_.base_url);
        exchange_.category = e.value("category", exchange_.category);
        exchange_.settle_coin = e.value("settle_coin", exchange_.settle_coin);
        exchange_.account_type = e.value("account_type", exchange_.account_type);
        exchange_.recv_window_ms = e.value("recv_window_ms", exchange_.recv_window_ms);
        exchange_.timeout_ms = e.value("timeout_ms", exchange_.timeout_ms);
        exchange_.testnet = e.value("testnet", exchange_.testnet);
        if (e.contains("symbols") && e["symbols"].is_array()) {
            exchange_.symbols.clear();
            for (const auto& s : e["symbols"]) {
                if (s.is_string()) {
                    exchange_.symbols.push_back(upperSymbol(s.get<std::string>()));
                }
            }
        }
    }

    if (j.contains("backoff")) {
        const auto& b = j["backoff"];
        backoff_.initial_ms = b.value("initial_ms", backoff_.initial_ms);
        backoff_.max_ms = b.value("max_ms", backoff_.max_ms);
        backoff_.multiplier = b.value("multiplier", backoff_.multiplier);
        backoff_.max_retries = b.value("max_retries", backoff_.max_retries);
    }

    if (j.contains("risk_monitor")) {
        const auto& r = j["risk_monitor"];
        auto& t = risk_monitor_.thresholds;
        t.warn_at = r.value("warn_at", t.warn_at);
        t.derisk_at = r.value("derisk_at", t.derisk_at);
        t.emergency_at = r.value("emergency_at", t.emergency_at);
        t.halt_at = r.value("halt_at", t.halt_at);
        t.target_after_derisk = r.value("target_after_derisk", t.target_after_derisk);
        t.target_after_emergency = r.value("target_after_emergency", t.target_after_emergency);
        t.derisk_close_fraction = r.value("derisk_close_fraction", t.derisk_close_fraction);
        t.emergency_close_fraction = r.value("emergency_close_fraction", t.emergency_close_fraction);
        risk_monitor_.poll_seconds = r.value("poll_seconds", risk_monitor_.poll_seconds);
        risk_monitor_.failure_halt_after = r.value("failure_halt_after", risk_monitor_.failure_halt_after);
        risk_monitor_.max_backoff_seconds = r.value("max_backoff_seconds", risk_monitor_.max_backoff_seconds);
        risk_monitor_.command_file = r.value("command_file", risk_monitor_.command_file);
    }

    if (j.contains("command_gate")) {
        command_gate_.max_staleness_seconds =
            j["command_gate"].value("max_staleness_seconds", command_gate_.max_staleness_seconds);
    }

    if (j.contains("panic")) {
        const auto& p = j["panic"];
        panic_.verify_timeout_sec = p.value("verify_timeout_sec", panic_.verify_timeout_sec);
        panic_.verify_poll_ms = p.value("verify_poll_ms", panic_.verify_poll_ms);
        panic_.worker_threads = p.value("worker_threads", panic_.worker_threads);
        panic_.lock_file = p.value("lock_file", panic_.lock_file);
        panic_.trading_disabled_file = p.value("trading_disabled_file", panic_.trading_disabled_file);
        panic_.journal_file = p.value("journal_file", panic_.journal_file);
    }

    if (j.contains("http")) {
        const auto& h = j["http"];
        http_.host = h.value("host", http_.host);
        http_.port = h.value("port", http_.port);
        if (h.contains("allowlist") && h["allowlist"].is_array()) {
            http_.allowlist = h["allowlist"].get<std::vector<std::string>>();
        }
    }

    if (j.contains("alert")) {
        const auto& a = j["alert"];
        alert_.channel = a.value("channel", alert_.channel);
        alert_.bot_name = a.value("bot_name", alert_.bot_name);
    }

    if (j.contains("daily_loss")) {
        const auto& d = j["daily_loss"];
        daily_loss_.enabled = d.value("enabled", daily_loss_.enabled);
        daily_loss_.equity_usdt = d.value("equity_usdt", daily_loss_.equity_usdt);
        daily_loss_.max_loss_pct = d.value("max_loss_pct", daily_loss_.max_loss_pct);
        daily_loss_.target_pct = d.value("target_pct", daily_loss_.target_pct);
        daily_loss_.state_file = d.value("state_file", daily_loss_.state_file);
    }

    log_dir_ = j.value("log_dir", log_dir_);
    log_level_ = j.value("log_level", log_level_);

    api_key_ = readEnvVar("BYBIT_API_KEY");
    api_secret_ = readEnvVar("BYBIT_API_SECRET");
    if (envFlag("BYBIT_TESTNET")) {
        exchange_.testnet = true;
    }
    if (exchange_.testnet && exchange_.base_url == "https://api.bybit.com") {
        exchange_.base_url = "https://api-testnet.bybit.com";
    }

    alert_.telegram_bot_token = readEnvVar("TELEGRAM_BOT_TOKEN");
    alert_.telegram_chat_id = readEnvVar("TELEGRAM_CHAT_ID");
    if (alert_.channel == "telegram" &&
        (alert_.telegram_bot_token.empty() || alert_.telegram_chat_id.empty())) {
        std::cout << "Warning: TELEGRAM_BOT_TOKEN or TELEGRAM_CHAT_ID is empty. "
                     "Alerts fall back to the log." << std::endl;
    }
}

void Config::validate() const {
    const auto& t = risk_monitor_.thresholds;
    if (!(0.0 < t.warn_at && t.warn_at < t.derisk_at && t.derisk_at < t.emergency_at &&
          t.emergency_at < t.halt_at && t.halt_at <= 1.0)) {
        throw ConfigError("risk_monitor thresholds must be strictly ascending within (0, 1]");
    }
    if (risk_monitor_.poll_seconds <= 0) {
        throw ConfigError("risk_monitor.poll_seconds must be positive");
    }
    // 폴링이 겹치지 않도록 네트워크 타임아웃은 폴링 주기보다 짧아야 함
    if (exchange_.timeout_ms >= static_cast<long>(risk_monitor_.poll_seconds) * 1000L) {
        throw ConfigError("exchange.timeout_ms must be shorter than risk_monitor.poll_seconds");
    }
    if (command_gate_.max_staleness_seconds < risk_monitor_.poll_seconds) {
        throw ConfigError("command_gate.max_staleness_seconds must be >= risk_monitor.poll_seconds");
    }
    if (panic_.verify_timeout_sec <= 0 || panic_.verify_poll_ms <= 0) {
        throw ConfigError("panic verify timings must be positive");
    }
    if (panic_.worker_threads <= 0) {
        throw ConfigError("panic.worker_threads must be positive");
    }
    if (backoff_.initial_ms <= 0 || backoff_.max_ms < backoff_.initial_ms ||
        backoff_.multiplier < 1.0 || backoff_.max_retries <= 0) {
        throw ConfigError("backoff settings are invalid");
    }
}

void Config::requireCredentials() const {
    if (api_key_.empty() || api_secret_.empty()) {
        throw ConfigError("BYBIT_API_KEY / BYBIT_API_SECRET environment variables are empty");
    }
}

nlohmann::json Config::summary() const {
    nlohmann::json out;
    out["exchange"] = {
        {"base_url", exchange_.base_url},
        {"category", exchange_.category},
        {"settle_coin", exchange_.settle_coin},
        {"symbols", exchange_.symbols}
    };
    out["risk_monitor"] = {
        {"poll_seconds", risk_monitor_.poll_seconds},
        {"thresholds", {risk_monitor_.thresholds.warn_at, risk_monitor_.thresholds.derisk_at,
                        risk_monitor_.thresholds.emergency_at, risk_monitor_.thresholds.halt_at}}
    };
    out["panic"] = {
        {"verify_timeout_sec", panic_.verify_timeout_sec},
        {"verify_poll_ms", panic_.verify_poll_ms},
        {"max_retries", backoff_.max_retries},
        {"worker_threads", panic_.worker_threads}
    };
    out["alert_channel"] = alert_.channel;
    return out;
}

} // namespace riskguard
