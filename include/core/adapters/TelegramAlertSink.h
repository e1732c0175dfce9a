#pragma once

#include <curl/curl.h>
#include <mutex>
#include <string>

#include "core/contracts/IAlertSink.h"

namespace riskguard {
namespace core {

// Telegram Bot API sendMessage. 토큰/채팅 ID 가 없으면 로그로만 남기고 false.
class TelegramAlertSink : public IAlertSink {
public:
    TelegramAlertSink(std::string bot_token, std::string chat_id, std::string bot_name, long timeout_ms = 5000);
    ~TelegramAlertSink() override;

    TelegramAlertSink(const TelegramAlertSink&) = delete;
    TelegramAlertSink& operator=(const TelegramAlertSink&) = delete;

    bool notifyPanicStarted(long long started_at_ms) override;
    bool notifyPanicCompleted(const PanicExecutionReport& report) override;
    bool notifyPanicFailed(const PanicExecutionReport& report) override;
    bool notifyReset(bool success, const std::string& message) override;
    bool enabled() const { return !bot_token_.empty() && !chat_id_.empty(); }

private:
    bool send(const std::string& text);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string bot_token_;
    std::string chat_id_;
    std::string bot_name_;
    long timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;
};

class LogAlertSink : public IAlertSink {
public:
    explicit LogAlertSink(std::string bot_name);

    bool notifyPanicStarted(long long started_at_ms) override;
    bool notifyPanicCompleted(const PanicExecutionReport& report) override;
    bool notifyPanicFailed(const PanicExecutionReport& report) override;
    bool notifyReset(bool success, const std::string& message) override;

private:
    std::string bot_name_;
};

} // namespace core
} // namespace riskguard
