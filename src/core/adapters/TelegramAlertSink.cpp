#include "core/adapters/TelegramAlertSink.h"

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/adapters/AlertMessages.h"

#include <nlohmann/json.hpp>

namespace riskguard {
namespace core {

TelegramAlertSink::TelegramAlertSink(std::string bot_token, std::string chat_id, std::string bot_name, long timeout_ms)
    : bot_token_(std::move(bot_token))
    , chat_id_(std::move(chat_id))
    , bot_name_(std::move(bot_name))
    , timeout_ms_(timeout_ms)
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    if (!enabled()) {
        LOG_WARN("[TELEGRAM] Bot token or chat ID not configured, alerts go to the log only");
    }
}

TelegramAlertSink::~TelegramAlertSink() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

size_t TelegramAlertSink::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

bool TelegramAlertSink::send(const std::string& text) {
    if (!enabled()) {
        LOG_WARN("[TELEGRAM] Would send: {}", text.substr(0, 100));
        return false;
    }

    nlohmann::json payload;
    payload["chat_id"] = chat_id_;
    payload["text"] = text;
    payload["disable_web_page_preview"] = true;
    const std::string body = payload.dump();
    const std::string url = "https://api.telegram.org/bot" + bot_token_ + "/sendMessage";

    std::lock_guard<std::mutex> lock(mutex_);
    std::string response_body;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* header_list = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    const CURLcode res = curl_easy_perform(curl_);
    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    }
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        // URL 에 토큰이 있으므로 URL 은 남기지 않는다
        LOG_ERROR("[TELEGRAM] Send failed: {}", curl_easy_strerror(res));
        return false;
    }
    if (http_code != 200) {
        LOG_ERROR("[TELEGRAM] Error sending alert: {} - {}", http_code, response_body.substr(0, 300));
        return false;
    }
    LOG_INFO("[TELEGRAM] Alert sent");
    return true;
}

bool TelegramAlertSink::notifyPanicStarted(long long started_at_ms) {
    return send(AlertMessages::panicStarted(bot_name_, started_at_ms));
}

bool TelegramAlertSink::notifyPanicCompleted(const PanicExecutionReport& report) {
    return send(AlertMessages::panicCompleted(bot_name_, report));
}

bool TelegramAlertSink::notifyPanicFailed(const PanicExecutionReport& report) {
    return send(AlertMessages::panicFailed(bot_name_, report));
}

bool TelegramAlertSink::notifyReset(bool success, const std::string& message) {
    return send(AlertMessages::reset(bot_name_, success, message, common::nowMs()));
}

LogAlertSink::LogAlertSink(std::string bot_name)
    : bot_name_(std::move(bot_name)) {}

bool LogAlertSink::notifyPanicStarted(long long started_at_ms) {
    LOG_WARN("[ALERT]\n{}", AlertMessages::panicStarted(bot_name_, started_at_ms));
    return true;
}

bool LogAlertSink::notifyPanicCompleted(const PanicExecutionReport& report) {
    LOG_WARN("[ALERT]\n{}", AlertMessages::panicCompleted(bot_name_, report));
    return true;
}

bool LogAlertSink::notifyPanicFailed(const PanicExecutionReport& report) {
    LOG_ERROR("[ALERT]\n{}", AlertMessages::panicFailed(bot_name_, report));
    return true;
}

bool LogAlertSink::notifyReset(bool success, const std::string& message) {
    LOG_WARN("[ALERT]\n{}", AlertMessages::reset(bot_name_, success, message, common::nowMs()));
    return true;
}

} // namespace core
} // namespace riskguard
