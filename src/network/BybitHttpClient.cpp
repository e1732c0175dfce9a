#include "network/BybitHttpClient.h"
#include "network/RequestSigner.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/model/Errors.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace riskguard {
namespace network {
namespace {
std::string lowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string urlEncode(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        return value;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}
}

BybitHttpClient::BybitHttpClient(
    const std::string& api_key,
    const std::string& api_secret,
    const std::string& base_url,
    long recv_window_ms,
    long timeout_ms
)
    : api_key_(api_key)
    , api_secret_(api_secret)
    , base_url_(base_url)
    , recv_window_ms_(recv_window_ms)
    , timeout_ms_(timeout_ms)
    , rate_limiter_(std::make_shared<execution::RateLimiter>())
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

BybitHttpClient::~BybitHttpClient() {
    const auto stats = rate_limiter_->getStats();
    LOG_INFO("HTTP client closed: {} request(s), {} rate-limit wait(s), {} ms waited",
             stats.total_requests, stats.forced_waits, stats.total_wait_time.count());
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

std::map<std::string, std::string> BybitHttpClient::signedHeaders(const std::string& payload) const {
    const std::string timestamp = std::to_string(common::nowMs());
    const std::string recv_window = std::to_string(recv_window_ms_);

    std::map<std::string, std::string> headers;
    headers["X-BAPI-API-KEY"] = api_key_;
    headers["X-BAPI-TIMESTAMP"] = timestamp;
    headers["X-BAPI-RECV-WINDOW"] = recv_window;
    headers["X-BAPI-SIGN"] = RequestSigner::sign(api_secret_, timestamp, api_key_, recv_window, payload);
    headers["X-BAPI-SIGN-TYPE"] = "2";
    headers["Content-Type"] = "application/json";
    return headers;
}

HttpResponse BybitHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    const std::string group = execution::RateLimiter::groupFor(endpoint);
    rate_limiter_->acquire(group);

    // 서명 payload 와 실제 전송 query 가 정확히 같아야 한다
    std::string query;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        bool first = true;
        for (const auto& [key, value] : query_params) {
            if (!first) oss << "&";
            oss << key << "=" << urlEncode(curl_, value);
            first = false;
        }
        query = oss.str();
    }

    std::string url = base_url_ + endpoint;
    if (!query.empty()) {
        url += "?" + query;
    }

    auto response = performRequest("GET", url, "", signedHeaders(query));
    afterResponse(group, response);
    return response;
}

HttpResponse BybitHttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body
) {
    const std::string group = execution::RateLimiter::groupFor(endpoint);
    rate_limiter_->acquire(group);

    const std::string payload = body.dump();
    auto response = performRequest("POST", base_url_ + endpoint, payload, signedHeaders(payload));
    afterResponse(group, response);
    return response;
}

void BybitHttpClient::afterResponse(const std::string& group, const HttpResponse& response) {
    for (const auto& [key, value] : response.headers) {
        if (lowerCase(key) == "x-bapi-limit-status") {
            rate_limiter_->updateFromHeader(group, value);
            break;
        }
    }

    if (response.isRateLimited() || response.isForbidden()) {
        rate_limiter_->handleRateLimitError(response.status_code);
    }
}

HttpResponse BybitHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw TransientGatewayError("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    return response;
}

size_t BybitHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BybitHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace riskguard
