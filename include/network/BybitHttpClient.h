#pragma once

#include "network/IHttpClient.h"
#include "execution/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace riskguard {
namespace network {

// Bybit V5 REST 클라이언트 (서명 + rate limit). 응답 해석은 게이트웨이 몫.
// 네트워크 실패는 TransientGatewayError 로 던진다.
class BybitHttpClient : public IHttpClient {
public:
    BybitHttpClient(
        const std::string& api_key,
        const std::string& api_secret,
        const std::string& base_url,
        long recv_window_ms,
        long timeout_ms
    );
    ~BybitHttpClient();

    BybitHttpClient(const BybitHttpClient&) = delete;
    BybitHttpClient& operator=(const BybitHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) override;

private:
    std::map<std::string, std::string> signedHeaders(const std::string& payload) const;
    void afterResponse(const std::string& group, const HttpResponse& response);

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string api_key_;
    std::string api_secret_;
    std::string base_url_;
    long recv_window_ms_;
    long timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace riskguard
