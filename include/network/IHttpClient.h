#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace riskguard {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    // Bybit 는 IP 단위 rate limit 초과 시 403 을 돌려준다
    bool isForbidden() const { return status_code == 403; }
    bool isServerError() const { return status_code >= 500; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET 요청 (query string 으로 서명)
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;

    // POST 요청 (JSON body 로 서명)
    virtual HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) = 0;
};

} // namespace network
} // namespace riskguard
