#pragma once

#include <string>

namespace riskguard {
namespace network {

class RequestSigner {
public:
    // Bybit V5 서명: HMAC-SHA256(secret, timestamp + api_key + recv_window + payload), hex 소문자
    // payload 는 GET 이면 query string, POST 면 JSON body 원문
    static std::string sign(
        const std::string& api_secret,
        const std::string& timestamp,
        const std::string& api_key,
        const std::string& recv_window,
        const std::string& payload
    );

    static std::string hmacSha256Hex(const std::string& key, const std::string& message);

private:
    static std::string toHex(const unsigned char* data, unsigned int len);
};

} // namespace network
} // namespace riskguard
