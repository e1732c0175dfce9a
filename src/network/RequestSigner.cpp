#include "network/RequestSigner.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>

namespace riskguard {
namespace network {

std::string RequestSigner::toHex(const unsigned char* data, unsigned int len) {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

std::string RequestSigner::hmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    HMAC(EVP_sha256(),
         key.c_str(), static_cast<int>(key.length()),
         reinterpret_cast<const unsigned char*>(message.c_str()), message.length(),
         signature, &signature_len);

    return toHex(signature, signature_len);
}

std::string RequestSigner::sign(
    const std::string& api_secret,
    const std::string& timestamp,
    const std::string& api_key,
    const std::string& recv_window,
    const std::string& payload
) {
    return hmacSha256Hex(api_secret, timestamp + api_key + recv_window + payload);
}

} // namespace network
} // namespace riskguard
