#pragma once

#include <stdexcept>
#include <string>

namespace riskguard {

// 거래소 호출 실패 (분류되지 않은 거절 포함)
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& what, int ret_code = 0)
        : std::runtime_error(what), ret_code_(ret_code) {}

    int retCode() const { return ret_code_; }

private:
    int ret_code_;
};

// 네트워크 / rate limit / 거래소 일시 장애. 백오프 후 재시도 대상
class TransientGatewayError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// 수량 step / 최소 수량 위반. 한 번 보정 후 재시도, 실패 시 해당 종목 skip
class PrecisionError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// 상태 머신 전이표에 없는 전이 (프로그래밍 오류)
class InvalidTransition : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace riskguard
