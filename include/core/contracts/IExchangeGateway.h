#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace riskguard {
namespace core {

// 거래소 추상화. 모든 호출은 호출자 관점에서 재시도 가능해야 한다.
// 실패는 TransientGatewayError / PrecisionError / GatewayError 로 던진다.
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual AccountMarginState getMarginState() = 0;
    virtual std::vector<OpenOrder> listOpenOrders() = 0;
    // symbol 이 없으면 정산 통화 전체. 취소된 주문 수 반환
    virtual int cancelAllOrders(const std::optional<std::string>& symbol) = 0;
    virtual std::vector<Position> listPositions() = 0;
    // 주문 ID 반환
    virtual std::string placeReduceOnlyMarket(const std::string& symbol, OrderSide side, Quantity qty) = 0;
    virtual InstrumentSpec getInstrumentSpec(const std::string& symbol) = 0;
};

} // namespace core
} // namespace riskguard
