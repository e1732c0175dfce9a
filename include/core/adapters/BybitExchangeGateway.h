#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "common/GuardConfig.h"
#include "core/contracts/IExchangeGateway.h"
#include "network/IHttpClient.h"

namespace riskguard {
namespace core {

enum class BybitErrorClass {
    OK,
    TRANSIENT,
    PRECISION,
    REJECTED
};

// Bybit V5 linear (USDT 정산) 게이트웨이
class BybitExchangeGateway : public IExchangeGateway {
public:
    BybitExchangeGateway(std::shared_ptr<network::IHttpClient> http, ExchangeConfig config);

    AccountMarginState getMarginState() override;
    std::vector<OpenOrder> listOpenOrders() override;
    int cancelAllOrders(const std::optional<std::string>& symbol) override;
    std::vector<Position> listPositions() override;
    std::string placeReduceOnlyMarket(const std::string& symbol, OrderSide side, Quantity qty) override;
    InstrumentSpec getInstrumentSpec(const std::string& symbol) override;

    static BybitErrorClass classifyRetCode(int ret_code, const std::string& ret_msg);
    // 로그용: api_key / sign 등 민감 필드 마스킹
    static std::string sanitizeForLog(const std::string& text);

private:
    // HTTP 상태 + retCode 를 예외로 변환하고 result 객체를 돌려준다
    nlohmann::json unwrap(const network::HttpResponse& response, const std::string& what);

    ExchangeConfig config_;
    std::shared_ptr<network::IHttpClient> http_;

    std::mutex cache_mutex_;
    std::map<std::string, InstrumentSpec> spec_cache_;
    // 헤지 모드: (symbol, 포지션 방향) -> positionIdx
    std::map<std::string, int> position_idx_;
};

} // namespace core
} // namespace riskguard
