#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace riskguard {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class PositionSide { LONG, SHORT };

// 증거금 사용률 기준 리스크 등급 (오름차순)
enum class RiskMode { NORMAL, ALERT, DERISK, EMERGENCY, HALT };

enum class CommandPriority { NONE, LOW, MEDIUM, HIGH, IMMEDIATE };

struct AccountMarginState {
    Amount total_equity = 0.0;
    Amount used_initial_margin = 0.0;
    Amount free_margin = 0.0;
    double utilization = 0.0;
};

struct Position {
    std::string symbol;
    PositionSide side = PositionSide::LONG;
    Quantity size = 0.0;
    Price entry_price = 0.0;
};

struct OpenOrder {
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity qty = 0.0;
    bool reduce_only = false;
};

// 거래소 수량 규격 (lotSizeFilter)
struct InstrumentSpec {
    std::string symbol;
    Quantity qty_step = 0.0;
    Quantity min_qty = 0.0;
};

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "Buy" : "Sell";
}

inline const char* positionSideToString(PositionSide side) {
    return (side == PositionSide::LONG) ? "long" : "short";
}

// 포지션 청산 방향: 롱은 매도, 숏은 매수
inline OrderSide closingSide(PositionSide side) {
    return (side == PositionSide::LONG) ? OrderSide::SELL : OrderSide::BUY;
}

} // namespace riskguard
