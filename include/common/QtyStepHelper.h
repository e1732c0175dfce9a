#pragma once
// ===================================================================
// 거래소 수량 단위(qtyStep) 헬퍼
//
// 선물 주문 수량은 종목별 lotSizeFilter.qtyStep 의 정수배여야 하며,
// 자릿수가 맞지 않으면 거래소가 주문을 거절한다 (PrecisionError).
// 청산 수량은 포지션을 넘지 않도록 항상 내림 처리한다.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace riskguard {
namespace common {

// 부동소수 오차 허용치 (step 대비 상대값)
constexpr double kStepEpsilon = 1e-9;

// step 단위로 내림. step <= 0 이면 원본 유지
inline double roundDownToStep(double qty, double step) {
    if (step <= 0.0 || !std::isfinite(qty)) return qty;
    const double units = std::floor(qty / step + kStepEpsilon);
    return units * step;
}

// step 이 표현하는 소수 자릿수 (0.001 -> 3, 1 -> 0)
inline int stepDecimals(double step) {
    if (step <= 0.0) return 8;
    int decimals = 0;
    double t = step;
    while (decimals < 10 && std::fabs(t - std::round(t)) > kStepEpsilon * 10.0) {
        t *= 10.0;
        decimals++;
    }
    return decimals;
}

// 주문 전송용 수량 문자열: "0.010", "12"
inline std::string qtyToString(double qty, double step) {
    const int decimals = stepDecimals(step);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, roundDownToStep(qty, step));
    return std::string(buf);
}

inline bool isBelowMinQty(double qty, double min_qty) {
    return min_qty > 0.0 && qty + min_qty * kStepEpsilon < min_qty;
}

} // namespace common
} // namespace riskguard
