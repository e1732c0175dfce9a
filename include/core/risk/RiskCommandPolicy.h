#pragma once

#include "common/GuardConfig.h"
#include "core/model/RiskTypes.h"

namespace riskguard {
namespace core {

// 증거금 사용률 -> 리스크 등급 -> 명령. 상태 없는 순수 함수 모음.
class RiskCommandPolicy {
public:
    // utilization 은 [0, 1] 로 클램프 후 구간 판정 (히스테리시스 없음)
    static RiskMode classify(double utilization, const RiskThresholds& thresholds);

    static RiskCommand buildCommand(
        RiskMode mode,
        const AccountMarginState& margin,
        const RiskThresholds& thresholds,
        long long now_ms
    );

    // 연속 조회 실패: 마지막 명령보다 느슨해지지 않는 HALT
    static RiskCommand buildFailsafe(int consecutive_failures, const RiskThresholds& thresholds, long long now_ms);

    // 모니터 종료: 직전 등급 제약을 유지하고 신규 진입만 막는다
    static RiskCommand buildOffline(const RiskCommand& last, long long now_ms);

    static double clampUtilization(double utilization);
};

} // namespace core
} // namespace riskguard
