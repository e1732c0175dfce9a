#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/Types.h"

namespace riskguard {
namespace core {

enum class CommandSource {
    MONITOR,    // 정상 폴링 결과
    FAILSAFE,   // 연속 조회 실패로 발행한 HALT
    OFFLINE     // 모니터 종료 시 발행
};

// 모니터가 발행하는 리스크 명령 스냅샷. 항상 한 단위로 쓰고 읽는다.
struct RiskCommand {
    std::uint64_t seq = 0;
    RiskMode mode = RiskMode::NORMAL;
    double utilization = 0.0;
    bool allow_new_entries = true;
    bool cancel_all_orders = false;
    bool close_positions = false;
    double close_fraction = 0.0;
    std::optional<double> target_utilization;
    CommandPriority priority = CommandPriority::NONE;
    std::string message;
    long long timestamp_ms = 0;
    double total_equity = 0.0;
    double used_initial_margin = 0.0;
    CommandSource source = CommandSource::MONITOR;
};

} // namespace core
} // namespace riskguard
