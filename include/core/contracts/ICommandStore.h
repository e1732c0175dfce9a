#pragma once

#include <optional>

#include "core/model/RiskTypes.h"

namespace riskguard {
namespace core {

// 단일 writer(리스크 모니터), 다중 reader. 쓰기는 항상 레코드 전체 원자적 교체.
class ICommandStore {
public:
    virtual ~ICommandStore() = default;

    // seq 는 store 가 부여한다
    virtual bool publish(const RiskCommand& command) = 0;
    // 없거나 해석 불가하면 nullopt
    virtual std::optional<RiskCommand> latest() = 0;
};

} // namespace core
} // namespace riskguard
