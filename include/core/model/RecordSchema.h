#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/PanicTypes.h"
#include "core/model/RiskTypes.h"

namespace riskguard {
namespace core {

const char* riskModeToString(RiskMode mode);
std::optional<RiskMode> riskModeFromString(const std::string& value);

const char* priorityToString(CommandPriority priority);
CommandPriority priorityFromString(const std::string& value);

const char* commandSourceToString(CommandSource source);
CommandSource commandSourceFromString(const std::string& value);

const char* panicStateToString(PanicState state);
PanicState panicStateFromString(const std::string& value);

// 명령 레코드. 소비자는 모르는 필드를 무시한다.
nlohmann::json toJson(const RiskCommand& command);
// 필수 필드(mode, allow_new_entries) 누락/오류 시 nullopt
std::optional<RiskCommand> commandFromJson(const nlohmann::json& raw);

nlohmann::json toJson(const Position& position);
nlohmann::json toJson(const OpenOrder& order);

nlohmann::json toJson(const PanicExecutionReport& report);
PanicExecutionReport reportFromJson(const nlohmann::json& raw);

nlohmann::json toJson(const PanicLock& lock);
PanicLock lockFromJson(const nlohmann::json& raw);

nlohmann::json toJson(const TradingDisabledFlag& flag);
TradingDisabledFlag disabledFlagFromJson(const nlohmann::json& raw);

} // namespace core
} // namespace riskguard
