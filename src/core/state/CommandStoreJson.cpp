#include "core/state/CommandStoreJson.h"

#include "core/model/RecordSchema.h"
#include "core/state/AtomicJsonFile.h"

namespace riskguard {
namespace core {

CommandStoreJson::CommandStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    // 재시작 후에도 seq 가 단조 증가하도록 기존 레코드에서 이어간다
    const auto existing = readJsonFile(file_path_);
    if (existing.exists && !existing.parse_failed && existing.value.is_object()) {
        last_seq_ = existing.value.value("seq", static_cast<std::uint64_t>(0));
    }
}

bool CommandStoreJson::publish(const RiskCommand& command) {
    std::lock_guard<std::mutex> lock(mutex_);

    RiskCommand stamped = command;
    stamped.seq = last_seq_ + 1;
    if (!writeJsonAtomically(file_path_, toJson(stamped))) {
        return false;
    }
    last_seq_ = stamped.seq;
    return true;
}

std::optional<RiskCommand> CommandStoreJson::latest() {
    const auto raw = readJsonFile(file_path_);
    if (!raw.exists || raw.parse_failed) {
        return std::nullopt;
    }
    return commandFromJson(raw.value);
}

std::uint64_t CommandStoreJson::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace riskguard
