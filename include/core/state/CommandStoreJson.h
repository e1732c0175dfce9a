#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>

#include "core/contracts/ICommandStore.h"

namespace riskguard {
namespace core {

class CommandStoreJson : public ICommandStore {
public:
    explicit CommandStoreJson(std::filesystem::path file_path);

    bool publish(const RiskCommand& command) override;
    std::optional<RiskCommand> latest() override;

    std::uint64_t lastSeq() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace riskguard
