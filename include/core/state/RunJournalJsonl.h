#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IRunJournal.h"

namespace riskguard {
namespace core {

// 패닉 실행 보고서 감사 기록 (한 줄에 보고서 하나)
class RunJournalJsonl : public IRunJournal {
public:
    explicit RunJournalJsonl(std::filesystem::path file_path);

    bool append(const PanicExecutionReport& report) override;
    std::vector<JournaledRun> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace riskguard
