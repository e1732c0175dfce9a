#pragma once

#include <cstdint>
#include <vector>

#include "core/model/PanicTypes.h"

namespace riskguard {
namespace core {

struct JournaledRun {
    std::uint64_t seq = 0;
    PanicExecutionReport report;
};

class IRunJournal {
public:
    virtual ~IRunJournal() = default;

    virtual bool append(const PanicExecutionReport& report) = 0;
    virtual std::vector<JournaledRun> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace riskguard
