#pragma once

#include <cstdint>
#include <vector>

#include "common/Types.h"
#include "core/model/AllocationTypes.h"

namespace capflow {
namespace core {

// Audit trail of ledger movements, detections, opportunities and strategy
// runs. Sequence numbers start at 1 and never repeat.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::vector<JournalEvent> readAsset(const Asset& asset, std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace capflow
