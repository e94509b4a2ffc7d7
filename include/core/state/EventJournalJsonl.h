#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace capflow {
namespace core {

// Append-only audit trail, one JSON object per line. Sequence numbers keep
// increasing across restarts: the constructor resumes from the last line.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::vector<JournalEvent> readAsset(const Asset& asset, std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    static std::string toString(JournalEventType type);
    static JournalEventType fromString(const std::string& value);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::uint64_t skipped_rows_ = 0;  // malformed rows seen while resuming
};

} // namespace core
} // namespace capflow
