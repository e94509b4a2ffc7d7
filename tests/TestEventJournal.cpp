#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::path("logs/test_event_journal.jsonl");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        capflow::core::EventJournalJsonl journal(path);

        capflow::core::JournalEvent first;
        first.ts_ms = 1000;
        first.type = capflow::core::JournalEventType::DEPOSIT_APPLIED;
        first.asset = "USDC";
        first.entity_id = "USDC";
        first.payload["amount"] = 1000000;

        capflow::core::JournalEvent second;
        second.ts_ms = 2000;
        second.type = capflow::core::JournalEventType::REALLOCATION_COMPLETED;
        second.asset = "USDC";
        second.entity_id = "opp-1";
        second.payload["amount"] = 100000;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }

        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().type != capflow::core::JournalEventType::REALLOCATION_COMPLETED ||
            rows.front().entity_id != "opp-1" ||
            rows.front().payload.value("amount", 0) != 100000) {
            std::cerr << "[TEST] unexpected row: " << rows.front().entity_id << "\n";
            return 1;
        }
    }

    // A torn line is skipped; numbering resumes after the last good row.
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "{\"seq\": 3, \"type\": \"DEPO\n";
    }
    {
        capflow::core::EventJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }

        capflow::core::JournalEvent third;
        third.ts_ms = 3000;
        third.type = capflow::core::JournalEventType::LEDGER_HALTED;
        third.asset = "DAI";
        if (!reopened.append(third) || reopened.lastSeq() != 3) {
            std::cerr << "[TEST] append after reopen failed\n";
            return 1;
        }
        const auto all = reopened.readFrom(0);
        if (all.size() != 3 || all.back().asset != "DAI") {
            std::cerr << "[TEST] expected 3 readable rows, got " << all.size() << "\n";
            return 1;
        }
        const auto usdc = reopened.readAsset("USDC", 0);
        if (usdc.size() != 2 || reopened.readAsset("DAI", 0).size() != 1 || !reopened.readAsset("USDC", 3).empty()) {
            std::cerr << "[TEST] readAsset filtered incorrectly\n";
            return 1;
        }
    }

    using capflow::core::EventJournalJsonl;
    if (EventJournalJsonl::fromString(EventJournalJsonl::toString(
            capflow::core::JournalEventType::STRATEGY_ADAPTED)) != capflow::core::JournalEventType::STRATEGY_ADAPTED) {
        std::cerr << "[TEST] event type names do not round trip\n";
        return 1;
    }

    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
