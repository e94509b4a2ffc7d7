#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <optional>

namespace capflow {
namespace core {

namespace {
std::optional<nlohmann::json> parseRow(const std::string& row) {
    try {
        return nlohmann::json::parse(row);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto line = parseRow(row);
        if (!line) {
            skipped_rows_++;
            continue;
        }
        last_seq_ = std::max(last_seq_, parseSeq(*line));
    }
    if (skipped_rows_ > 0) {
        LOG_WARN("Journal {}: {} malformed rows skipped", file_path_.string(), skipped_rows_);
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["asset"] = event.asset;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto line = parseRow(row);
        if (!line) {
            continue;
        }

        const auto seq = parseSeq(*line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line->value("ts_ms", 0LL);
        event.type = fromString(line->value("type", std::string("DEPOSIT_APPLIED")));
        event.asset = line->value("asset", std::string());
        event.entity_id = line->value("entity_id", std::string());
        event.payload = line->value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::vector<JournalEvent> EventJournalJsonl::readAsset(const Asset& asset, std::uint64_t seq_inclusive) {
    auto rows = readFrom(seq_inclusive);
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&asset](const JournalEvent& e) { return e.asset != asset; }),
               rows.end());
    return rows;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::DEPOSIT_APPLIED: return "DEPOSIT_APPLIED";
        case JournalEventType::WITHDRAWAL_APPLIED: return "WITHDRAWAL_APPLIED";
        case JournalEventType::IDLE_DETECTED: return "IDLE_DETECTED";
        case JournalEventType::OPPORTUNITY_PROPOSED: return "OPPORTUNITY_PROPOSED";
        case JournalEventType::REALLOCATION_COMPLETED: return "REALLOCATION_COMPLETED";
        case JournalEventType::REALLOCATION_FAILED: return "REALLOCATION_FAILED";
        case JournalEventType::STRATEGY_EXECUTED: return "STRATEGY_EXECUTED";
        case JournalEventType::STRATEGY_ADAPTED: return "STRATEGY_ADAPTED";
        case JournalEventType::EMERGENCY_REALLOCATION: return "EMERGENCY_REALLOCATION";
        case JournalEventType::LEDGER_HALTED: return "LEDGER_HALTED";
        case JournalEventType::ENGINE_PAUSED: return "ENGINE_PAUSED";
        case JournalEventType::ENGINE_UNPAUSED: return "ENGINE_UNPAUSED";
    }
    return "DEPOSIT_APPLIED";
}

JournalEventType EventJournalJsonl::fromString(const std::string& value) {
    if (value == "WITHDRAWAL_APPLIED") return JournalEventType::WITHDRAWAL_APPLIED;
    if (value == "IDLE_DETECTED") return JournalEventType::IDLE_DETECTED;
    if (value == "OPPORTUNITY_PROPOSED") return JournalEventType::OPPORTUNITY_PROPOSED;
    if (value == "REALLOCATION_COMPLETED") return JournalEventType::REALLOCATION_COMPLETED;
    if (value == "REALLOCATION_FAILED") return JournalEventType::REALLOCATION_FAILED;
    if (value == "STRATEGY_EXECUTED") return JournalEventType::STRATEGY_EXECUTED;
    if (value == "STRATEGY_ADAPTED") return JournalEventType::STRATEGY_ADAPTED;
    if (value == "EMERGENCY_REALLOCATION") return JournalEventType::EMERGENCY_REALLOCATION;
    if (value == "LEDGER_HALTED") return JournalEventType::LEDGER_HALTED;
    if (value == "ENGINE_PAUSED") return JournalEventType::ENGINE_PAUSED;
    if (value == "ENGINE_UNPAUSED") return JournalEventType::ENGINE_UNPAUSED;
    return JournalEventType::DEPOSIT_APPLIED;
}

} // namespace core
} // namespace capflow
