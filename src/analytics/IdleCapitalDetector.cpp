#include "analytics/IdleCapitalDetector.h"
#include "common/Logger.h"

#include <algorithm>

namespace capflow {
namespace analytics {

IdleCapitalDetector::IdleCapitalDetector(
    std::shared_ptr<ledger::CapitalLedger> ledger,
    std::shared_ptr<core::IYieldOracle> yields,
    std::shared_ptr<IClock> clock,
    engine::DetectorConfig config,
    std::shared_ptr<core::IEventJournal> journal
)
    : ledger_(std::move(ledger))
    , yields_(std::move(yields))
    , clock_(std::move(clock))
    , journal_(std::move(journal))
    , config_(config) {}

void IdleCapitalDetector::setConfig(const engine::DetectorConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

ScanReport IdleCapitalDetector::scan(const Asset& asset) {
    ScanReport report;
    report.asset = asset;

    const auto entry = ledger_->snapshot(asset);
    if (!entry) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
        return report;
    }

    const long long now = clock_->nowMs();
    engine::DetectorConfig cfg;
    std::map<VenueId, long long> previous_detection_ms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg = config_;
        for (auto it = latest_.begin(); it != latest_.end();) {
            if (it->first.first == asset) {
                previous_detection_ms[it->first.second] = it->second.detected_at_ms;
                it = latest_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& [venue, balance] : entry->per_venue_balance) {
        if (balance <= 0) {
            continue;
        }
        const PairKey key{asset, venue};

        core::IdleDetection d;
        d.asset = asset;
        d.venue = venue;
        d.total_capital = balance;
        d.detected_at_ms = now;

        if (venue == kUnallocatedVenue) {
            d.utilization_bps = 0;
            d.current_yield_bps = 0;
        } else {
            const auto util = ledger_->utilization(asset, venue);
            if (!util) {
                report.skipped_venues.push_back(venue);
                std::lock_guard<std::mutex> lock(mutex_);
                states_[key] = core::IdleState::UNKNOWN;
                idle_since_.erase(key);
                LOG_WARN("Idle scan skipped venue: asset={}, venue={} (utilization unavailable)", asset, venue);
                continue;
            }
            d.utilization_bps = *util;
            try {
                d.current_yield_bps = yields_->yieldBps(asset, venue);
            } catch (const std::exception& e) {
                report.skipped_venues.push_back(venue);
                std::lock_guard<std::mutex> lock(mutex_);
                states_[key] = core::IdleState::UNKNOWN;
                idle_since_.erase(key);
                LOG_WARN("Idle scan skipped venue: asset={}, venue={}, error={}", asset, venue, e.what());
                continue;
            }
        }

        d.active_capital = applyBps(balance, d.utilization_bps);
        d.idle_amount = balance - d.active_capital;
        d.best_alternative_yield_bps = bestAlternativeYield(asset, venue);
        d.opportunity_cost = opportunityCost(d);

        const bool below = d.utilization_bps < cfg.utilization_threshold_bps &&
                           d.idle_amount >= cfg.idle_threshold;

        bool time_ok = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!below) {
                idle_since_.erase(key);
            } else {
                idle_since_.emplace(key, now);
                d.idle_since_ms = idle_since_.at(key);
            }
            if (cfg.legacy_previous_detection_timing) {
                auto prev = previous_detection_ms.find(venue);
                const long long reference = (prev == previous_detection_ms.end()) ? 0 : prev->second;
                time_ok = below && (now - reference >= cfg.time_threshold_ms);
            } else {
                time_ok = below && (now - d.idle_since_ms >= cfg.time_threshold_ms);
            }
        }

        d.is_idle = below && time_ok;
        d.is_reallocatable = isReallocatable(d);
        if (!below) {
            d.state = core::IdleState::MONITORED;
        } else if (!d.is_idle) {
            d.state = core::IdleState::IDLE;
        } else {
            d.state = d.is_reallocatable ? core::IdleState::REALLOCATABLE : core::IdleState::NOT_REALLOCATABLE;
        }

        remember(d);
        report.detections.push_back(d);

        if (d.is_reallocatable && journal_) {
            core::JournalEvent event;
            event.ts_ms = now;
            event.type = core::JournalEventType::IDLE_DETECTED;
            event.asset = asset;
            event.entity_id = venue;
            event.payload["idle_amount"] = d.idle_amount;
            event.payload["utilization_bps"] = d.utilization_bps;
            event.payload["current_yield_bps"] = d.current_yield_bps;
            event.payload["best_alternative_yield_bps"] = d.best_alternative_yield_bps;
            event.payload["opportunity_cost"] = d.opportunity_cost;
            if (!journal_->append(event)) {
                LOG_WARN("Journal append failed: IDLE_DETECTED {}/{}", asset, venue);
            }
        }
    }

    LOG_INFO("Idle scan: asset={}, venues={}, reallocatable={}, skipped={}",
             asset, report.detections.size(),
             std::count_if(report.detections.begin(), report.detections.end(),
                           [](const core::IdleDetection& d) { return d.is_reallocatable; }),
             report.skipped_venues.size());
    return report;
}

Bps IdleCapitalDetector::bestAlternativeYield(const Asset& asset, const VenueId& venue) const {
    Bps best = 0;
    const auto& registry = ledger_->venues();
    for (const auto& candidate : registry.venueIds()) {
        if (candidate == venue || registry.isFrozen(candidate)) {
            continue;
        }
        try {
            best = std::max(best, yields_->yieldBps(asset, candidate));
        } catch (const std::exception& e) {
            LOG_WARN("Alternative yield unavailable: asset={}, venue={}, error={}", asset, candidate, e.what());
        }
    }
    return best;
}

void IdleCapitalDetector::remember(const core::IdleDetection& detection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const PairKey key{detection.asset, detection.venue};
    latest_[key] = detection;
    states_[key] = detection.state;
    auto& past = history_[key];
    past.push_back(detection);
    while (past.size() > std::max<std::size_t>(config_.history_limit, 1)) {
        past.pop_front();
    }
}

double IdleCapitalDetector::opportunityCost(const core::IdleDetection& detection) {
    const Bps spread = std::max(0, detection.best_alternative_yield_bps - detection.current_yield_bps);
    return static_cast<double>(detection.idle_amount) * static_cast<double>(spread) / kBpsDenominator;
}

bool IdleCapitalDetector::isReallocatable(const core::IdleDetection& detection) const {
    if (!detection.is_idle) {
        return false;
    }
    Amount minimum = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        minimum = config_.min_reallocation_amount;
    }
    if (detection.idle_amount < minimum) {
        return false;
    }
    return detection.venue == kUnallocatedVenue || !ledger_->venues().isFrozen(detection.venue);
}

std::optional<core::IdleDetection> IdleCapitalDetector::latest(const Asset& asset, const VenueId& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_.find({asset, venue});
    if (it == latest_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::IdleDetection> IdleCapitalDetector::latestDetections(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::IdleDetection> out;
    for (const auto& [key, detection] : latest_) {
        if (key.first == asset) {
            out.push_back(detection);
        }
    }
    return out;
}

std::vector<core::IdleDetection> IdleCapitalDetector::history(const Asset& asset, const VenueId& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find({asset, venue});
    if (it == history_.end()) {
        return {};
    }
    return std::vector<core::IdleDetection>(it->second.begin(), it->second.end());
}

core::IdleState IdleCapitalDetector::state(const Asset& asset, const VenueId& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find({asset, venue});
    return (it == states_.end()) ? core::IdleState::UNKNOWN : it->second;
}

} // namespace analytics
} // namespace capflow
