#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "common/Clock.h"
#include "common/Errors.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IYieldOracle.h"
#include "core/model/AllocationTypes.h"
#include "engine/EngineConfig.h"
#include "ledger/CapitalLedger.h"

namespace capflow {
namespace analytics {

struct ScanReport {
    Asset asset;
    OperationResult status;
    std::vector<core::IdleDetection> detections;   // ascending venue id
    std::vector<VenueId> skipped_venues;           // adapter/oracle failures
};

// Finds capital parked below its venue's utilization target.
//
// Per (asset, venue): UNKNOWN -> MONITORED -> IDLE -> REALLOCATABLE | NOT_REALLOCATABLE
//   MONITORED          observed, not idle
//   IDLE               idle conditions met, time threshold not yet reached
//   REALLOCATABLE      idle and movable
//   NOT_REALLOCATABLE  idle but below the minimum move or frozen
// Read-only with respect to the ledger.
class IdleCapitalDetector {
public:
    IdleCapitalDetector(
        std::shared_ptr<ledger::CapitalLedger> ledger,
        std::shared_ptr<core::IYieldOracle> yields,
        std::shared_ptr<IClock> clock,
        engine::DetectorConfig config,
        std::shared_ptr<core::IEventJournal> journal = nullptr
    );

    ScanReport scan(const Asset& asset);

    std::optional<core::IdleDetection> latest(const Asset& asset, const VenueId& venue) const;
    std::vector<core::IdleDetection> latestDetections(const Asset& asset) const;
    std::vector<core::IdleDetection> history(const Asset& asset, const VenueId& venue) const;
    core::IdleState state(const Asset& asset, const VenueId& venue) const;

    // Ranking signal only; never moves funds.
    static double opportunityCost(const core::IdleDetection& detection);
    bool isReallocatable(const core::IdleDetection& detection) const;

    const engine::DetectorConfig& config() const { return config_; }
    void setConfig(const engine::DetectorConfig& config);

private:
    using PairKey = std::pair<Asset, VenueId>;

    Bps bestAlternativeYield(const Asset& asset, const VenueId& venue) const;
    bool timeThresholdReached(const PairKey& key, long long now_ms, bool below_threshold);
    void remember(const core::IdleDetection& detection);

    std::shared_ptr<ledger::CapitalLedger> ledger_;
    std::shared_ptr<core::IYieldOracle> yields_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<core::IEventJournal> journal_;
    engine::DetectorConfig config_;

    mutable std::mutex mutex_;
    std::map<PairKey, core::IdleDetection> latest_;
    std::map<PairKey, std::deque<core::IdleDetection>> history_;
    std::map<PairKey, core::IdleState> states_;
    std::map<PairKey, long long> idle_since_;
};

} // namespace analytics
} // namespace capflow
