#pragma once

#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/contracts/IRiskOracle.h"
#include "core/contracts/IYieldOracle.h"
#include "core/model/AllocationTypes.h"
#include "ledger/CapitalLedger.h"

namespace capflow {
namespace strategy {

constexpr Amount kUnboundedCapacity = std::numeric_limits<Amount>::max();

// Point-in-time view of one venue for one asset.
struct VenueMetrics {
    VenueId venue;
    Bps yield_bps = 0;
    int risk_score = 0;
    Amount liquidity_depth = 0;
    Amount fixed_execution_cost = 0;
    Bps execution_cost_bps = 0;
    Amount remaining_capacity = kUnboundedCapacity;
    bool frozen = false;
};

struct ScoringParams {
    core::ScoringWeights weights;
    Bps yield_threshold_bps = 50;
    int max_risk_increase = 100;
    Bps size_fraction_bps = kBpsDenominator;
    long long ttl_ms = 180000;
    double depth_saturation_multiple = 5.0;
    std::string strategy_id;
};

// Turns reallocatable detections into ranked opportunities:
//   score = wy*yield/maxYield + wr*(1 - risk/100) + wl*depthFit - wc*cost/grossBenefit
// Pure: no I/O, no clock, no state.
class ReallocationScorer {
public:
    static std::vector<core::ReallocationOpportunity> score(
        const std::vector<core::IdleDetection>& detections,
        const std::map<VenueId, VenueMetrics>& metrics,
        const ScoringParams& params,
        long long now_ms
    );

    static double estimatedCost(const VenueMetrics& source, const VenueMetrics& target, Amount amount);

    // Strict ranking order: score desc, net benefit desc, risk asc, target id, source id.
    static bool ranksBefore(const core::ReallocationOpportunity& a, const core::ReallocationOpportunity& b);
};

// Gathers VenueMetrics for every registered venue plus the unallocated
// bucket. Venues whose oracles or adapter fail are left out.
std::map<VenueId, VenueMetrics> collectVenueMetrics(
    const Asset& asset,
    const ledger::CapitalLedger& ledger,
    core::IYieldOracle& yields,
    core::IRiskOracle& risks
);

} // namespace strategy
} // namespace capflow
