#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/Errors.h"
#include "core/model/AllocationTypes.h"
#include "ledger/CapitalLedger.h"

namespace capflow {
namespace strategy {

// One completed leg of a strategy: yield promised when proposed vs. yield
// observed afterwards on the target.
struct PerformanceSample {
    VenueId venue;
    Bps forecast_bps = 0;
    Bps realized_bps = 0;
};

// Stateless helpers behind ReallocationStrategy: presets, validation,
// weight split and EWMA adaptation.
class OrchestrationStrategy {
public:
    static core::ScoringWeights presetWeights(core::StrategyKind kind);

    // Strategy skeleton with the preset scoring weights for `kind`.
    static core::ReallocationStrategy makeStrategy(
        const std::string& name,
        core::StrategyKind kind,
        const Asset& asset,
        std::vector<VenueId> source_venues,
        std::vector<VenueId> target_venues,
        std::vector<Bps> target_weights,
        Bps min_yield_improvement_bps,
        long long execution_frequency_ms
    );

    static OperationResult validate(
        const core::ReallocationStrategy& strategy,
        const ledger::CapitalLedger& ledger,
        long long minimum_interval_ms
    );

    // floor(total * w / 10000) per target; rounding remainder to the first.
    static std::vector<std::pair<VenueId, Amount>> splitByWeights(
        Amount total,
        const std::vector<VenueId>& targets,
        const std::vector<Bps>& weights
    );

    // w' = (1 - alpha) * w + alpha * w * (realized / forecast), renormalized
    // to 10000 with the remainder on the first target. Targets without a
    // usable sample keep ratio 1.
    static std::vector<Bps> adaptWeights(
        const std::vector<VenueId>& targets,
        const std::vector<Bps>& weights,
        const std::vector<PerformanceSample>& samples,
        double alpha
    );
};

} // namespace strategy
} // namespace capflow
