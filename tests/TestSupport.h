#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "analytics/IdleCapitalDetector.h"
#include "common/Clock.h"
#include "core/adapters/ConfiguredOracles.h"
#include "core/adapters/SimulatedVenueAdapter.h"
#include "core/adapters/VenueYieldOracle.h"
#include "core/orchestration/AllocationCycleCoordinator.h"
#include "engine/EngineConfig.h"
#include "execution/RateLimiter.h"
#include "execution/ReallocationExecutor.h"
#include "ledger/AssetLockTable.h"
#include "ledger/CapitalLedger.h"
#include "ledger/VenueRegistry.h"
#include "strategy/StrategyManager.h"

namespace capflow {
namespace test {

// Simulated venue with hooks for the failure paths the simulator alone
// cannot reach: a callback inside withdraw and deposits that throw.
class ScriptedVenueAdapter : public core::SimulatedVenueAdapter {
public:
    using core::SimulatedVenueAdapter::SimulatedVenueAdapter;

    Amount withdraw(const Asset& asset, Amount amount) override {
        if (on_withdraw) {
            on_withdraw();
        }
        return core::SimulatedVenueAdapter::withdraw(asset, amount);
    }

    Amount deposit(const Asset& asset, Amount amount) override {
        if (fail_deposits) {
            throw core::VenueUnavailableError(venueId() + ": deposit rejected");
        }
        return core::SimulatedVenueAdapter::deposit(asset, amount);
    }

    std::function<void()> on_withdraw;
    bool fail_deposits = false;
};

// Full in-process wiring with a manual clock and no journal.
struct Harness {
    explicit Harness(engine::DetectorConfig detector_config = {},
                     engine::RateLimitDefaults rate_limit = {},
                     long long start_ms = 1000000,
                     std::size_t opportunity_retention = 256)
        : clock(std::make_shared<ManualClock>(start_ms))
        , registry(std::make_shared<ledger::VenueRegistry>())
        , locks(std::make_shared<ledger::AssetLockTable>())
        , ledger(std::make_shared<ledger::CapitalLedger>(registry, locks, clock))
        , yields(std::make_shared<core::VenueYieldOracle>(registry))
        , risks(std::make_shared<core::ConfiguredRiskOracle>())
        , detector(std::make_shared<analytics::IdleCapitalDetector>(ledger, yields, clock, detector_config))
        , strategies(std::make_shared<strategy::StrategyManager>(ledger, clock, engine::StrategyDefaults{}))
        , limiter(std::make_shared<execution::RateLimiter>(rate_limit.cooldown_ms,
                                                           rate_limit.max_reallocation_bps_per_cycle))
        , executor(std::make_shared<execution::ReallocationExecutor>(
              ledger, detector, strategies, limiter, yields, risks, clock, 180000, nullptr,
              opportunity_retention))
        , coordinator(std::make_shared<core::AllocationCycleCoordinator>(
              ledger, detector, executor, strategies, yields, risks, clock, engine::ScorerConfig{})) {}

    std::shared_ptr<ScriptedVenueAdapter> addVenue(const VenueId& id, Bps yield_bps, Bps utilization_bps,
                                                   int risk_score, Amount fixed_cost = 100,
                                                   Amount depth = 1000000) {
        auto adapter = std::make_shared<ScriptedVenueAdapter>(id, yield_bps, utilization_bps, depth);
        ledger::VenueDescriptor descriptor;
        descriptor.id = id;
        descriptor.adapter = adapter;
        descriptor.fixed_execution_cost = fixed_cost;
        registry->registerVenue(descriptor);
        risks->setVenueRisk(id, risk_score);
        venues[id] = adapter;
        return adapter;
    }

    core::ReallocationOpportunity opportunity(const Asset& asset, const VenueId& from, const VenueId& to,
                                              Amount amount, Amount idle_available) const {
        core::ReallocationOpportunity op;
        op.asset = asset;
        op.from_venue = from;
        op.to_venue = to;
        op.amount = amount;
        op.idle_capital_available = idle_available;
        op.min_yield_spread_bps = 50;
        op.created_at_ms = clock->nowMs();
        op.expires_at_ms = clock->nowMs() + 180000;
        return op;
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<ledger::VenueRegistry> registry;
    std::shared_ptr<ledger::AssetLockTable> locks;
    std::shared_ptr<ledger::CapitalLedger> ledger;
    std::shared_ptr<core::VenueYieldOracle> yields;
    std::shared_ptr<core::ConfiguredRiskOracle> risks;
    std::shared_ptr<analytics::IdleCapitalDetector> detector;
    std::shared_ptr<strategy::StrategyManager> strategies;
    std::shared_ptr<execution::RateLimiter> limiter;
    std::shared_ptr<execution::ReallocationExecutor> executor;
    std::shared_ptr<core::AllocationCycleCoordinator> coordinator;
    std::map<VenueId, std::shared_ptr<ScriptedVenueAdapter>> venues;
};

} // namespace test
} // namespace capflow
