#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analytics/IdleCapitalDetector.h"
#include "common/Clock.h"
#include "common/Errors.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IRiskOracle.h"
#include "core/contracts/IYieldOracle.h"
#include "engine/EngineConfig.h"
#include "execution/ReallocationExecutor.h"
#include "ledger/CapitalLedger.h"
#include "strategy/ReallocationScorer.h"
#include "strategy/StrategyManager.h"

namespace capflow {
namespace core {

struct CycleReport {
    Asset asset;
    OperationResult status;
    analytics::ScanReport scan;
    std::size_t ranked_opportunities = 0;
    std::vector<std::string> proposed_ids;
    std::vector<execution::ExecutionReport> executions;
    bool reallocated = false;
};

struct AdaptReport {
    std::string strategy_id;
    OperationResult status;
    std::size_t samples = 0;
    std::vector<Bps> previous_weights;
    std::vector<Bps> adapted_weights;
};

// One keeper cycle per asset:
//   scan -> score -> propose best per source -> execute in rank order
// until a reallocation completes or the rate limiter refuses.
class AllocationCycleCoordinator {
public:
    AllocationCycleCoordinator(
        std::shared_ptr<ledger::CapitalLedger> ledger,
        std::shared_ptr<analytics::IdleCapitalDetector> detector,
        std::shared_ptr<execution::ReallocationExecutor> executor,
        std::shared_ptr<strategy::StrategyManager> strategies,
        std::shared_ptr<IYieldOracle> yields,
        std::shared_ptr<IRiskOracle> risks,
        std::shared_ptr<IClock> clock,
        engine::ScorerConfig scorer_config,
        std::shared_ptr<IEventJournal> journal = nullptr
    );

    CycleReport runCycle(const Asset& asset);

    // Empty list = every registered asset. Assets run independently.
    std::vector<CycleReport> runDailyRebalance(const std::vector<Asset>& assets);

    AdaptReport adaptStrategy(const std::string& strategy_id);

    const engine::ScorerConfig& scorerConfig() const { return scorer_config_; }

private:
    strategy::ScoringParams scoringParamsFor(const Asset& asset) const;

    std::shared_ptr<ledger::CapitalLedger> ledger_;
    std::shared_ptr<analytics::IdleCapitalDetector> detector_;
    std::shared_ptr<execution::ReallocationExecutor> executor_;
    std::shared_ptr<strategy::StrategyManager> strategies_;
    std::shared_ptr<IYieldOracle> yields_;
    std::shared_ptr<IRiskOracle> risks_;
    std::shared_ptr<IClock> clock_;
    engine::ScorerConfig scorer_config_;
    std::shared_ptr<IEventJournal> journal_;
};

} // namespace core
} // namespace capflow
