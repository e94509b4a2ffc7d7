#include "core/orchestration/AllocationCycleCoordinator.h"
#include "common/Logger.h"
#include "strategy/OrchestrationStrategy.h"

#include <set>

namespace capflow {
namespace core {

AllocationCycleCoordinator::AllocationCycleCoordinator(
    std::shared_ptr<ledger::CapitalLedger> ledger,
    std::shared_ptr<analytics::IdleCapitalDetector> detector,
    std::shared_ptr<execution::ReallocationExecutor> executor,
    std::shared_ptr<strategy::StrategyManager> strategies,
    std::shared_ptr<IYieldOracle> yields,
    std::shared_ptr<IRiskOracle> risks,
    std::shared_ptr<IClock> clock,
    engine::ScorerConfig scorer_config,
    std::shared_ptr<IEventJournal> journal
)
    : ledger_(std::move(ledger))
    , detector_(std::move(detector))
    , executor_(std::move(executor))
    , strategies_(std::move(strategies))
    , yields_(std::move(yields))
    , risks_(std::move(risks))
    , clock_(std::move(clock))
    , scorer_config_(std::move(scorer_config))
    , journal_(std::move(journal)) {}

strategy::ScoringParams AllocationCycleCoordinator::scoringParamsFor(const Asset& asset) const {
    strategy::ScoringParams params;
    params.yield_threshold_bps = scorer_config_.yield_threshold_bps;
    params.size_fraction_bps = scorer_config_.size_fraction_bps;
    params.ttl_ms = scorer_config_.opportunity_ttl_ms;
    params.depth_saturation_multiple = scorer_config_.depth_saturation_multiple;

    const auto active = strategies_->activeFor(asset);
    if (!active.empty()) {
        params.weights = active.front().scoring_weights;
        params.max_risk_increase = active.front().max_risk_increase;
        params.strategy_id = active.front().id;
    } else {
        params.weights = strategy::OrchestrationStrategy::presetWeights(
            strategyKindFromString(scorer_config_.default_strategy));
    }
    return params;
}

CycleReport AllocationCycleCoordinator::runCycle(const Asset& asset) {
    CycleReport report;
    report.asset = asset;

    if (ledger_->isHalted(asset)) {
        report.status = OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "asset halted: " + asset);
        LOG_WARN("Cycle skipped: asset={} is halted", asset);
        return report;
    }

    report.scan = detector_->scan(asset);
    if (!report.scan.status.ok()) {
        report.status = report.scan.status;
        return report;
    }

    std::vector<IdleDetection> reallocatable;
    for (const auto& d : report.scan.detections) {
        if (d.is_reallocatable) {
            reallocatable.push_back(d);
        }
    }
    if (reallocatable.empty()) {
        return report;
    }

    const auto metrics = strategy::collectVenueMetrics(asset, *ledger_, *yields_, *risks_);
    const auto params = scoringParamsFor(asset);
    const auto ranked = strategy::ReallocationScorer::score(reallocatable, metrics, params, clock_->nowMs());
    report.ranked_opportunities = ranked.size();

    // Best opportunity per source venue, kept in rank order.
    std::set<VenueId> sources_taken;
    for (const auto& candidate : ranked) {
        if (!sources_taken.insert(candidate.from_venue).second) {
            continue;
        }
        const auto proposed = executor_->propose(candidate);
        if (proposed.status.ok()) {
            report.proposed_ids.push_back(proposed.opportunity_id);
        }
    }

    for (const auto& id : report.proposed_ids) {
        auto execution = executor_->execute(id);
        const bool completed = execution.state == OpportunityState::COMPLETED;
        const ErrorCode code = execution.status.code;
        report.executions.push_back(std::move(execution));
        if (completed) {
            report.reallocated = true;
            break;
        }
        if (code == ErrorCode::RATE_LIMITED || code == ErrorCode::ASSET_LOCKED) {
            break;
        }
    }

    if (!report.reallocated && !report.executions.empty()) {
        report.status = report.executions.back().status;
    }
    LOG_INFO("Cycle done: asset={}, detections={}, ranked={}, proposed={}, executed={}, reallocated={}",
             asset, report.scan.detections.size(), report.ranked_opportunities, report.proposed_ids.size(),
             report.executions.size(), report.reallocated);
    return report;
}

std::vector<CycleReport> AllocationCycleCoordinator::runDailyRebalance(const std::vector<Asset>& assets) {
    const auto targets = assets.empty() ? ledger_->assets() : assets;
    std::vector<CycleReport> reports;
    reports.reserve(targets.size());
    for (const auto& asset : targets) {
        reports.push_back(runCycle(asset));
    }
    return reports;
}

AdaptReport AllocationCycleCoordinator::adaptStrategy(const std::string& strategy_id) {
    AdaptReport report;
    report.strategy_id = strategy_id;

    const auto s = strategies_->get(strategy_id);
    if (!s) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown strategy: " + strategy_id);
        return report;
    }
    report.previous_weights = s->target_weights;
    report.adapted_weights = s->target_weights;
    if (!s->adaptive) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "strategy is not adaptive: " + strategy_id);
        return report;
    }

    // Each completed leg feeds exactly one smoothing step.
    std::vector<strategy::PerformanceSample> samples;
    for (const auto& leg : executor_->takeAdaptationSamples(strategy_id)) {
        try {
            strategy::PerformanceSample sample;
            sample.venue = leg.to_venue;
            sample.forecast_bps = leg.target_yield_bps;
            sample.realized_bps = yields_->yieldBps(leg.asset, leg.to_venue);
            samples.push_back(sample);
        } catch (const std::exception& e) {
            LOG_WARN("Adapt sample skipped: strategy={}, venue={}, error={}", strategy_id, leg.to_venue, e.what());
        }
    }
    report.samples = samples.size();
    if (samples.empty()) {
        return report;
    }

    report.adapted_weights = strategy::OrchestrationStrategy::adaptWeights(
        s->target_venues, s->target_weights, samples, s->adaptation_alpha);
    report.status = strategies_->updateTargetWeights(strategy_id, report.adapted_weights);
    if (!report.status.ok()) {
        report.adapted_weights = report.previous_weights;
        return report;
    }

    LOG_INFO("Strategy adapted: id={}, samples={}, alpha={:.2f}", strategy_id, samples.size(), s->adaptation_alpha);
    if (journal_) {
        JournalEvent event;
        event.ts_ms = clock_->nowMs();
        event.type = JournalEventType::STRATEGY_ADAPTED;
        event.asset = s->asset;
        event.entity_id = strategy_id;
        event.payload["previous_weights"] = report.previous_weights;
        event.payload["adapted_weights"] = report.adapted_weights;
        event.payload["samples"] = report.samples;
        if (!journal_->append(event)) {
            LOG_WARN("Journal append failed: STRATEGY_ADAPTED {}", strategy_id);
        }
    }
    return report;
}

} // namespace core
} // namespace capflow
