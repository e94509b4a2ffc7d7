#include "strategy/OrchestrationStrategy.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>

namespace capflow {
namespace strategy {

core::ScoringWeights OrchestrationStrategy::presetWeights(core::StrategyKind kind) {
    core::ScoringWeights w;
    switch (kind) {
        case core::StrategyKind::YIELD_MAXIMIZING:
            w.yield_bps = 6000; w.risk_bps = 1500; w.liquidity_bps = 1500; w.cost_bps = 1000;
            break;
        case core::StrategyKind::RISK_MINIMIZING:
            w.yield_bps = 1500; w.risk_bps = 6000; w.liquidity_bps = 1500; w.cost_bps = 1000;
            break;
        case core::StrategyKind::LIQUIDITY_OPTIMIZING:
            w.yield_bps = 2000; w.risk_bps = 2000; w.liquidity_bps = 5000; w.cost_bps = 1000;
            break;
        case core::StrategyKind::BALANCED:
            w.yield_bps = 4000; w.risk_bps = 3000; w.liquidity_bps = 2000; w.cost_bps = 1000;
            break;
    }
    return w;
}

core::ReallocationStrategy OrchestrationStrategy::makeStrategy(
    const std::string& name,
    core::StrategyKind kind,
    const Asset& asset,
    std::vector<VenueId> source_venues,
    std::vector<VenueId> target_venues,
    std::vector<Bps> target_weights,
    Bps min_yield_improvement_bps,
    long long execution_frequency_ms
) {
    core::ReallocationStrategy s;
    s.name = name;
    s.kind = kind;
    s.asset = asset;
    s.source_venues = std::move(source_venues);
    s.target_venues = std::move(target_venues);
    s.target_weights = std::move(target_weights);
    s.scoring_weights = presetWeights(kind);
    s.min_yield_improvement_bps = min_yield_improvement_bps;
    s.execution_frequency_ms = execution_frequency_ms;
    return s;
}

OperationResult OrchestrationStrategy::validate(
    const core::ReallocationStrategy& strategy,
    const ledger::CapitalLedger& ledger,
    long long minimum_interval_ms
) {
    if (!ledger.isRegistered(strategy.asset)) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + strategy.asset);
    }
    if (strategy.target_venues.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "strategy has no target venues");
    }
    if (strategy.source_venues.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "strategy has no source venues");
    }
    if (strategy.target_venues.size() != strategy.target_weights.size()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "target venues and weights differ in size");
    }
    const long long weight_sum = std::accumulate(strategy.target_weights.begin(), strategy.target_weights.end(), 0LL);
    if (weight_sum != kBpsDenominator) {
        return OperationResult::failure(ErrorCode::VALIDATION,
            "target weights must sum to 10000 bps, got " + std::to_string(weight_sum));
    }
    if (std::any_of(strategy.target_weights.begin(), strategy.target_weights.end(), [](Bps w) { return w < 0; })) {
        return OperationResult::failure(ErrorCode::VALIDATION, "negative target weight");
    }
    if (strategy.scoring_weights.sum() != kBpsDenominator) {
        return OperationResult::failure(ErrorCode::VALIDATION, "scoring weights must sum to 10000 bps");
    }
    if (strategy.execution_frequency_ms < minimum_interval_ms) {
        return OperationResult::failure(ErrorCode::VALIDATION,
            "execution frequency below minimum interval of " + std::to_string(minimum_interval_ms) + " ms");
    }
    if (strategy.min_yield_improvement_bps < 0 || strategy.max_risk_increase < 0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "thresholds must be non-negative");
    }
    if (strategy.adaptation_alpha < 0.0 || strategy.adaptation_alpha > 1.0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "adaptation alpha must be within [0, 1]");
    }

    const auto& registry = ledger.venues();
    std::set<VenueId> targets;
    for (const auto& venue : strategy.target_venues) {
        if (!registry.contains(venue)) {
            return OperationResult::failure(ErrorCode::VALIDATION, "unknown target venue: " + venue);
        }
        if (!targets.insert(venue).second) {
            return OperationResult::failure(ErrorCode::VALIDATION, "duplicate target venue: " + venue);
        }
    }
    for (const auto& venue : strategy.source_venues) {
        if (venue != kUnallocatedVenue && !registry.contains(venue)) {
            return OperationResult::failure(ErrorCode::VALIDATION, "unknown source venue: " + venue);
        }
    }
    return OperationResult::success();
}

std::vector<std::pair<VenueId, Amount>> OrchestrationStrategy::splitByWeights(
    Amount total,
    const std::vector<VenueId>& targets,
    const std::vector<Bps>& weights
) {
    std::vector<std::pair<VenueId, Amount>> out;
    if (targets.empty() || targets.size() != weights.size() || total <= 0) {
        return out;
    }
    Amount assigned = 0;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        const Amount share = applyBps(total, weights[i]);
        out.emplace_back(targets[i], share);
        assigned += share;
    }
    out.front().second += total - assigned;
    return out;
}

std::vector<Bps> OrchestrationStrategy::adaptWeights(
    const std::vector<VenueId>& targets,
    const std::vector<Bps>& weights,
    const std::vector<PerformanceSample>& samples,
    double alpha
) {
    if (targets.empty() || targets.size() != weights.size()) {
        return weights;
    }
    alpha = std::clamp(alpha, 0.0, 1.0);

    std::map<VenueId, std::pair<double, int>> ratios;
    for (const auto& sample : samples) {
        if (sample.forecast_bps <= 0) {
            continue;
        }
        auto& acc = ratios[sample.venue];
        acc.first += std::max(0.0, static_cast<double>(sample.realized_bps) / sample.forecast_bps);
        acc.second += 1;
    }

    std::vector<double> raw(weights.size(), 0.0);
    double raw_sum = 0.0;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        double ratio = 1.0;
        auto it = ratios.find(targets[i]);
        if (it != ratios.end() && it->second.second > 0) {
            ratio = it->second.first / it->second.second;
        }
        const double w = static_cast<double>(weights[i]);
        raw[i] = std::max(0.0, (1.0 - alpha) * w + alpha * w * ratio);
        raw_sum += raw[i];
    }
    if (raw_sum <= 0.0) {
        return weights;
    }

    std::vector<Bps> out(weights.size(), 0);
    Bps assigned = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        out[i] = static_cast<Bps>(std::floor(raw[i] * kBpsDenominator / raw_sum));
        assigned += out[i];
    }
    out.front() += kBpsDenominator - assigned;
    return out;
}

} // namespace strategy
} // namespace capflow
