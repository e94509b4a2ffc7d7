#include "strategy/ReallocationScorer.h"
#include "common/Logger.h"

#include <algorithm>
#include <tuple>

namespace capflow {
namespace strategy {
namespace {
double weight(Bps bps) {
    return static_cast<double>(bps) / kBpsDenominator;
}
}

double ReallocationScorer::estimatedCost(const VenueMetrics& source, const VenueMetrics& target, Amount amount) {
    const double variable = static_cast<double>(amount) *
        static_cast<double>(source.execution_cost_bps + target.execution_cost_bps) / kBpsDenominator;
    return static_cast<double>(source.fixed_execution_cost + target.fixed_execution_cost) + variable;
}

bool ReallocationScorer::ranksBefore(const core::ReallocationOpportunity& a, const core::ReallocationOpportunity& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.net_benefit != b.net_benefit) {
        return a.net_benefit > b.net_benefit;
    }
    return std::tie(a.risk_score, a.to_venue, a.from_venue) <
           std::tie(b.risk_score, b.to_venue, b.from_venue);
}

std::vector<core::ReallocationOpportunity> ReallocationScorer::score(
    const std::vector<core::IdleDetection>& detections,
    const std::map<VenueId, VenueMetrics>& metrics,
    const ScoringParams& params,
    long long now_ms
) {
    std::vector<core::ReallocationOpportunity> ranked;

    Bps max_yield = 0;
    for (const auto& [venue, m] : metrics) {
        if (venue != kUnallocatedVenue && !m.frozen) {
            max_yield = std::max(max_yield, m.yield_bps);
        }
    }

    for (const auto& d : detections) {
        if (!d.is_reallocatable || d.idle_amount <= 0) {
            continue;
        }
        auto source_it = metrics.find(d.venue);
        if (source_it == metrics.end()) {
            continue;
        }
        const VenueMetrics& source = source_it->second;

        for (const auto& [venue, target] : metrics) {
            if (venue == d.venue || venue == kUnallocatedVenue || target.frozen) {
                continue;
            }
            if (target.remaining_capacity <= 0) {
                continue;
            }
            if (target.yield_bps <= source.yield_bps + params.yield_threshold_bps) {
                continue;
            }
            if (target.risk_score - source.risk_score > params.max_risk_increase) {
                continue;
            }

            const Amount amount = std::min(applyBps(d.idle_amount, params.size_fraction_bps),
                                           target.remaining_capacity);
            if (amount <= 0) {
                continue;
            }

            const Bps improvement = target.yield_bps - source.yield_bps;
            const double gross_benefit = static_cast<double>(amount) * improvement / kBpsDenominator;
            const double cost = estimatedCost(source, target, amount);
            const double net_benefit = gross_benefit - cost;
            if (net_benefit <= 0.0) {
                continue;
            }

            const double norm_yield = (max_yield > 0)
                ? static_cast<double>(target.yield_bps) / static_cast<double>(max_yield) : 0.0;
            const double norm_risk = std::clamp(target.risk_score / 100.0, 0.0, 1.0);
            const double saturation = static_cast<double>(amount) * params.depth_saturation_multiple;
            const double norm_liquidity = (saturation > 0.0)
                ? std::clamp(static_cast<double>(target.liquidity_depth) / saturation, 0.0, 1.0) : 0.0;
            const double norm_cost = std::clamp(cost / gross_benefit, 0.0, 1.0);

            core::ReallocationOpportunity op;
            op.asset = d.asset;
            op.from_venue = d.venue;
            op.to_venue = venue;
            op.amount = amount;
            op.idle_capital_available = d.idle_amount;
            op.current_yield_bps = source.yield_bps;
            op.target_yield_bps = target.yield_bps;
            op.yield_improvement_bps = improvement;
            op.min_yield_spread_bps = params.yield_threshold_bps;
            op.estimated_cost = cost;
            op.net_benefit = net_benefit;
            op.risk_score = target.risk_score;
            op.source_risk_score = source.risk_score;
            op.score = weight(params.weights.yield_bps) * norm_yield
                     + weight(params.weights.risk_bps) * (1.0 - norm_risk)
                     + weight(params.weights.liquidity_bps) * norm_liquidity
                     - weight(params.weights.cost_bps) * norm_cost;
            op.confidence = norm_liquidity * (1.0 - norm_risk);
            op.created_at_ms = now_ms;
            op.expires_at_ms = now_ms + params.ttl_ms;
            op.strategy_id = params.strategy_id;
            ranked.push_back(std::move(op));
        }
    }

    std::sort(ranked.begin(), ranked.end(), &ReallocationScorer::ranksBefore);
    return ranked;
}

std::map<VenueId, VenueMetrics> collectVenueMetrics(
    const Asset& asset,
    const ledger::CapitalLedger& ledger,
    core::IYieldOracle& yields,
    core::IRiskOracle& risks
) {
    std::map<VenueId, VenueMetrics> out;

    VenueMetrics bucket;
    bucket.venue = kUnallocatedVenue;
    out.emplace(kUnallocatedVenue, bucket);

    const auto& registry = ledger.venues();
    for (const auto& id : registry.venueIds()) {
        const auto descriptor = registry.get(id);
        if (!descriptor || !descriptor->adapter) {
            continue;
        }
        VenueMetrics m;
        m.venue = id;
        m.fixed_execution_cost = descriptor->fixed_execution_cost;
        m.execution_cost_bps = descriptor->execution_cost_bps;
        m.frozen = descriptor->frozen;
        if (descriptor->max_capacity > 0) {
            m.remaining_capacity = std::max<Amount>(0, descriptor->max_capacity - ledger.balanceOf(asset, id));
        }
        try {
            m.yield_bps = yields.yieldBps(asset, id);
            m.risk_score = std::clamp(risks.riskScore(asset, id), 0, 100);
            m.liquidity_depth = std::max<Amount>(0, descriptor->adapter->queryLiquidityDepth(asset));
        } catch (const std::exception& e) {
            LOG_WARN("Venue metrics unavailable: asset={}, venue={}, error={}", asset, id, e.what());
            continue;
        }
        out.emplace(id, m);
    }
    return out;
}

} // namespace strategy
} // namespace capflow
