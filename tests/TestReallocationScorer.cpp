#include "strategy/ReallocationScorer.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace capflow;
using capflow::strategy::ReallocationScorer;
using capflow::strategy::ScoringParams;
using capflow::strategy::VenueMetrics;

namespace {
VenueMetrics venue(const VenueId& id, Bps yield_bps, int risk, Amount fixed_cost = 100, Amount depth = 1000000) {
    VenueMetrics m;
    m.venue = id;
    m.yield_bps = yield_bps;
    m.risk_score = risk;
    m.fixed_execution_cost = fixed_cost;
    m.liquidity_depth = depth;
    return m;
}

core::IdleDetection idle(const VenueId& id, Amount amount) {
    core::IdleDetection d;
    d.asset = "USDC";
    d.venue = id;
    d.total_capital = amount;
    d.idle_amount = amount;
    d.is_idle = true;
    d.is_reallocatable = true;
    return d;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}
}

int main() {
    const long long now = 5000000;

    // 100,000 from 5% to 9% at a cost of 200: net benefit 3,800.
    {
        std::map<VenueId, VenueMetrics> metrics{
            {"L", venue("L", 500, 20)},
            {"V", venue("V", 900, 30)},
        };
        ScoringParams params;
        auto ranked = ReallocationScorer::score({idle("L", 100000)}, metrics, params, now);
        assert(ranked.size() == 1);
        const auto& op = ranked.front();
        assert(op.from_venue == "L");
        assert(op.to_venue == "V");
        assert(op.amount == 100000);
        assert(op.yield_improvement_bps == 400);
        assert(near(op.estimated_cost, 200.0));
        assert(near(op.net_benefit, 3800.0));
        assert(op.net_benefit > 0.0);
        // 0.4*1 + 0.3*(1-0.3) + 0.2*1 - 0.1*(200/4000)
        assert(near(op.score, 0.805));
        assert(near(op.confidence, 0.7));
        assert(op.created_at_ms == now);
        assert(op.expires_at_ms == now + 180000);
        assert(op.min_yield_spread_bps == params.yield_threshold_bps);
        assert(op.current_yield_bps == 500);
        assert(op.source_risk_score == 20);
    }

    // Each discard rule removes exactly its target.
    {
        auto frozen = venue("F", 1200, 10);
        frozen.frozen = true;
        auto capped = venue("Z", 800, 10, 0);
        capped.remaining_capacity = 40000;
        auto full = venue("C", 1300, 10);
        full.remaining_capacity = 0;

        std::map<VenueId, VenueMetrics> metrics{
            {"L", venue("L", 500, 20)},
            {"W", venue("W", 540, 10)},          // spread under threshold
            {"X", venue("X", 1500, 90)},         // risk jump
            {"F", frozen},
            {"Y", venue("Y", 1000, 10, 60000)},  // cost eats the benefit
            {"Z", capped},
            {"C", full},
            {kUnallocatedVenue, venue(kUnallocatedVenue, 0, 0, 0, 0)},
        };
        ScoringParams params;
        params.max_risk_increase = 50;

        auto ranked = ReallocationScorer::score({idle("L", 100000)}, metrics, params, now);
        assert(ranked.size() == 1);
        assert(ranked.front().to_venue == "Z");
        assert(ranked.front().amount == 40000);
        assert(near(ranked.front().net_benefit, 1100.0));
    }

    // Detections that are not reallocatable never produce opportunities.
    {
        std::map<VenueId, VenueMetrics> metrics{{"L", venue("L", 500, 20)}, {"V", venue("V", 900, 30)}};
        auto d = idle("L", 100000);
        d.is_reallocatable = false;
        assert(ReallocationScorer::score({d}, metrics, ScoringParams{}, now).empty());
    }

    // Ranked by score; equal yields fall back to the safer target.
    {
        std::map<VenueId, VenueMetrics> metrics{
            {"L", venue("L", 500, 20)},
            {"M", venue("M", 900, 10)},
            {"V", venue("V", 900, 30)},
            {kUnallocatedVenue, venue(kUnallocatedVenue, 0, 0, 0, 0)},
        };
        auto ranked = ReallocationScorer::score(
            {idle("L", 100000), idle(kUnallocatedVenue, 50000)}, metrics, ScoringParams{}, now);
        assert(ranked.size() == 5);
        assert(std::is_sorted(ranked.begin(), ranked.end(), &ReallocationScorer::ranksBefore));
        for (const auto& op : ranked) {
            assert(op.to_venue != kUnallocatedVenue);
        }

        auto from_l = std::find_if(ranked.begin(), ranked.end(),
                                   [](const core::ReallocationOpportunity& op) { return op.from_venue == "L"; });
        assert(from_l != ranked.end());
        assert(from_l->to_venue == "M");
    }

    // Tie-break chain: net benefit, then risk, then target id.
    {
        core::ReallocationOpportunity a;
        a.score = 0.5;
        a.net_benefit = 100.0;
        a.risk_score = 10;
        a.to_venue = "B";
        core::ReallocationOpportunity b = a;
        b.net_benefit = 200.0;
        assert(ReallocationScorer::ranksBefore(b, a));
        b.net_benefit = a.net_benefit;
        b.risk_score = 5;
        assert(ReallocationScorer::ranksBefore(b, a));
        b.risk_score = a.risk_score;
        b.to_venue = "A";
        assert(ReallocationScorer::ranksBefore(b, a));
        assert(!ReallocationScorer::ranksBefore(a, a));
    }

    // Fixed plus proportional cost.
    {
        auto source = venue("L", 500, 20, 100);
        source.execution_cost_bps = 10;
        auto target = venue("V", 900, 30, 50);
        target.execution_cost_bps = 5;
        assert(near(ReallocationScorer::estimatedCost(source, target, 100000), 150.0 + 150.0));
    }

    std::cout << "[TEST] ReallocationScorer PASSED\n";
    return 0;
}
