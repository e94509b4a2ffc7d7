#include "TestSupport.h"
#include "strategy/OrchestrationStrategy.h"

#include <cassert>
#include <iostream>

using namespace capflow;
using capflow::core::StrategyKind;
using capflow::strategy::OrchestrationStrategy;
using capflow::test::Harness;

namespace {
const Asset kAsset = "USDC";

// 300,000 sitting unallocated, three empty target venues.
void seed(Harness& h) {
    h.addVenue("L", 500, 10000, 20);
    h.addVenue("V", 900, 10000, 30);
    h.addVenue("S", 300, 10000, 5);
    h.ledger->registerAsset(kAsset, {});
    h.ledger->deposit(kAsset, 300000);
}

core::ReallocationStrategy spread() {
    return OrchestrationStrategy::makeStrategy(
        "spread", StrategyKind::BALANCED, kAsset,
        {kUnallocatedVenue}, {"L", "V", "S"}, {5000, 3000, 2000}, 0, 60000);
}

std::string createActive(Harness& h, core::ReallocationStrategy draft) {
    auto created = h.strategies->createStrategy(std::move(draft));
    assert(created.status.ok());
    assert(h.strategies->activate(created.strategy_id).ok());
    return created.strategy_id;
}
}

int main() {
    // 50/30/20 over 300,000 idle.
    {
        auto split = OrchestrationStrategy::splitByWeights(300000, {"L", "V", "S"}, {5000, 3000, 2000});
        assert(split.size() == 3);
        assert(split[0].second == 150000);
        assert(split[1].second == 90000);
        assert(split[2].second == 60000);

        auto odd = OrchestrationStrategy::splitByWeights(100, {"A", "B", "C"}, {3333, 3333, 3334});
        assert(odd[0].second == 34);
        assert(odd[1].second == 33);
        assert(odd[2].second == 33);

        assert(OrchestrationStrategy::splitByWeights(0, {"A"}, {10000}).empty());
    }

    // Strategy execution drives the ledger to the target deltas.
    {
        Harness h;
        seed(h);
        h.detector->scan(kAsset);
        const auto id = createActive(h, spread());
        assert(id == "strat-1");

        auto report = h.executor->executeStrategy(id);
        assert(report.status.ok());
        assert(report.idle_capital == 300000);
        assert(report.movable_capital == 300000);
        assert(report.completed_legs == 3);
        assert(report.skipped_legs.empty());
        assert(h.ledger->balanceOf(kAsset, "L") == 150000);
        assert(h.ledger->balanceOf(kAsset, "V") == 90000);
        assert(h.ledger->balanceOf(kAsset, "S") == 60000);
        assert(h.ledger->balanceOf(kAsset, kUnallocatedVenue) == 0);
        assert(h.ledger->checkInvariant(kAsset).ok());
        assert(h.executor->completedFor(id).size() == 3);
        assert(h.strategies->get(id)->last_execution_ms == h.clock->nowMs());

        // Frequency, then asset cooldown, hold the next run back.
        assert(h.executor->executeStrategy(id).status.code == ErrorCode::RATE_LIMITED);
        h.clock->advance(60000);
        assert(h.executor->executeStrategy(id).status.code == ErrorCode::RATE_LIMITED);
    }

    // A run at clock time zero still counts for the execution frequency.
    {
        Harness h({}, {}, 0);
        seed(h);
        assert(h.limiter->configure(kAsset, 0, 10000).ok());
        h.detector->scan(kAsset);
        const auto id = createActive(h, spread());
        assert(!h.strategies->get(id)->has_executed);

        assert(h.executor->executeStrategy(id).completed_legs == 3);
        assert(h.strategies->get(id)->has_executed);
        assert(h.strategies->get(id)->last_execution_ms == 0);
        assert(h.executor->executeStrategy(id).status.code == ErrorCode::RATE_LIMITED);
        h.clock->advance(60000);
        assert(h.executor->executeStrategy(id).status.ok());
    }

    // Each completed leg adapts the weights once.
    {
        Harness h;
        seed(h);
        h.detector->scan(kAsset);
        auto draft = spread();
        draft.adaptive = true;
        draft.adaptation_alpha = 0.5;
        const auto id = createActive(h, draft);
        assert(h.executor->executeStrategy(id).completed_legs == 3);

        // V realizes half of the 900bps it was chosen for.
        h.venues["V"]->setYield(kAsset, 450);
        auto first = h.coordinator->adaptStrategy(id);
        assert(first.status.ok());
        assert(first.samples == 3);
        assert(first.adapted_weights != first.previous_weights);
        assert(first.adapted_weights[1] < 3000);

        auto second = h.coordinator->adaptStrategy(id);
        assert(second.status.ok());
        assert(second.samples == 0);
        assert(second.adapted_weights == first.adapted_weights);
        assert(h.strategies->get(id)->target_weights == first.adapted_weights);
        assert(h.executor->takeAdaptationSamples(id).empty());
        assert(h.executor->completedFor(id).size() == 3);
    }

    // Legs that raise risk beyond the limit are skipped, not failed.
    {
        Harness h;
        seed(h);
        h.detector->scan(kAsset);
        auto draft = spread();
        draft.max_risk_increase = 10;
        const auto id = createActive(h, draft);

        auto report = h.executor->executeStrategy(id);
        assert(report.status.ok());
        assert(report.completed_legs == 1);
        assert(report.skipped_legs.size() == 2);
        assert(h.ledger->balanceOf(kAsset, "S") == 60000);
        assert(h.ledger->balanceOf(kAsset, kUnallocatedVenue) == 240000);
    }

    // The per-cycle cap applies before the split.
    {
        Harness h;
        seed(h);
        h.limiter->configure(kAsset, 3600000, 5000);
        h.detector->scan(kAsset);
        const auto id = createActive(h, spread());
        auto report = h.executor->executeStrategy(id);
        assert(report.movable_capital == 150000);
        assert(h.ledger->balanceOf(kAsset, "L") == 75000);
        assert(h.ledger->balanceOf(kAsset, "V") == 45000);
        assert(h.ledger->balanceOf(kAsset, "S") == 30000);
    }

    // Inactive or unknown strategies do nothing.
    {
        Harness h;
        seed(h);
        h.detector->scan(kAsset);
        auto created = h.strategies->createStrategy(spread());
        assert(h.executor->executeStrategy(created.strategy_id).status.code == ErrorCode::VALIDATION);
        assert(h.executor->executeStrategy("strat-42").status.code == ErrorCode::VALIDATION);
        assert(h.ledger->balanceOf(kAsset, kUnallocatedVenue) == 300000);
    }

    // Validation at creation.
    {
        Harness h;
        seed(h);
        auto bad_sum = spread();
        bad_sum.target_weights = {5000, 3000, 1000};
        assert(h.strategies->createStrategy(bad_sum).status.code == ErrorCode::VALIDATION);

        auto too_fast = spread();
        too_fast.execution_frequency_ms = 1000;
        assert(h.strategies->createStrategy(too_fast).status.code == ErrorCode::VALIDATION);

        auto unknown_target = spread();
        unknown_target.target_venues = {"L", "V", "Q"};
        assert(h.strategies->createStrategy(unknown_target).status.code == ErrorCode::VALIDATION);

        auto no_sources = spread();
        no_sources.source_venues.clear();
        assert(h.strategies->createStrategy(no_sources).status.code == ErrorCode::VALIDATION);

        auto bad_alpha = spread();
        bad_alpha.adaptation_alpha = 1.5;
        assert(h.strategies->createStrategy(bad_alpha).status.code == ErrorCode::VALIDATION);

        auto other_asset = spread();
        other_asset.asset = "DAI";
        assert(h.strategies->createStrategy(other_asset).status.code == ErrorCode::VALIDATION);

        assert(h.strategies->list().empty());
    }

    // Strategy book operations.
    {
        Harness h;
        seed(h);
        const auto id = createActive(h, spread());
        assert(h.strategies->activeFor(kAsset).size() == 1);
        assert(h.strategies->deactivate(id).ok());
        assert(h.strategies->activeFor(kAsset).empty());
        assert(h.strategies->activate("strat-9").code == ErrorCode::VALIDATION);
        assert(h.strategies->updateTargetWeights(id, {5000, 5000}).code == ErrorCode::VALIDATION);
        assert(h.strategies->updateTargetWeights(id, {4000, 4000, 2000}).ok());
        assert(h.strategies->get(id)->target_weights[0] == 4000);
    }

    // Presets and adaptation.
    {
        for (auto kind : {StrategyKind::YIELD_MAXIMIZING, StrategyKind::RISK_MINIMIZING,
                          StrategyKind::LIQUIDITY_OPTIMIZING, StrategyKind::BALANCED}) {
            assert(OrchestrationStrategy::presetWeights(kind).sum() == kBpsDenominator);
        }
        assert(OrchestrationStrategy::presetWeights(StrategyKind::YIELD_MAXIMIZING).yield_bps == 6000);

        // L realized half its forecast: 4500 vs 5000 before renormalizing.
        auto adapted = OrchestrationStrategy::adaptWeights(
            {"L", "V"}, {5000, 5000}, {{"L", 500, 250}}, 0.2);
        assert(adapted.size() == 2);
        assert(adapted[0] == 4737);
        assert(adapted[1] == 5263);

        auto frozen = OrchestrationStrategy::adaptWeights({"L", "V"}, {5000, 5000}, {{"L", 500, 250}}, 0.0);
        assert(frozen[0] == 5000 && frozen[1] == 5000);

        auto no_samples = OrchestrationStrategy::adaptWeights({"L", "V"}, {7000, 3000}, {}, 0.5);
        assert(no_samples[0] == 7000 && no_samples[1] == 3000);
    }

    std::cout << "[TEST] OrchestrationStrategy PASSED\n";
    return 0;
}
