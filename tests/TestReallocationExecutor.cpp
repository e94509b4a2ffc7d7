#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace capflow;
using capflow::core::ExecutionStep;
using capflow::core::OpportunityState;
using capflow::test::Harness;

namespace {
const Asset kAsset = "USDC";

// L: 700,000 at 5%, V: 300,000 at 9%, S: empty safe venue at 3%.
void seed(Harness& h) {
    h.addVenue("L", 500, 6000, 20);
    h.addVenue("V", 900, 9500, 30);
    h.addVenue("S", 300, 10000, 5);
    h.ledger->registerAsset(kAsset, {{"L", 7000}, {"V", 3000}});
    h.ledger->deposit(kAsset, 1000000);
}

bool balancesAre(const Harness& h, Amount l, Amount v, Amount s, Amount unallocated) {
    return h.ledger->balanceOf(kAsset, "L") == l &&
           h.ledger->balanceOf(kAsset, "V") == v &&
           h.ledger->balanceOf(kAsset, "S") == s &&
           h.ledger->balanceOf(kAsset, kUnallocatedVenue) == unallocated &&
           h.ledger->totalDeposited(kAsset) == 1000000;
}
}

int main() {
    // Accepted opportunity moves exactly the amount; total unchanged.
    {
        Harness h;
        seed(h);
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        assert(proposed.status.ok());
        assert(h.executor->get(proposed.opportunity_id)->state == OpportunityState::PROPOSED);

        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.status.ok());
        assert(report.state == OpportunityState::COMPLETED);
        assert(report.moved == 100000);
        assert(report.actual_yield_improvement_bps == 400);
        assert(balancesAre(h, 600000, 400000, 0, 0));
        assert(h.venues["L"]->held(kAsset) == 600000);
        assert(h.venues["V"]->held(kAsset) == 400000);
        assert(h.ledger->checkInvariant(kAsset).ok());
        assert(!h.locks->isLocked(kAsset));

        // Settled opportunities cannot run twice.
        auto again = h.executor->execute(proposed.opportunity_id);
        assert(again.status.code == ErrorCode::VALIDATION);
        assert(balancesAre(h, 600000, 400000, 0, 0));

        // Cooldown is now active for the asset.
        auto next = h.executor->propose(h.opportunity(kAsset, "L", "V", 50000, 280000));
        auto limited = h.executor->execute(next.opportunity_id);
        assert(limited.state == OpportunityState::PROPOSED);
        assert(limited.status.code == ErrorCode::RATE_LIMITED);
        assert(limited.failed_step == ExecutionStep::RATE_LIMIT);
        assert(h.executor->get(next.opportunity_id)->state == OpportunityState::PROPOSED);
        assert(balancesAre(h, 600000, 400000, 0, 0));
        assert(h.executor->totals(kAsset).completed == 1);
        assert(h.executor->totals(kAsset).failed == 0);

        h.clock->advance(3600000);
        auto later = h.executor->propose(h.opportunity(kAsset, "L", "V", 50000, 280000));
        assert(h.executor->execute(later.opportunity_id).state == OpportunityState::COMPLETED);
        assert(balancesAre(h, 550000, 450000, 0, 0));
    }

    // A rate-limited opportunity runs once the cooldown has passed.
    {
        Harness h;
        seed(h);
        assert(h.limiter->configure(kAsset, 60000, 10000).ok());
        auto first = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        assert(h.executor->execute(first.opportunity_id).state == OpportunityState::COMPLETED);

        auto deferred = h.executor->propose(h.opportunity(kAsset, "L", "V", 50000, 280000));
        assert(h.executor->execute(deferred.opportunity_id).status.code == ErrorCode::RATE_LIMITED);
        h.clock->advance(60000);
        auto retried = h.executor->execute(deferred.opportunity_id);
        assert(retried.status.ok());
        assert(retried.state == OpportunityState::COMPLETED);
        assert(balancesAre(h, 550000, 450000, 0, 0));
        assert(h.executor->totals(kAsset).completed == 2);
    }

    // Source releases only 80,000 of 100,000: nothing reaches the target.
    {
        Harness h;
        seed(h);
        h.venues["L"]->setWithdrawCap(80000);
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.state == OpportunityState::FAILED);
        assert(report.status.code == ErrorCode::INSUFFICIENT_LIQUIDITY);
        assert(report.failed_step == ExecutionStep::WITHDRAW);
        assert(report.moved == 0);
        assert(balancesAre(h, 700000, 300000, 0, 0));
        assert(h.venues["V"]->held(kAsset) == 300000);
        assert(h.venues["L"]->held(kAsset) == 700000);
        // A failed execution does not start the cooldown.
        assert(h.limiter->cooldownElapsed(kAsset, h.clock->nowMs()));
    }

    // Expired before execution.
    {
        Harness h;
        seed(h);
        auto op = h.opportunity(kAsset, "L", "V", 100000, 280000);
        op.expires_at_ms = op.created_at_ms + 1000;
        auto proposed = h.executor->propose(op);
        h.clock->advance(1001);
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.state == OpportunityState::EXPIRED);
        assert(report.status.code == ErrorCode::EXPIRED);
        assert(balancesAre(h, 700000, 300000, 0, 0));
    }

    // Spread collapsed since scoring.
    {
        Harness h;
        seed(h);
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        h.venues["V"]->setYield(kAsset, 520);
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.status.code == ErrorCode::STALE_OPPORTUNITY);
        assert(report.failed_step == ExecutionStep::REVALIDATION);
        assert(balancesAre(h, 700000, 300000, 0, 0));
    }

    // Per-cycle cap on the idle amount.
    {
        Harness h;
        seed(h);
        assert(h.limiter->configure(kAsset, 0, 1000).ok());
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.status.code == ErrorCode::RATE_LIMITED);
        assert(balancesAre(h, 700000, 300000, 0, 0));
    }

    // Target takes part of the amount: the placed part is recorded, the rest returns.
    {
        Harness h;
        seed(h);
        h.venues["V"]->setDepositCap(60000);
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.state == OpportunityState::FAILED);
        assert(report.failed_step == ExecutionStep::DEPOSIT);
        assert(report.status.code == ErrorCode::INSUFFICIENT_LIQUIDITY);
        assert(report.moved == 60000);
        assert(balancesAre(h, 640000, 360000, 0, 0));
        assert(h.venues["L"]->held(kAsset) == 640000);
        assert(h.venues["V"]->held(kAsset) == 360000);
    }

    // Neither target nor source accepts the funds: they are parked unallocated.
    {
        Harness h;
        seed(h);
        h.venues["V"]->fail_deposits = true;
        h.venues["L"]->fail_deposits = true;
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(report.status.code == ErrorCode::VENUE_UNAVAILABLE);
        assert(report.failed_step == ExecutionStep::DEPOSIT);
        assert(balancesAre(h, 600000, 300000, 0, 100000));
        assert(h.ledger->checkInvariant(kAsset).ok());
    }

    // Reentrant call from inside an adapter is refused; the outer run completes.
    {
        Harness h;
        seed(h);
        ErrorCode nested = ErrorCode::NONE;
        h.venues["L"]->on_withdraw = [&h, &nested]() {
            nested = h.ledger->deposit(kAsset, 10).status.code;
        };
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        auto report = h.executor->execute(proposed.opportunity_id);
        assert(nested == ErrorCode::ASSET_LOCKED);
        assert(report.state == OpportunityState::COMPLETED);
        assert(balancesAre(h, 600000, 400000, 0, 0));
    }

    // Proposal validation.
    {
        Harness h;
        seed(h);
        assert(h.executor->propose(h.opportunity(kAsset, "L", "L", 1000, 1000)).status.code == ErrorCode::VALIDATION);
        assert(h.executor->propose(h.opportunity(kAsset, "L", "Q", 1000, 1000)).status.code == ErrorCode::VALIDATION);
        assert(h.executor->propose(h.opportunity(kAsset, "L", "V", 0, 1000)).status.code == ErrorCode::VALIDATION);
        auto op = h.opportunity(kAsset, "L", "V", 1000, 1000);
        op.expires_at_ms = op.created_at_ms;
        assert(h.executor->propose(op).status.code == ErrorCode::VALIDATION);
        assert(h.executor->execute("opp-999").status.code == ErrorCode::VALIDATION);
    }

    // Emergency: lowest-risk destination, amount capped by the recorded balance.
    {
        Harness h;
        seed(h);
        auto report = h.executor->emergencyReallocate(kAsset, "V", 500000, "S");
        assert(report.status.ok());
        assert(report.destination == "S");
        assert(report.withdrawn == 300000);
        assert(report.placed == 300000);
        assert(report.unallocated == 0);
        assert(balancesAre(h, 700000, 0, 300000, 0));
        assert(h.venues["S"]->held(kAsset) == 300000);
        assert(h.limiter->cooldownElapsed(kAsset, h.clock->nowMs()));
    }

    // Emergency ignores an active cooldown and does not extend it.
    {
        Harness h;
        seed(h);
        auto proposed = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        assert(h.executor->execute(proposed.opportunity_id).status.ok());
        assert(!h.limiter->cooldownElapsed(kAsset, h.clock->nowMs()));
        const auto before = h.limiter->state(kAsset).last_reallocation_at_ms;

        h.clock->advance(1000);
        auto report = h.executor->emergencyReallocate(kAsset, "V", 50000, "S");
        assert(report.status.ok());
        assert(report.destination == "S");
        assert(report.placed == 50000);
        assert(balancesAre(h, 600000, 350000, 50000, 0));
        assert(h.limiter->state(kAsset).last_reallocation_at_ms == before);
    }

    // Unregistered safe venue is refused before any funds move.
    {
        Harness h;
        seed(h);
        auto report = h.executor->emergencyReallocate(kAsset, "V", 1000, "Q");
        assert(report.status.code == ErrorCode::VALIDATION);
        assert(report.withdrawn == 0);
        assert(balancesAre(h, 700000, 300000, 0, 0));
    }

    // Settled and expired opportunities are evicted past the retention limit;
    // the running totals keep counting them.
    {
        Harness h({}, {}, 1000000, 4);
        seed(h);
        auto done = h.executor->propose(h.opportunity(kAsset, "L", "V", 100000, 280000));
        assert(h.executor->execute(done.opportunity_id).status.ok());
        auto live = h.executor->propose(h.opportunity(kAsset, "L", "V", 1000, 280000));

        for (int i = 0; i < 10; ++i) {
            auto op = h.opportunity(kAsset, "L", "V", 1000, 280000);
            op.expires_at_ms = op.created_at_ms + 1000;
            assert(h.executor->propose(op).status.ok());
            h.clock->advance(2000);
            assert(h.executor->storedCount() <= 4);
        }
        assert(h.executor->storedCount() == 4);
        assert(!h.executor->get(done.opportunity_id));
        assert(h.executor->get(live.opportunity_id));
        assert(h.executor->totals(kAsset).completed == 1);
        assert(h.executor->opportunities(kAsset).size() == 4);
    }

    // Emergency with a frozen source and a failing destination ends unallocated.
    {
        Harness h;
        seed(h);
        h.registry->setFrozen("V", true);
        h.venues["S"]->fail_deposits = true;
        h.venues["V"]->setWithdrawCap(120000);
        auto report = h.executor->emergencyReallocate(kAsset, "V", 300000, "S");
        assert(report.status.ok());
        assert(report.withdrawn == 120000);
        assert(report.placed == 0);
        assert(report.unallocated == 120000);
        assert(balancesAre(h, 700000, 180000, 0, 120000));

        assert(h.executor->emergencyReallocate(kAsset, "Q", 1, "S").status.code == ErrorCode::VALIDATION);
        assert(h.executor->emergencyReallocate(kAsset, "S", 1, "L").status.code == ErrorCode::INSUFFICIENT_LIQUIDITY);
    }

    std::cout << "[TEST] ReallocationExecutor PASSED\n";
    return 0;
}
