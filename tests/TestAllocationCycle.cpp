#include "core/adapters/RoleAccessPolicy.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/AllocationEngine.h"
#include "strategy/OrchestrationStrategy.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

using namespace capflow;
using capflow::core::Capability;
using capflow::core::JournalEventType;

namespace {
const Asset kAsset = "USDC";

engine::EngineConfig paperConfig(const std::string& journal_path) {
    engine::EngineConfig cfg;
    cfg.mode = engine::EngineMode::PAPER;
    cfg.cycle_interval_seconds = 1;
    cfg.journal_path = journal_path;
    cfg.strategy_store_path = "";

    engine::VenueConfig l;
    l.id = "L";
    l.yield_bps = 500;
    l.utilization_bps = 6000;
    l.risk_score = 20;
    l.fixed_execution_cost = 100;
    l.liquidity_depth = 1000000;

    engine::VenueConfig v = l;
    v.id = "V";
    v.yield_bps = 900;
    v.utilization_bps = 9500;
    v.risk_score = 30;

    cfg.venues = {l, v};

    engine::AssetConfig usdc;
    usdc.asset = kAsset;
    usdc.target_weights = {{"L", 7000}, {"V", 3000}};
    usdc.initial_deposit = 1000000;
    cfg.assets = {usdc};
    return cfg;
}

bool journalHas(core::EventJournalJsonl& journal, JournalEventType type) {
    const auto rows = journal.readFrom(0);
    return std::any_of(rows.begin(), rows.end(),
                       [type](const core::JournalEvent& e) { return e.type == type; });
}
}

int main() {
    const std::string journal_path = "logs/test_allocation_cycle.jsonl";
    std::error_code ec;
    std::filesystem::remove(journal_path, ec);

    auto clock = std::make_shared<ManualClock>(1000000);
    auto access = std::make_shared<core::RoleAccessPolicy>(false);
    access->grantAll("ops");
    access->grant("keeper", Capability::KEEPER);
    access->grant("alice", Capability::DEPOSIT);
    access->grant("alice", Capability::WITHDRAW);

    engine::EngineDependencies deps;
    deps.clock = clock;
    deps.access_policy = access;

    engine::AllocationEngine engine(paperConfig(journal_path), deps);
    assert(engine.ledger().balanceOf(kAsset, "L") == 700000);
    assert(engine.ledger().balanceOf(kAsset, "V") == 300000);

    // Capability checks come before anything else.
    {
        assert(engine.runCycle("alice", kAsset).status.code == ErrorCode::UNAUTHORIZED);
        assert(engine.deposit("keeper", kAsset, 10).status.code == ErrorCode::UNAUTHORIZED);
        assert(engine.setVenueFrozen("keeper", "L", true).code == ErrorCode::UNAUTHORIZED);
        assert(engine.emergencyReallocate("alice", kAsset, "L", 1, "V").status.code == ErrorCode::UNAUTHORIZED);
        assert(engine.runDailyRebalance("alice", {}).empty());
        assert(!engine.start("alice", 1));
        assert(engine.ledger().totalDeposited(kAsset) == 1000000);

        auto in = engine.deposit("alice", kAsset, 1000);
        assert(in.status.ok());
        assert(engine.ledger().balanceOf(kAsset, "L") == 700700);
        assert(engine.withdraw("alice", kAsset, 700, {"L"}).status.ok());
        assert(engine.withdraw("alice", kAsset, 300, {"V"}).status.ok());
        assert(engine.withdraw("keeper", kAsset, 1, {}).status.code == ErrorCode::UNAUTHORIZED);
        assert(engine.ledger().balanceOf(kAsset, "L") == 700000);
        assert(engine.ledger().balanceOf(kAsset, "V") == 300000);
    }

    // One keeper cycle moves L's idle portion to V.
    {
        auto report = engine.runCycle("keeper", kAsset);
        assert(report.status.ok());
        assert(report.reallocated);
        assert(report.executions.size() == 1);
        const auto& exec = report.executions.front();
        assert(exec.from_venue == "L");
        assert(exec.to_venue == "V");
        assert(exec.moved == 280000);
        assert(exec.actual_yield_improvement_bps == 400);
        assert(engine.ledger().balanceOf(kAsset, "L") == 420000);
        assert(engine.ledger().balanceOf(kAsset, "V") == 580000);
        assert(engine.ledger().snapshot(kAsset)->invariantHolds());
    }

    // The next cycle is held back by the cooldown.
    {
        auto report = engine.runCycle("keeper", kAsset);
        assert(!report.reallocated);
        assert(report.status.code == ErrorCode::RATE_LIMITED);
        assert(engine.ledger().balanceOf(kAsset, "L") == 420000);
    }

    {
        const auto a = engine.analytics(kAsset);
        assert(a.total_deposited == 1000000);
        assert(a.total_utilized == 803000);
        assert(a.idle_capital == 197000);
        assert(a.unallocated == 0);
        assert(a.weighted_yield_bps == 732);
        assert(a.venue_count == 2);
        assert(a.completed_reallocations == 1);
        // The rate-limited proposal is deferred, not failed.
        assert(a.failed_reallocations == 0);
        assert(a.price_available);
    }

    // Due strategies run once per frequency window; adaptive ones adapt after.
    {
        auto draft = strategy::OrchestrationStrategy::makeStrategy(
            "lend-to-vault", core::StrategyKind::BALANCED, kAsset,
            {"L"}, {"V", "L"}, {5000, 5000}, 0, 60000);
        draft.adaptive = true;
        draft.adaptation_alpha = 0.5;
        assert(engine.createStrategy("keeper", draft).status.code == ErrorCode::UNAUTHORIZED);
        auto created = engine.createStrategy("ops", draft);
        assert(created.status.ok());
        assert(engine.activateStrategy("ops", created.strategy_id).ok());

        clock->advance(3600000);
        auto reports = engine.runDueStrategies("keeper");
        assert(reports.size() == 1);
        assert(reports.front().status.ok());
        assert(reports.front().idle_capital == 168000);
        assert(reports.front().completed_legs == 1);
        assert(engine.ledger().balanceOf(kAsset, "L") == 336000);
        assert(engine.ledger().balanceOf(kAsset, "V") == 664000);

        // The run adapted once; realized yield matched the forecast so weights hold.
        const std::vector<Bps> even = {5000, 5000};
        assert(engine.strategies().get(created.strategy_id)->target_weights == even);
        auto adapted = engine.adaptStrategy("keeper", created.strategy_id);
        assert(adapted.status.ok());
        assert(adapted.samples == 0);
        assert(adapted.adapted_weights == even);

        assert(engine.runDueStrategies("keeper").empty());
        assert(engine.deactivateStrategy("ops", created.strategy_id).ok());
    }

    {
        core::EventJournalJsonl journal(journal_path);
        assert(journalHas(journal, JournalEventType::DEPOSIT_APPLIED));
        assert(journalHas(journal, JournalEventType::REALLOCATION_COMPLETED));
        assert(journalHas(journal, JournalEventType::OPPORTUNITY_PROPOSED));
        assert(!journalHas(journal, JournalEventType::REALLOCATION_FAILED));
        assert(journalHas(journal, JournalEventType::STRATEGY_ADAPTED));

        const auto trail = engine.auditTrail(kAsset);
        assert(!trail.empty());
        assert(trail.size() == journal.readAsset(kAsset, 0).size());
        assert(engine.auditTrail("DAI").empty());
    }

    // Keeper loop stops on its own after the requested number of cycles.
    {
        assert(engine.start("keeper", 1));
        assert(!engine.start("keeper", 1));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (engine.isRunning() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        assert(!engine.isRunning());
        engine.stop();
        assert(engine.ledger().snapshot(kAsset)->invariantHolds());
        assert(engine.ledger().totalDeposited(kAsset) == 1000000);

        // A loop that ended on its own can be started again.
        assert(engine.start("keeper", 1));
        const auto restart_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (engine.isRunning() && std::chrono::steady_clock::now() < restart_deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        assert(!engine.isRunning());
        engine.stop();
    }

    // Global pause blocks deposits, withdrawals and reallocation; emergency still runs.
    {
        assert(engine.ledger().balanceOf(kAsset, "L") == 336000);
        assert(engine.ledger().balanceOf(kAsset, "V") == 664000);

        assert(engine.pause("alice").code == ErrorCode::UNAUTHORIZED);
        assert(engine.pause("keeper").code == ErrorCode::UNAUTHORIZED);
        assert(engine.pause("ops").ok());
        assert(engine.isPaused());
        assert(engine.pause("ops").code == ErrorCode::VALIDATION);

        assert(engine.deposit("alice", kAsset, 1000).status.code == ErrorCode::PAUSED);
        assert(engine.withdraw("alice", kAsset, 1000, {}).status.code == ErrorCode::PAUSED);
        assert(engine.runCycle("keeper", kAsset).status.code == ErrorCode::PAUSED);
        const auto daily = engine.runDailyRebalance("keeper", {});
        assert(daily.size() == 1);
        assert(daily.front().status.code == ErrorCode::PAUSED);
        assert(engine.executeStrategy("keeper", "strat-1").status.code == ErrorCode::PAUSED);
        assert(engine.runDueStrategies("keeper").empty());
        assert(engine.ledger().totalDeposited(kAsset) == 1000000);

        auto emergency = engine.emergencyReallocate("ops", kAsset, "V", 1000, "L");
        assert(emergency.status.ok());
        assert(emergency.destination == "L");
        assert(engine.ledger().balanceOf(kAsset, "L") == 337000);
        assert(engine.ledger().balanceOf(kAsset, "V") == 663000);

        // The keeper loop idles while paused.
        assert(engine.start("keeper", 1));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (engine.isRunning() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        engine.stop();
        assert(engine.ledger().balanceOf(kAsset, "L") == 337000);

        assert(engine.unpause("keeper").code == ErrorCode::UNAUTHORIZED);
        assert(engine.unpause("ops").ok());
        assert(!engine.isPaused());
        assert(engine.unpause("ops").code == ErrorCode::VALIDATION);
        assert(engine.deposit("alice", kAsset, 1000).status.ok());
        assert(engine.ledger().totalDeposited(kAsset) == 1001000);
        assert(engine.ledger().snapshot(kAsset)->invariantHolds());

        core::EventJournalJsonl journal(journal_path);
        assert(journalHas(journal, JournalEventType::ENGINE_PAUSED));
        assert(journalHas(journal, JournalEventType::ENGINE_UNPAUSED));
    }

    std::cout << "[TEST] AllocationCycle PASSED\n";
    return 0;
}
