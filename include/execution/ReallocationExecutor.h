#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "analytics/IdleCapitalDetector.h"
#include "common/Clock.h"
#include "common/Errors.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IRiskOracle.h"
#include "core/contracts/IYieldOracle.h"
#include "core/model/AllocationTypes.h"
#include "execution/RateLimiter.h"
#include "ledger/CapitalLedger.h"
#include "strategy/StrategyManager.h"

namespace capflow {
namespace execution {

struct ProposeResult {
    OperationResult status;
    std::string opportunity_id;
};

struct ExecutionReport {
    std::string opportunity_id;
    Asset asset;
    VenueId from_venue;
    VenueId to_venue;
    Amount amount = 0;      // requested
    Amount moved = 0;       // recorded on the target venue
    core::OpportunityState state = core::OpportunityState::PROPOSED;
    core::ExecutionStep failed_step = core::ExecutionStep::NONE;
    OperationResult status;
    Bps actual_yield_improvement_bps = 0;
};

struct StrategyExecutionReport {
    std::string strategy_id;
    Asset asset;
    OperationResult status;
    Amount idle_capital = 0;
    Amount movable_capital = 0;  // idle capital after the per-cycle cap
    std::vector<std::pair<VenueId, Amount>> allocations;
    std::vector<ExecutionReport> legs;
    std::vector<std::pair<VenueId, VenueId>> skipped_legs;  // risk increase too large
    int completed_legs = 0;
};

struct EmergencyReport {
    OperationResult status;
    Asset asset;
    VenueId from_venue;
    VenueId destination;        // kUnallocatedVenue when nothing was eligible
    Amount requested = 0;
    Amount withdrawn = 0;
    Amount placed = 0;          // landed on destination
    Amount unallocated = 0;     // parked in the unallocated bucket
};

// Running per-asset outcome counts; unaffected by opportunity eviction.
struct SettlementTotals {
    int completed = 0;
    int failed = 0;
    int expired = 0;
    long long last_completed_at_ms = 0;
};

// Carries opportunities through PROPOSED -> VALIDATED -> EXECUTING ->
// COMPLETED | FAILED | EXPIRED. Every execution runs under the asset lock in
// the order withdraw -> deposit -> ledger record, and never loses funds:
// whatever cannot land on the target goes back to the source or, failing
// that, into the unallocated bucket.
//
// At most `opportunity_retention` opportunities are kept. Settled and expired
// ones are evicted oldest first, except completed legs of adaptive strategies
// that have not yet been handed out by takeAdaptationSamples.
class ReallocationExecutor {
public:
    ReallocationExecutor(
        std::shared_ptr<ledger::CapitalLedger> ledger,
        std::shared_ptr<analytics::IdleCapitalDetector> detector,
        std::shared_ptr<strategy::StrategyManager> strategies,
        std::shared_ptr<RateLimiter> limiter,
        std::shared_ptr<core::IYieldOracle> yields,
        std::shared_ptr<core::IRiskOracle> risks,
        std::shared_ptr<IClock> clock,
        long long opportunity_ttl_ms,
        std::shared_ptr<core::IEventJournal> journal = nullptr,
        std::size_t opportunity_retention = 256
    );

    ProposeResult propose(core::ReallocationOpportunity opportunity);
    ExecutionReport execute(const std::string& opportunity_id);
    StrategyExecutionReport executeStrategy(const std::string& strategy_id);
    EmergencyReport emergencyReallocate(const Asset& asset, const VenueId& from_venue,
                                        Amount amount, const VenueId& to_safe_venue);

    std::optional<core::ReallocationOpportunity> get(const std::string& opportunity_id) const;
    std::vector<core::ReallocationOpportunity> opportunities(const Asset& asset) const;
    std::vector<core::ReallocationOpportunity> completedFor(const std::string& strategy_id) const;
    // Completed legs of the strategy not returned by an earlier call.
    std::vector<core::ReallocationOpportunity> takeAdaptationSamples(const std::string& strategy_id);
    SettlementTotals totals(const Asset& asset) const;
    std::size_t storedCount() const;

private:
    // Caller holds the asset lock.
    ExecutionReport runLocked(core::ReallocationOpportunity& op, bool check_cooldown, bool record_cooldown);

    std::optional<Bps> currentYield(const Asset& asset, const VenueId& venue) const;
    std::optional<int> riskOf(const Asset& asset, const VenueId& venue) const;

    // Best-effort deposit back into `venue`; the part it refuses is moved to
    // the unallocated bucket in the ledger.
    void returnOrPark(const Asset& asset, const VenueId& venue, Amount amount);

    void settle(core::ReallocationOpportunity& op, ExecutionReport& report, core::OpportunityState state,
                core::ExecutionStep step, OperationResult status);
    std::string storeNew(core::ReallocationOpportunity& op);
    void store(const core::ReallocationOpportunity& op);
    // Caller holds mutex_.
    void pruneLocked(long long now, const std::set<std::string>& adaptive_strategies);
    void journal(core::JournalEventType type, const Asset& asset, const std::string& entity_id, nlohmann::json payload);

    std::shared_ptr<ledger::CapitalLedger> ledger_;
    std::shared_ptr<analytics::IdleCapitalDetector> detector_;
    std::shared_ptr<strategy::StrategyManager> strategies_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<core::IYieldOracle> yields_;
    std::shared_ptr<core::IRiskOracle> risks_;
    std::shared_ptr<IClock> clock_;
    long long opportunity_ttl_ms_;
    std::shared_ptr<core::IEventJournal> journal_;

    mutable std::mutex mutex_;
    std::map<std::string, core::ReallocationOpportunity> opportunities_;
    std::deque<std::string> order_;
    std::set<std::string> sampled_;
    std::map<Asset, SettlementTotals> totals_;
    std::size_t opportunity_retention_;
    std::uint64_t next_id_ = 1;
};

} // namespace execution
} // namespace capflow
