#include "execution/ReallocationExecutor.h"
#include "common/Logger.h"
#include "core/execution/OpportunityLifecycleStateMachine.h"
#include "core/execution/OpportunitySchema.h"
#include "strategy/OrchestrationStrategy.h"

#include <algorithm>

namespace capflow {
namespace execution {

using core::ExecutionStep;
using core::OpportunityState;
using core::execution::OpportunityEvent;
using core::execution::OpportunityLifecycleStateMachine;

namespace {
Amount clampAmount(Amount reported, Amount requested) {
    return std::clamp<Amount>(reported, 0, requested);
}

OpportunityEvent eventFor(OpportunityState target) {
    switch (target) {
        case OpportunityState::VALIDATED: return OpportunityEvent::VALIDATE;
        case OpportunityState::EXECUTING: return OpportunityEvent::START;
        case OpportunityState::COMPLETED: return OpportunityEvent::COMPLETE;
        case OpportunityState::EXPIRED: return OpportunityEvent::EXPIRE;
        default: return OpportunityEvent::FAIL;
    }
}

void advance(core::ReallocationOpportunity& op, OpportunityState target) {
    const auto r = OpportunityLifecycleStateMachine::transition(op.state, eventFor(target));
    if (r.accepted) {
        op.state = r.state;
    } else {
        LOG_ERROR("Illegal opportunity transition ignored: id={}, {} -> {}",
                  op.id, core::opportunityStateToString(op.state), core::opportunityStateToString(target));
    }
}
}

ReallocationExecutor::ReallocationExecutor(
    std::shared_ptr<ledger::CapitalLedger> ledger,
    std::shared_ptr<analytics::IdleCapitalDetector> detector,
    std::shared_ptr<strategy::StrategyManager> strategies,
    std::shared_ptr<RateLimiter> limiter,
    std::shared_ptr<core::IYieldOracle> yields,
    std::shared_ptr<core::IRiskOracle> risks,
    std::shared_ptr<IClock> clock,
    long long opportunity_ttl_ms,
    std::shared_ptr<core::IEventJournal> journal,
    std::size_t opportunity_retention
)
    : ledger_(std::move(ledger))
    , detector_(std::move(detector))
    , strategies_(std::move(strategies))
    , limiter_(std::move(limiter))
    , yields_(std::move(yields))
    , risks_(std::move(risks))
    , clock_(std::move(clock))
    , opportunity_ttl_ms_(opportunity_ttl_ms)
    , journal_(std::move(journal))
    , opportunity_retention_(opportunity_retention) {}

// ===== Proposal =====

ProposeResult ReallocationExecutor::propose(core::ReallocationOpportunity op) {
    ProposeResult result;
    const auto& registry = ledger_->venues();

    if (op.expires_at_ms <= op.created_at_ms) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "opportunity expires before it is created");
    } else if (op.amount <= 0) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "opportunity amount must be positive");
    } else if (!ledger_->isRegistered(op.asset)) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + op.asset);
    } else if (op.from_venue != kUnallocatedVenue && !registry.contains(op.from_venue)) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown source venue: " + op.from_venue);
    } else if (!registry.contains(op.to_venue)) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown target venue: " + op.to_venue);
    } else if (op.from_venue == op.to_venue) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "source and target are the same venue");
    }
    if (!result.status.ok()) {
        LOG_WARN("Opportunity rejected: asset={}, {} -> {}, reason={}",
                 op.asset, op.from_venue, op.to_venue, result.status.reason);
        return result;
    }

    result.opportunity_id = storeNew(op);
    return result;
}

std::string ReallocationExecutor::storeNew(core::ReallocationOpportunity& op) {
    std::set<std::string> adaptive;
    for (const auto& s : strategies_->list()) {
        if (s.adaptive) {
            adaptive.insert(s.id);
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneLocked(clock_->nowMs(), adaptive);
        op.id = "opp-" + std::to_string(next_id_++);
        op.state = OpportunityState::PROPOSED;
        op.failure = OperationResult::success();
        op.actual_yield_improvement_bps = 0;
        op.settled_at_ms = 0;
        opportunities_[op.id] = op;
        order_.push_back(op.id);
    }
    LOG_INFO("Opportunity proposed: id={}, asset={}, {} -> {}, amount={}, improvement={}bps, net_benefit={:.2f}",
             op.id, op.asset, op.from_venue, op.to_venue, op.amount, op.yield_improvement_bps, op.net_benefit);
    journal(core::JournalEventType::OPPORTUNITY_PROPOSED, op.asset, op.id, core::execution::toJson(op));
    return op.id;
}

void ReallocationExecutor::store(const core::ReallocationOpportunity& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = opportunities_.find(op.id);
    if (it != opportunities_.end()) {
        it->second = op;
    }
}

void ReallocationExecutor::pruneLocked(long long now, const std::set<std::string>& adaptive_strategies) {
    // Leaves room for the opportunity about to be stored.
    auto it = order_.begin();
    while (opportunities_.size() >= opportunity_retention_ && it != order_.end()) {
        auto found = opportunities_.find(*it);
        if (found == opportunities_.end()) {
            it = order_.erase(it);
            continue;
        }
        const auto& op = found->second;
        const bool settled = core::isTerminalState(op.state) || op.isExpired(now);
        const bool pending_sample = op.state == OpportunityState::COMPLETED && !op.strategy_id.empty() &&
                                    adaptive_strategies.count(op.strategy_id) > 0 && sampled_.count(op.id) == 0;
        if (!settled || pending_sample) {
            ++it;
            continue;
        }
        sampled_.erase(op.id);
        opportunities_.erase(found);
        it = order_.erase(it);
    }
}

// ===== Single execution =====

ExecutionReport ReallocationExecutor::execute(const std::string& opportunity_id) {
    ExecutionReport report;
    report.opportunity_id = opportunity_id;

    auto snapshot = get(opportunity_id);
    if (!snapshot) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown opportunity: " + opportunity_id);
        return report;
    }
    report.asset = snapshot->asset;
    report.from_venue = snapshot->from_venue;
    report.to_venue = snapshot->to_venue;
    report.amount = snapshot->amount;
    report.state = snapshot->state;

    auto guard = ledger_->locks().tryAcquire(snapshot->asset);
    if (!guard) {
        report.status = OperationResult::failure(ErrorCode::ASSET_LOCKED, "asset busy: " + snapshot->asset);
        return report;
    }

    // Re-read under the asset lock: another caller may have settled it.
    auto op = get(opportunity_id);
    if (!op || core::isTerminalState(op->state)) {
        report.state = op ? op->state : report.state;
        report.status = OperationResult::failure(ErrorCode::VALIDATION,
            "opportunity already settled: " + opportunity_id);
        return report;
    }

    report = runLocked(*op, true, true);
    store(*op);
    return report;
}

ExecutionReport ReallocationExecutor::runLocked(core::ReallocationOpportunity& op, bool check_cooldown,
                                                bool record_cooldown) {
    ExecutionReport report;
    report.opportunity_id = op.id;
    report.asset = op.asset;
    report.from_venue = op.from_venue;
    report.to_venue = op.to_venue;
    report.amount = op.amount;

    const long long now = clock_->nowMs();
    const Asset& asset = op.asset;

    // 1. Expiry
    if (op.isExpired(now)) {
        settle(op, report, OpportunityState::EXPIRED, ExecutionStep::EXPIRY_CHECK,
               OperationResult::failure(ErrorCode::EXPIRED, "opportunity expired at " + std::to_string(op.expires_at_ms)));
        return report;
    }

    // 2. Re-validation against live yields
    if (ledger_->isHalted(asset)) {
        settle(op, report, OpportunityState::FAILED, ExecutionStep::REVALIDATION,
               OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "asset halted pending reconciliation"));
        return report;
    }
    if (ledger_->venues().isFrozen(op.to_venue)) {
        settle(op, report, OpportunityState::FAILED, ExecutionStep::REVALIDATION,
               OperationResult::failure(ErrorCode::VENUE_UNAVAILABLE, "target venue frozen: " + op.to_venue));
        return report;
    }
    const auto from_yield = currentYield(asset, op.from_venue);
    const auto to_yield = currentYield(asset, op.to_venue);
    if (!from_yield || !to_yield) {
        settle(op, report, OpportunityState::FAILED, ExecutionStep::REVALIDATION,
               OperationResult::failure(ErrorCode::VENUE_UNAVAILABLE, "yield unavailable during re-validation"));
        return report;
    }
    const Bps spread = *to_yield - *from_yield;
    if (spread <= op.min_yield_spread_bps) {
        settle(op, report, OpportunityState::FAILED, ExecutionStep::REVALIDATION,
               OperationResult::failure(ErrorCode::STALE_OPPORTUNITY,
                   "spread " + std::to_string(spread) + "bps not above " + std::to_string(op.min_yield_spread_bps) + "bps"));
        return report;
    }
    if (ledger_->balanceOf(asset, op.from_venue) < op.amount) {
        settle(op, report, OpportunityState::FAILED, ExecutionStep::REVALIDATION,
               OperationResult::failure(ErrorCode::INSUFFICIENT_LIQUIDITY, "source balance below amount"));
        return report;
    }

    // 3. Rate limit. The opportunity stays PROPOSED and may be retried until it expires.
    auto limit = limiter_->check(asset, op.amount, op.idle_capital_available, now, check_cooldown);
    if (!limit.ok()) {
        report.state = op.state;
        report.failed_step = ExecutionStep::RATE_LIMIT;
        report.status = limit;
        LOG_INFO("Reallocation deferred: id={}, asset={}, reason={}", op.id, asset, limit.reason);
        return report;
    }
    advance(op, OpportunityState::VALIDATED);
    advance(op, OpportunityState::EXECUTING);

    // 4. Withdraw from source
    const auto& registry = ledger_->venues();
    if (op.from_venue != kUnallocatedVenue) {
        Amount withdrawn = 0;
        try {
            auto adapter = registry.adapter(op.from_venue);
            withdrawn = adapter ? clampAmount(adapter->withdraw(asset, op.amount), op.amount) : 0;
        } catch (const std::exception& e) {
            settle(op, report, OpportunityState::FAILED, ExecutionStep::WITHDRAW,
                   OperationResult::failure(ErrorCode::VENUE_UNAVAILABLE, std::string("withdraw failed: ") + e.what()));
            return report;
        }
        if (withdrawn < op.amount) {
            if (withdrawn > 0) {
                returnOrPark(asset, op.from_venue, withdrawn);
            }
            settle(op, report, OpportunityState::FAILED, ExecutionStep::WITHDRAW,
                   OperationResult::failure(ErrorCode::INSUFFICIENT_LIQUIDITY,
                       "source released " + std::to_string(withdrawn) + " of " + std::to_string(op.amount)));
            return report;
        }
    }

    // 5. Deposit into target
    Amount placed = 0;
    std::string deposit_error;
    try {
        auto adapter = registry.adapter(op.to_venue);
        placed = adapter ? clampAmount(adapter->deposit(asset, op.amount), op.amount) : 0;
    } catch (const std::exception& e) {
        deposit_error = e.what();
        placed = 0;
    }
    if (placed < op.amount) {
        if (placed > 0) {
            auto partial = ledger_->rebalanceRecord(asset, op.from_venue, op.to_venue, placed);
            if (partial.ok()) {
                report.moved = placed;
            } else {
                LOG_ERROR("Partial placement not recorded: id={}, reason={}", op.id, partial.reason);
            }
        }
        returnOrPark(asset, op.from_venue, op.amount - placed);
        const ErrorCode code = deposit_error.empty() ? ErrorCode::INSUFFICIENT_LIQUIDITY : ErrorCode::VENUE_UNAVAILABLE;
        const std::string reason = deposit_error.empty()
            ? "target accepted " + std::to_string(placed) + " of " + std::to_string(op.amount)
            : "deposit failed: " + deposit_error;
        settle(op, report, OpportunityState::FAILED, ExecutionStep::DEPOSIT, OperationResult::failure(code, reason));
        return report;
    }

    // 6. Ledger record
    auto recorded = ledger_->rebalanceRecord(asset, op.from_venue, op.to_venue, op.amount);
    if (!recorded.ok()) {
        settle(op, report, OpportunityState::FAILED, ExecutionStep::LEDGER_RECORD, recorded);
        return report;
    }
    if (record_cooldown) {
        limiter_->recordReallocation(asset, now);
    }
    report.moved = op.amount;
    op.actual_yield_improvement_bps = spread;
    report.actual_yield_improvement_bps = spread;
    settle(op, report, OpportunityState::COMPLETED, ExecutionStep::NONE, OperationResult::success());
    Logger::getInstance().logReallocation(asset, op.from_venue, op.to_venue, op.amount, spread, op.net_benefit);
    return report;
}

void ReallocationExecutor::returnOrPark(const Asset& asset, const VenueId& venue, Amount amount) {
    if (amount <= 0 || venue == kUnallocatedVenue) {
        return;
    }
    Amount returned = 0;
    try {
        auto adapter = ledger_->venues().adapter(venue);
        returned = adapter ? clampAmount(adapter->deposit(asset, amount), amount) : 0;
    } catch (const std::exception& e) {
        LOG_WARN("Return to source failed: asset={}, venue={}, amount={}, error={}", asset, venue, amount, e.what());
    }
    const Amount parked = amount - returned;
    if (parked <= 0) {
        return;
    }
    auto recorded = ledger_->rebalanceRecord(asset, venue, kUnallocatedVenue, parked);
    if (recorded.ok()) {
        LOG_WARN("Unreturnable funds parked as unallocated: asset={}, venue={}, amount={}", asset, venue, parked);
    } else {
        LOG_ERROR("Parking unreturnable funds failed: asset={}, venue={}, amount={}, reason={}",
                  asset, venue, parked, recorded.reason);
    }
}

void ReallocationExecutor::settle(core::ReallocationOpportunity& op, ExecutionReport& report, OpportunityState state,
                                  ExecutionStep step, OperationResult status) {
    advance(op, state);
    op.failure = status;
    op.settled_at_ms = clock_->nowMs();

    report.state = op.state;
    report.failed_step = step;
    report.status = std::move(status);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& totals = totals_[op.asset];
        if (op.state == OpportunityState::COMPLETED) {
            totals.completed++;
            totals.last_completed_at_ms = std::max(totals.last_completed_at_ms, op.settled_at_ms);
        } else if (op.state == OpportunityState::EXPIRED) {
            totals.expired++;
        } else {
            totals.failed++;
        }
    }

    if (op.state == OpportunityState::COMPLETED) {
        LOG_INFO("Reallocation completed: id={}, asset={}, {} -> {}, amount={}, improvement={}bps",
                 op.id, op.asset, op.from_venue, op.to_venue, op.amount, op.actual_yield_improvement_bps);
        journal(core::JournalEventType::REALLOCATION_COMPLETED, op.asset, op.id, core::execution::toJson(op));
        return;
    }
    LOG_WARN("Reallocation {}: id={}, asset={}, {} -> {}, step={}, code={}, reason={}",
             core::opportunityStateToString(op.state), op.id, op.asset, op.from_venue, op.to_venue,
             core::executionStepToString(step), errorCodeToString(op.failure.code), op.failure.reason);
    auto payload = core::execution::toJson(op);
    payload["failed_step"] = core::executionStepToString(step);
    journal(core::JournalEventType::REALLOCATION_FAILED, op.asset, op.id, std::move(payload));
}

// ===== Strategy cycle =====

StrategyExecutionReport ReallocationExecutor::executeStrategy(const std::string& strategy_id) {
    StrategyExecutionReport report;
    report.strategy_id = strategy_id;

    const auto found = strategies_->get(strategy_id);
    if (!found) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown strategy: " + strategy_id);
        return report;
    }
    const core::ReallocationStrategy& s = *found;
    report.asset = s.asset;
    if (!s.active) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "strategy inactive: " + strategy_id);
        return report;
    }

    auto guard = ledger_->locks().tryAcquire(s.asset);
    if (!guard) {
        report.status = OperationResult::failure(ErrorCode::ASSET_LOCKED, "asset busy: " + s.asset);
        return report;
    }
    if (ledger_->isHalted(s.asset)) {
        report.status = OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "asset halted: " + s.asset);
        return report;
    }

    const long long now = clock_->nowMs();
    if (s.has_executed && now - s.last_execution_ms < s.execution_frequency_ms) {
        report.status = OperationResult::failure(ErrorCode::RATE_LIMITED,
            "strategy ran " + std::to_string(now - s.last_execution_ms) + " ms ago");
        return report;
    }
    if (!limiter_->cooldownElapsed(s.asset, now)) {
        report.status = OperationResult::failure(ErrorCode::RATE_LIMITED, "asset cooldown active: " + s.asset);
        return report;
    }

    // Idle capital per source, in strategy order.
    std::vector<std::pair<VenueId, Amount>> sources;
    for (const auto& venue : s.source_venues) {
        const auto detection = detector_->latest(s.asset, venue);
        if (!detection || !detection->is_reallocatable) {
            continue;
        }
        const Amount available = std::min(detection->idle_amount, ledger_->balanceOf(s.asset, venue));
        if (available > 0) {
            sources.emplace_back(venue, available);
            report.idle_capital += available;
        }
    }

    const auto cap_state = limiter_->state(s.asset);
    report.movable_capital = applyBps(report.idle_capital, cap_state.max_reallocation_bps_per_cycle);
    report.allocations = strategy::OrchestrationStrategy::splitByWeights(
        report.movable_capital, s.target_venues, s.target_weights);

    int failed_legs = 0;
    OperationResult first_failure;
    for (const auto& [target, allocation] : report.allocations) {
        Amount remaining = allocation;
        for (auto& [source, source_left] : sources) {
            if (remaining <= 0) {
                break;
            }
            const Amount take = std::min(remaining, source_left);
            if (take <= 0) {
                continue;
            }
            if (source == target) {
                // Already where it should be.
                source_left -= take;
                remaining -= take;
                continue;
            }

            const auto source_risk = riskOf(s.asset, source);
            const auto target_risk = riskOf(s.asset, target);
            if (!source_risk || !target_risk || *target_risk - *source_risk > s.max_risk_increase) {
                report.skipped_legs.emplace_back(source, target);
                LOG_WARN("Strategy leg skipped: strategy={}, {} -> {} (risk increase not allowed)", s.id, source, target);
                continue;
            }

            core::ReallocationOpportunity op;
            op.asset = s.asset;
            op.from_venue = source;
            op.to_venue = target;
            op.amount = take;
            op.idle_capital_available = report.idle_capital;
            op.current_yield_bps = currentYield(s.asset, source).value_or(0);
            op.target_yield_bps = currentYield(s.asset, target).value_or(0);
            op.yield_improvement_bps = op.target_yield_bps - op.current_yield_bps;
            op.min_yield_spread_bps = s.min_yield_improvement_bps;
            op.net_benefit = static_cast<double>(take) * op.yield_improvement_bps / kBpsDenominator;
            op.risk_score = *target_risk;
            op.source_risk_score = *source_risk;
            op.created_at_ms = now;
            op.expires_at_ms = now + opportunity_ttl_ms_;
            op.strategy_id = s.id;
            storeNew(op);

            auto leg = runLocked(op, false, false);
            store(op);
            if (leg.state == OpportunityState::COMPLETED) {
                report.completed_legs++;
                source_left -= take;
                remaining -= take;
            } else {
                if (failed_legs++ == 0) {
                    first_failure = leg.status;
                }
            }
            report.legs.push_back(std::move(leg));
        }
    }

    if (report.completed_legs > 0) {
        limiter_->recordReallocation(s.asset, now);
    }
    auto recorded = strategies_->recordExecution(s.id, now);
    if (!recorded.ok()) {
        LOG_WARN("Strategy execution not recorded: {}", recorded.reason);
    }

    report.status = (report.completed_legs > 0 || failed_legs == 0) ? OperationResult::success() : first_failure;

    LOG_INFO("Strategy executed: id={}, asset={}, idle={}, movable={}, legs={}, completed={}, skipped={}",
             s.id, s.asset, report.idle_capital, report.movable_capital, report.legs.size(),
             report.completed_legs, report.skipped_legs.size());
    nlohmann::json payload;
    payload["idle_capital"] = report.idle_capital;
    payload["movable_capital"] = report.movable_capital;
    payload["legs"] = report.legs.size();
    payload["completed_legs"] = report.completed_legs;
    payload["skipped_legs"] = report.skipped_legs.size();
    journal(core::JournalEventType::STRATEGY_EXECUTED, s.asset, s.id, std::move(payload));
    return report;
}

// ===== Emergency =====

EmergencyReport ReallocationExecutor::emergencyReallocate(const Asset& asset, const VenueId& from_venue,
                                                          Amount amount, const VenueId& to_safe_venue) {
    EmergencyReport report;
    report.asset = asset;
    report.from_venue = from_venue;
    report.requested = amount;
    report.destination = kUnallocatedVenue;

    const auto& registry = ledger_->venues();
    if (amount <= 0) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "emergency amount must be positive");
        return report;
    }
    if (!ledger_->isRegistered(asset)) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
        return report;
    }
    if (!registry.contains(from_venue)) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown venue: " + from_venue);
        return report;
    }
    if (!registry.contains(to_safe_venue)) {
        report.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown safe venue: " + to_safe_venue);
        return report;
    }

    auto guard = ledger_->locks().tryAcquire(asset);
    if (!guard) {
        report.status = OperationResult::failure(ErrorCode::ASSET_LOCKED, "asset busy: " + asset);
        return report;
    }
    if (ledger_->isHalted(asset)) {
        report.status = OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "asset halted: " + asset);
        return report;
    }

    const Amount recorded = ledger_->balanceOf(asset, from_venue);
    const Amount target_amount = std::min(amount, recorded);
    if (target_amount <= 0) {
        report.status = OperationResult::failure(ErrorCode::INSUFFICIENT_LIQUIDITY, "nothing recorded on " + from_venue);
        return report;
    }

    // Lowest-risk destination; ties prefer the requested safe venue, then id.
    std::optional<int> best_risk;
    for (const auto& id : registry.venueIds()) {
        if (id == from_venue || registry.isFrozen(id)) {
            continue;
        }
        const auto risk = riskOf(asset, id);
        if (!risk) {
            continue;
        }
        const bool better = !best_risk || *risk < *best_risk ||
                            (*risk == *best_risk && id == to_safe_venue);
        if (better) {
            best_risk = risk;
            report.destination = id;
        }
    }

    try {
        auto adapter = registry.adapter(from_venue);
        report.withdrawn = adapter ? clampAmount(adapter->withdraw(asset, target_amount), target_amount) : 0;
    } catch (const std::exception& e) {
        report.status = OperationResult::failure(ErrorCode::VENUE_UNAVAILABLE, std::string("withdraw failed: ") + e.what());
        LOG_ERROR("Emergency withdraw failed: asset={}, venue={}, error={}", asset, from_venue, e.what());
        return report;
    }
    if (report.withdrawn <= 0) {
        report.status = OperationResult::failure(ErrorCode::INSUFFICIENT_LIQUIDITY, from_venue + " released nothing");
        LOG_ERROR("Emergency withdraw released nothing: asset={}, venue={}", asset, from_venue);
        return report;
    }

    if (report.destination != kUnallocatedVenue) {
        try {
            auto adapter = registry.adapter(report.destination);
            report.placed = adapter ? clampAmount(adapter->deposit(asset, report.withdrawn), report.withdrawn) : 0;
        } catch (const std::exception& e) {
            LOG_ERROR("Emergency deposit failed: asset={}, venue={}, error={}", asset, report.destination, e.what());
            report.placed = 0;
        }
    }
    report.unallocated = report.withdrawn - report.placed;

    if (report.placed > 0) {
        auto r = ledger_->rebalanceRecord(asset, from_venue, report.destination, report.placed);
        if (!r.ok()) {
            report.status = r;
        }
    }
    if (report.unallocated > 0 && report.status.ok()) {
        auto r = ledger_->rebalanceRecord(asset, from_venue, kUnallocatedVenue, report.unallocated);
        if (!r.ok()) {
            report.status = r;
        }
    }

    LOG_WARN("Emergency reallocation: asset={}, from={}, requested={}, withdrawn={}, to={} placed={}, unallocated={}",
             asset, from_venue, report.requested, report.withdrawn, report.destination, report.placed, report.unallocated);
    nlohmann::json payload;
    payload["from_venue"] = from_venue;
    payload["destination"] = report.destination;
    payload["requested"] = report.requested;
    payload["withdrawn"] = report.withdrawn;
    payload["placed"] = report.placed;
    payload["unallocated"] = report.unallocated;
    journal(core::JournalEventType::EMERGENCY_REALLOCATION, asset, from_venue, std::move(payload));
    return report;
}

// ===== Queries / helpers =====

std::optional<core::ReallocationOpportunity> ReallocationExecutor::get(const std::string& opportunity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = opportunities_.find(opportunity_id);
    if (it == opportunities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::ReallocationOpportunity> ReallocationExecutor::opportunities(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ReallocationOpportunity> out;
    for (const auto& entry : opportunities_) {
        if (entry.second.asset == asset) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<core::ReallocationOpportunity> ReallocationExecutor::completedFor(const std::string& strategy_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ReallocationOpportunity> out;
    for (const auto& entry : opportunities_) {
        if (entry.second.strategy_id == strategy_id && entry.second.state == OpportunityState::COMPLETED) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<core::ReallocationOpportunity> ReallocationExecutor::takeAdaptationSamples(const std::string& strategy_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ReallocationOpportunity> out;
    for (const auto& id : order_) {
        auto it = opportunities_.find(id);
        if (it == opportunities_.end() || sampled_.count(id) > 0) {
            continue;
        }
        if (it->second.strategy_id == strategy_id && it->second.state == OpportunityState::COMPLETED) {
            out.push_back(it->second);
            sampled_.insert(id);
        }
    }
    return out;
}

SettlementTotals ReallocationExecutor::totals(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = totals_.find(asset);
    return it == totals_.end() ? SettlementTotals{} : it->second;
}

std::size_t ReallocationExecutor::storedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opportunities_.size();
}

std::optional<Bps> ReallocationExecutor::currentYield(const Asset& asset, const VenueId& venue) const {
    if (venue == kUnallocatedVenue) {
        return 0;
    }
    try {
        return yields_->yieldBps(asset, venue);
    } catch (const std::exception& e) {
        LOG_WARN("Yield unavailable: asset={}, venue={}, error={}", asset, venue, e.what());
        return std::nullopt;
    }
}

std::optional<int> ReallocationExecutor::riskOf(const Asset& asset, const VenueId& venue) const {
    if (venue == kUnallocatedVenue) {
        return 0;
    }
    try {
        return std::clamp(risks_->riskScore(asset, venue), 0, 100);
    } catch (const std::exception& e) {
        LOG_WARN("Risk unavailable: asset={}, venue={}, error={}", asset, venue, e.what());
        return std::nullopt;
    }
}

void ReallocationExecutor::journal(core::JournalEventType type, const Asset& asset,
                                   const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_->nowMs();
    event.type = type;
    event.asset = asset;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed: asset={}, entity={}", asset, entity_id);
    }
}

} // namespace execution
} // namespace capflow
