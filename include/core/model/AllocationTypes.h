#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Errors.h"
#include "common/Types.h"

namespace capflow {
namespace core {

enum class JournalEventType {
    DEPOSIT_APPLIED,
    WITHDRAWAL_APPLIED,
    IDLE_DETECTED,
    OPPORTUNITY_PROPOSED,
    REALLOCATION_COMPLETED,
    REALLOCATION_FAILED,
    STRATEGY_EXECUTED,
    STRATEGY_ADAPTED,
    EMERGENCY_REALLOCATION,
    LEDGER_HALTED,
    ENGINE_PAUSED,
    ENGINE_UNPAUSED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::DEPOSIT_APPLIED;
    std::string asset;
    std::string entity_id;
    nlohmann::json payload;
};

// Operations gated at the engine boundary.
enum class Capability {
    DEPOSIT,
    WITHDRAW,
    CONFIGURE,      // register assets/venues, weights, rate limits
    MANAGE_STRATEGY,
    KEEPER,         // scan, cycle, executeStrategy, adapt
    EMERGENCY,
    RECONCILE
};

struct LedgerEntry {
    Asset asset;
    Amount total_deposited = 0;
    std::map<VenueId, Amount> per_venue_balance;
    std::vector<VenueWeight> utilization_target;
    long long last_update_ms = 0;
    bool halted = false;
    std::string halt_reason;

    Amount venueSum() const {
        Amount sum = 0;
        for (const auto& [venue, amount] : per_venue_balance) {
            (void)venue;
            sum += amount;
        }
        return sum;
    }
    bool invariantHolds() const { return venueSum() == total_deposited; }
};

enum class IdleState { UNKNOWN, MONITORED, IDLE, REALLOCATABLE, NOT_REALLOCATABLE };

inline const char* idleStateToString(IdleState state) {
    switch (state) {
        case IdleState::UNKNOWN: return "UNKNOWN";
        case IdleState::MONITORED: return "MONITORED";
        case IdleState::IDLE: return "IDLE";
        case IdleState::REALLOCATABLE: return "REALLOCATABLE";
        case IdleState::NOT_REALLOCATABLE: return "NOT_REALLOCATABLE";
    }
    return "UNKNOWN";
}

struct IdleDetection {
    Asset asset;
    VenueId venue;
    Amount total_capital = 0;
    Amount active_capital = 0;
    Amount idle_amount = 0;
    Bps utilization_bps = 0;
    Bps current_yield_bps = 0;
    Bps best_alternative_yield_bps = 0;
    double opportunity_cost = 0.0;
    long long detected_at_ms = 0;
    long long idle_since_ms = 0;
    bool is_idle = false;
    bool is_reallocatable = false;
    IdleState state = IdleState::UNKNOWN;

    bool operator==(const IdleDetection& other) const {
        return asset == other.asset && venue == other.venue &&
               total_capital == other.total_capital &&
               active_capital == other.active_capital &&
               idle_amount == other.idle_amount &&
               utilization_bps == other.utilization_bps &&
               current_yield_bps == other.current_yield_bps &&
               best_alternative_yield_bps == other.best_alternative_yield_bps &&
               opportunity_cost == other.opportunity_cost &&
               detected_at_ms == other.detected_at_ms &&
               idle_since_ms == other.idle_since_ms &&
               is_idle == other.is_idle &&
               is_reallocatable == other.is_reallocatable &&
               state == other.state;
    }
};

enum class OpportunityState { PROPOSED, VALIDATED, EXECUTING, COMPLETED, FAILED, EXPIRED };

inline const char* opportunityStateToString(OpportunityState state) {
    switch (state) {
        case OpportunityState::PROPOSED: return "PROPOSED";
        case OpportunityState::VALIDATED: return "VALIDATED";
        case OpportunityState::EXECUTING: return "EXECUTING";
        case OpportunityState::COMPLETED: return "COMPLETED";
        case OpportunityState::FAILED: return "FAILED";
        case OpportunityState::EXPIRED: return "EXPIRED";
    }
    return "PROPOSED";
}

inline bool isTerminalState(OpportunityState state) {
    return state == OpportunityState::COMPLETED ||
           state == OpportunityState::FAILED ||
           state == OpportunityState::EXPIRED;
}

// Step of an execution at which it stopped.
enum class ExecutionStep { NONE, EXPIRY_CHECK, REVALIDATION, RATE_LIMIT, WITHDRAW, DEPOSIT, LEDGER_RECORD };

inline const char* executionStepToString(ExecutionStep step) {
    switch (step) {
        case ExecutionStep::NONE: return "NONE";
        case ExecutionStep::EXPIRY_CHECK: return "EXPIRY_CHECK";
        case ExecutionStep::REVALIDATION: return "REVALIDATION";
        case ExecutionStep::RATE_LIMIT: return "RATE_LIMIT";
        case ExecutionStep::WITHDRAW: return "WITHDRAW";
        case ExecutionStep::DEPOSIT: return "DEPOSIT";
        case ExecutionStep::LEDGER_RECORD: return "LEDGER_RECORD";
    }
    return "NONE";
}

struct ReallocationOpportunity {
    std::string id;
    Asset asset;
    VenueId from_venue;
    VenueId to_venue;
    Amount amount = 0;
    Amount idle_capital_available = 0;
    Bps current_yield_bps = 0;
    Bps target_yield_bps = 0;
    Bps yield_improvement_bps = 0;
    // Re-validation floor: the live spread must stay above this.
    Bps min_yield_spread_bps = 0;
    double estimated_cost = 0.0;
    double net_benefit = 0.0;
    int risk_score = 0;
    int source_risk_score = 0;
    double score = 0.0;
    double confidence = 0.0;
    long long created_at_ms = 0;
    long long expires_at_ms = 0;
    std::string strategy_id;

    OpportunityState state = OpportunityState::PROPOSED;
    OperationResult failure;
    Bps actual_yield_improvement_bps = 0;
    long long settled_at_ms = 0;

    bool isExpired(long long now_ms) const { return now_ms > expires_at_ms; }
};

enum class StrategyKind { YIELD_MAXIMIZING, RISK_MINIMIZING, LIQUIDITY_OPTIMIZING, BALANCED };

inline const char* strategyKindToString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::YIELD_MAXIMIZING: return "yield_maximizing";
        case StrategyKind::RISK_MINIMIZING: return "risk_minimizing";
        case StrategyKind::LIQUIDITY_OPTIMIZING: return "liquidity_optimizing";
        case StrategyKind::BALANCED: return "balanced";
    }
    return "balanced";
}

inline StrategyKind strategyKindFromString(const std::string& value) {
    if (value == "yield_maximizing" || value == "yield") return StrategyKind::YIELD_MAXIMIZING;
    if (value == "risk_minimizing" || value == "risk") return StrategyKind::RISK_MINIMIZING;
    if (value == "liquidity_optimizing" || value == "liquidity") return StrategyKind::LIQUIDITY_OPTIMIZING;
    return StrategyKind::BALANCED;
}

// Score weights in bps; they sum to 10000.
struct ScoringWeights {
    Bps yield_bps = 4000;
    Bps risk_bps = 3000;
    Bps liquidity_bps = 2000;
    Bps cost_bps = 1000;

    Bps sum() const { return yield_bps + risk_bps + liquidity_bps + cost_bps; }
};

struct ReallocationStrategy {
    std::string id;
    std::string name;
    StrategyKind kind = StrategyKind::BALANCED;
    Asset asset;
    std::vector<VenueId> source_venues;
    std::vector<VenueId> target_venues;
    std::vector<Bps> target_weights;
    ScoringWeights scoring_weights;
    Bps min_yield_improvement_bps = 0;
    int max_risk_increase = 100;
    long long execution_frequency_ms = 0;
    long long last_execution_ms = 0;
    bool has_executed = false;
    bool active = false;
    bool adaptive = false;
    double adaptation_alpha = 0.2;
};

struct RateLimitState {
    long long last_reallocation_at_ms = 0;
    bool has_reallocated = false;
    long long cooldown_ms = 0;
    Bps max_reallocation_bps_per_cycle = kBpsDenominator;
};

} // namespace core
} // namespace capflow
