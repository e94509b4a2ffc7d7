#pragma once

#include <nlohmann/json.hpp>

#include "core/model/AllocationTypes.h"

namespace capflow {
namespace core {
namespace execution {

inline nlohmann::json toJson(const ReallocationOpportunity& op) {
    nlohmann::json line;
    line["id"] = op.id;
    line["asset"] = op.asset;
    line["from_venue"] = op.from_venue;
    line["to_venue"] = op.to_venue;
    line["amount"] = op.amount;
    line["idle_capital_available"] = op.idle_capital_available;
    line["current_yield_bps"] = op.current_yield_bps;
    line["target_yield_bps"] = op.target_yield_bps;
    line["yield_improvement_bps"] = op.yield_improvement_bps;
    line["estimated_cost"] = op.estimated_cost;
    line["net_benefit"] = op.net_benefit;
    line["risk_score"] = op.risk_score;
    line["score"] = op.score;
    line["confidence"] = op.confidence;
    line["created_at_ms"] = op.created_at_ms;
    line["expires_at_ms"] = op.expires_at_ms;
    line["strategy_id"] = op.strategy_id;
    line["state"] = opportunityStateToString(op.state);
    if (!op.failure.ok()) {
        line["error"] = errorCodeToString(op.failure.code);
        line["reason"] = op.failure.reason;
    }
    if (op.state == OpportunityState::COMPLETED) {
        line["actual_yield_improvement_bps"] = op.actual_yield_improvement_bps;
    }
    return line;
}

inline nlohmann::json toJson(const IdleDetection& d) {
    nlohmann::json line;
    line["asset"] = d.asset;
    line["venue"] = d.venue;
    line["total_capital"] = d.total_capital;
    line["idle_amount"] = d.idle_amount;
    line["utilization_bps"] = d.utilization_bps;
    line["current_yield_bps"] = d.current_yield_bps;
    line["best_alternative_yield_bps"] = d.best_alternative_yield_bps;
    line["opportunity_cost"] = d.opportunity_cost;
    line["detected_at_ms"] = d.detected_at_ms;
    line["state"] = idleStateToString(d.state);
    return line;
}

} // namespace execution
} // namespace core
} // namespace capflow
