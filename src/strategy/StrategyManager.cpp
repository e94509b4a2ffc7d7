#include "strategy/StrategyManager.h"
#include "strategy/OrchestrationStrategy.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <numeric>

namespace capflow {
namespace strategy {
namespace {
std::uint64_t numericSuffix(const std::string& id) {
    const auto pos = id.rfind('-');
    if (pos == std::string::npos || pos + 1 >= id.size()) {
        return 0;
    }
    const std::string digits = id.substr(pos + 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    return std::stoull(digits);
}
}

StrategyManager::StrategyManager(
    std::shared_ptr<ledger::CapitalLedger> ledger,
    std::shared_ptr<IClock> clock,
    engine::StrategyDefaults defaults,
    std::shared_ptr<core::IStrategyStore> store
)
    : ledger_(std::move(ledger))
    , clock_(std::move(clock))
    , defaults_(defaults)
    , store_(std::move(store)) {}

CreateStrategyResult StrategyManager::createStrategy(core::ReallocationStrategy draft) {
    CreateStrategyResult result;
    if (draft.adaptation_alpha <= 0.0) {
        draft.adaptation_alpha = defaults_.default_adaptation_alpha;
    }
    result.status = OrchestrationStrategy::validate(draft, *ledger_, defaults_.minimum_interval_ms);
    if (!result.status.ok()) {
        LOG_WARN("Strategy rejected: name={}, reason={}", draft.name, result.status.reason);
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    draft.id = "strat-" + std::to_string(next_id_++);
    draft.last_execution_ms = 0;
    draft.has_executed = false;
    result.strategy_id = draft.id;
    LOG_INFO("Strategy created: id={}, name={}, kind={}, asset={}, targets={}",
             draft.id, draft.name, core::strategyKindToString(draft.kind), draft.asset, draft.target_venues.size());
    strategies_.emplace(draft.id, std::move(draft));
    persistLocked();
    return result;
}

OperationResult StrategyManager::activate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "unknown strategy: " + id);
    }
    it->second.active = true;
    LOG_INFO("Strategy activated: {}", id);
    persistLocked();
    return OperationResult::success();
}

OperationResult StrategyManager::deactivate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "unknown strategy: " + id);
    }
    it->second.active = false;
    LOG_INFO("Strategy deactivated: {}", id);
    persistLocked();
    return OperationResult::success();
}

std::optional<core::ReallocationStrategy> StrategyManager::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::ReallocationStrategy> StrategyManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ReallocationStrategy> out;
    out.reserve(strategies_.size());
    for (const auto& entry : strategies_) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<core::ReallocationStrategy> StrategyManager::activeFor(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ReallocationStrategy> out;
    for (const auto& entry : strategies_) {
        if (entry.second.active && entry.second.asset == asset) {
            out.push_back(entry.second);
        }
    }
    return out;
}

OperationResult StrategyManager::recordExecution(const std::string& id, long long executed_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "unknown strategy: " + id);
    }
    it->second.last_execution_ms = executed_at_ms;
    it->second.has_executed = true;
    persistLocked();
    return OperationResult::success();
}

OperationResult StrategyManager::updateTargetWeights(const std::string& id, const std::vector<Bps>& weights) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "unknown strategy: " + id);
    }
    if (weights.size() != it->second.target_venues.size() ||
        std::accumulate(weights.begin(), weights.end(), 0LL) != kBpsDenominator) {
        return OperationResult::failure(ErrorCode::VALIDATION, "weights must match targets and sum to 10000 bps");
    }
    it->second.target_weights = weights;
    persistLocked();
    return OperationResult::success();
}

std::size_t StrategyManager::restore() {
    if (!store_) {
        return 0;
    }
    const auto snapshot = store_->load();
    if (!snapshot) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t restored = 0;
    for (const auto& s : snapshot->strategies) {
        if (s.id.empty() || strategies_.count(s.id) > 0) {
            continue;
        }
        next_id_ = std::max(next_id_, numericSuffix(s.id) + 1);
        strategies_.emplace(s.id, s);
        ++restored;
    }
    LOG_INFO("Strategies restored: {} (saved_at_ms={})", restored, snapshot->saved_at_ms);
    return restored;
}

void StrategyManager::persistLocked() {
    if (!store_) {
        return;
    }
    core::StrategyStoreSnapshot snapshot;
    snapshot.saved_at_ms = clock_->nowMs();
    for (const auto& entry : strategies_) {
        snapshot.strategies.push_back(entry.second);
    }
    if (!store_->save(snapshot)) {
        LOG_ERROR("Strategy store save failed ({} strategies)", snapshot.strategies.size());
    }
}

} // namespace strategy
} // namespace capflow
