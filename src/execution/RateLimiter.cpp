#include "execution/RateLimiter.h"
#include "common/Logger.h"

namespace capflow {
namespace execution {

RateLimiter::RateLimiter(long long default_cooldown_ms, Bps default_max_bps_per_cycle)
    : default_cooldown_ms_(default_cooldown_ms)
    , default_max_bps_per_cycle_(default_max_bps_per_cycle) {}

OperationResult RateLimiter::configure(const Asset& asset, long long cooldown_ms, Bps max_reallocation_bps_per_cycle) {
    if (cooldown_ms < 0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "cooldown must be non-negative");
    }
    if (max_reallocation_bps_per_cycle <= 0 || max_reallocation_bps_per_cycle > kBpsDenominator) {
        return OperationResult::failure(ErrorCode::VALIDATION, "per-cycle cap must be within (0, 10000] bps");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = stateLocked(asset);
    state.cooldown_ms = cooldown_ms;
    state.max_reallocation_bps_per_cycle = max_reallocation_bps_per_cycle;
    LOG_INFO("Rate limit set: asset={}, cooldown_ms={}, max_bps_per_cycle={}",
             asset, cooldown_ms, max_reallocation_bps_per_cycle);
    return OperationResult::success();
}

OperationResult RateLimiter::check(const Asset& asset, Amount amount, Amount idle_available,
                                   long long now_ms, bool check_cooldown) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_checks++;
    auto& state = stateLocked(asset);

    if (check_cooldown && !cooldownElapsedLocked(state, now_ms)) {
        stats_.rejected_checks++;
        const long long remaining = state.last_reallocation_at_ms + state.cooldown_ms - now_ms;
        return OperationResult::failure(ErrorCode::RATE_LIMITED,
            "cooldown active for " + asset + ", " + std::to_string(remaining) + " ms left");
    }

    const Amount cap = applyBps(idle_available, state.max_reallocation_bps_per_cycle);
    if (amount > cap) {
        stats_.rejected_checks++;
        return OperationResult::failure(ErrorCode::RATE_LIMITED,
            "amount " + std::to_string(amount) + " exceeds per-cycle cap " + std::to_string(cap));
    }
    return OperationResult::success();
}

void RateLimiter::recordReallocation(const Asset& asset, long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = stateLocked(asset);
    state.last_reallocation_at_ms = now_ms;
    state.has_reallocated = true;
    stats_.recorded_reallocations++;
}

bool RateLimiter::cooldownElapsed(const Asset& asset, long long now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(asset);
    if (it == states_.end()) {
        return true;
    }
    return cooldownElapsedLocked(it->second, now_ms);
}

core::RateLimitState RateLimiter::state(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(asset);
    if (it != states_.end()) {
        return it->second;
    }
    core::RateLimitState defaults;
    defaults.cooldown_ms = default_cooldown_ms_;
    defaults.max_reallocation_bps_per_cycle = default_max_bps_per_cycle_;
    return defaults;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

core::RateLimitState& RateLimiter::stateLocked(const Asset& asset) {
    auto it = states_.find(asset);
    if (it == states_.end()) {
        core::RateLimitState state;
        state.cooldown_ms = default_cooldown_ms_;
        state.max_reallocation_bps_per_cycle = default_max_bps_per_cycle_;
        it = states_.emplace(asset, state).first;
    }
    return it->second;
}

bool RateLimiter::cooldownElapsedLocked(const core::RateLimitState& state, long long now_ms) const {
    if (!state.has_reallocated) {
        return true;
    }
    return now_ms - state.last_reallocation_at_ms >= state.cooldown_ms;
}

} // namespace execution
} // namespace capflow
