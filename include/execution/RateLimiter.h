#pragma once

#include <map>
#include <mutex>
#include <string>

#include "common/Errors.h"
#include "common/Types.h"
#include "core/model/AllocationTypes.h"

namespace capflow {
namespace execution {

// Per-asset reallocation throttle: a cooldown between reallocations and a
// cap on how much of the idle capital a single cycle may move.
// Non-blocking: a refused request is reported, never waited out.
class RateLimiter {
public:
    RateLimiter(long long default_cooldown_ms, Bps default_max_bps_per_cycle);

    OperationResult configure(const Asset& asset, long long cooldown_ms, Bps max_reallocation_bps_per_cycle);

    // check_cooldown=false lets a strategy cycle that already cleared the
    // cooldown once run its remaining legs.
    OperationResult check(const Asset& asset, Amount amount, Amount idle_available,
                          long long now_ms, bool check_cooldown = true);

    void recordReallocation(const Asset& asset, long long now_ms);
    bool cooldownElapsed(const Asset& asset, long long now_ms) const;

    core::RateLimitState state(const Asset& asset) const;

    struct Stats {
        int total_checks = 0;
        int rejected_checks = 0;
        int recorded_reallocations = 0;
    };
    Stats getStats() const;

private:
    core::RateLimitState& stateLocked(const Asset& asset);
    bool cooldownElapsedLocked(const core::RateLimitState& state, long long now_ms) const;

    long long default_cooldown_ms_;
    Bps default_max_bps_per_cycle_;

    mutable std::mutex mutex_;
    std::map<Asset, core::RateLimitState> states_;
    Stats stats_;
};

} // namespace execution
} // namespace capflow
