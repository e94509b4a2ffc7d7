#include "execution/RateLimiter.h"

#include <cassert>
#include <iostream>

using namespace capflow;
using capflow::execution::RateLimiter;

int main() {
    RateLimiter limiter(3600000, 10000);

    {
        assert(limiter.configure("USDC", -1, 5000).code == ErrorCode::VALIDATION);
        assert(limiter.configure("USDC", 1000, 0).code == ErrorCode::VALIDATION);
        assert(limiter.configure("USDC", 1000, 10001).code == ErrorCode::VALIDATION);
    }

    // Unconfigured asset runs on defaults; first reallocation is never throttled.
    {
        auto s = limiter.state("DAI");
        assert(s.cooldown_ms == 3600000);
        assert(s.max_reallocation_bps_per_cycle == 10000);
        assert(!s.has_reallocated);
        assert(limiter.check("DAI", 500000, 500000, 0).ok());
        assert(limiter.cooldownElapsed("DAI", 0));
    }

    // Cooldown window.
    {
        limiter.recordReallocation("DAI", 1000);
        assert(!limiter.cooldownElapsed("DAI", 1000 + 3599999));
        assert(limiter.check("DAI", 1, 100, 2000).code == ErrorCode::RATE_LIMITED);
        assert(limiter.check("DAI", 1, 100, 2000, false).ok());
        assert(limiter.cooldownElapsed("DAI", 1000 + 3600000));
        assert(limiter.check("DAI", 1, 100, 1000 + 3600000).ok());
        assert(limiter.state("DAI").last_reallocation_at_ms == 1000);
    }

    // Per-cycle cap is a share of the idle capital.
    {
        assert(limiter.configure("USDC", 0, 2500).ok());
        assert(limiter.check("USDC", 25000, 100000, 0).ok());
        assert(limiter.check("USDC", 25001, 100000, 0).code == ErrorCode::RATE_LIMITED);
        limiter.recordReallocation("USDC", 50);
        assert(limiter.check("USDC", 25000, 100000, 50).ok());
    }

    {
        auto stats = limiter.getStats();
        assert(stats.total_checks == 7);
        assert(stats.rejected_checks == 2);
        assert(stats.recorded_reallocations == 2);
    }

    std::cout << "[TEST] RateLimiter PASSED\n";
    return 0;
}
