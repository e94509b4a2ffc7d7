#pragma once

#include <memory>

#include "core/contracts/IPriceOracle.h"
#include "core/contracts/IYieldOracle.h"
#include "execution/ReallocationExecutor.h"
#include "ledger/CapitalLedger.h"

namespace capflow {
namespace analytics {

struct AssetAnalytics {
    Asset asset;
    Amount total_deposited = 0;
    Amount total_utilized = 0;
    Amount idle_capital = 0;
    Amount unallocated = 0;
    Bps weighted_yield_bps = 0;
    int venue_count = 0;
    int completed_reallocations = 0;
    int failed_reallocations = 0;
    long long last_reallocation_at_ms = 0;
    double total_value = 0.0;
    bool price_available = false;
};

// Derived view, recomputed on demand from the ledger, adapters, oracles and
// executor history. Never stored.
class AllocationAnalytics {
public:
    AllocationAnalytics(
        std::shared_ptr<ledger::CapitalLedger> ledger,
        std::shared_ptr<execution::ReallocationExecutor> executor,
        std::shared_ptr<core::IYieldOracle> yields,
        std::shared_ptr<core::IPriceOracle> prices
    );

    AssetAnalytics compute(const Asset& asset) const;

private:
    std::shared_ptr<ledger::CapitalLedger> ledger_;
    std::shared_ptr<execution::ReallocationExecutor> executor_;
    std::shared_ptr<core::IYieldOracle> yields_;
    std::shared_ptr<core::IPriceOracle> prices_;
};

} // namespace analytics
} // namespace capflow
