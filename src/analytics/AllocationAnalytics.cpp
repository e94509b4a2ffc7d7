#include "analytics/AllocationAnalytics.h"
#include "common/Logger.h"

namespace capflow {
namespace analytics {

AllocationAnalytics::AllocationAnalytics(
    std::shared_ptr<ledger::CapitalLedger> ledger,
    std::shared_ptr<execution::ReallocationExecutor> executor,
    std::shared_ptr<core::IYieldOracle> yields,
    std::shared_ptr<core::IPriceOracle> prices
)
    : ledger_(std::move(ledger))
    , executor_(std::move(executor))
    , yields_(std::move(yields))
    , prices_(std::move(prices)) {}

AssetAnalytics AllocationAnalytics::compute(const Asset& asset) const {
    AssetAnalytics out;
    out.asset = asset;

    const auto entry = ledger_->snapshot(asset);
    if (!entry) {
        return out;
    }
    out.total_deposited = entry->total_deposited;

    double yield_weighted_sum = 0.0;
    for (const auto& [venue, balance] : entry->per_venue_balance) {
        if (balance <= 0) {
            continue;
        }
        if (venue == kUnallocatedVenue) {
            out.unallocated = balance;
            continue;
        }
        out.venue_count++;
        const auto util = ledger_->utilization(asset, venue);
        out.total_utilized += util ? applyBps(balance, *util) : 0;
        if (yields_) {
            try {
                yield_weighted_sum += static_cast<double>(balance) * yields_->yieldBps(asset, venue);
            } catch (const std::exception& e) {
                LOG_WARN("Analytics yield unavailable: asset={}, venue={}, error={}", asset, venue, e.what());
            }
        }
    }
    out.idle_capital = out.total_deposited - out.total_utilized;
    if (out.total_deposited > 0) {
        out.weighted_yield_bps = static_cast<Bps>(yield_weighted_sum / static_cast<double>(out.total_deposited));
    }

    if (executor_) {
        const auto totals = executor_->totals(asset);
        out.completed_reallocations = totals.completed;
        out.failed_reallocations = totals.failed;
        out.last_reallocation_at_ms = totals.last_completed_at_ms;
    }

    if (prices_) {
        try {
            out.total_value = static_cast<double>(out.total_deposited) * prices_->price(asset);
            out.price_available = true;
        } catch (const std::exception& e) {
            LOG_WARN("Analytics price unavailable: asset={}, error={}", asset, e.what());
        }
    }
    return out;
}

} // namespace analytics
} // namespace capflow
