#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IVenueAdapter.h"

namespace capflow {
namespace core {

// In-process venue for paper mode. Holds balances per asset and answers
// metric queries from settable values. Failure injection (unavailable,
// withdraw/deposit caps) drives the degraded paths.
class SimulatedVenueAdapter : public IVenueAdapter {
public:
    SimulatedVenueAdapter(std::string venue_id, Bps yield_bps, Bps utilization_bps, Amount liquidity_depth);

    Amount deposit(const Asset& asset, Amount amount) override;
    Amount withdraw(const Asset& asset, Amount amount) override;
    Bps queryUtilization(const Asset& asset) override;
    Bps queryYield(const Asset& asset) override;
    Amount queryLiquidityDepth(const Asset& asset) override;

    void setYield(const Asset& asset, Bps yield_bps);
    void setUtilization(const Asset& asset, Bps utilization_bps);
    void setLiquidityDepth(const Asset& asset, Amount depth);
    void setUnavailable(bool unavailable);
    void setWithdrawCap(std::optional<Amount> cap);
    void setDepositCap(std::optional<Amount> cap);

    Amount held(const Asset& asset) const;
    const std::string& venueId() const { return venue_id_; }

private:
    struct AssetBook {
        Amount held = 0;
        std::optional<Bps> yield_bps;
        std::optional<Bps> utilization_bps;
        std::optional<Amount> liquidity_depth;
    };

    void throwIfUnavailable(const char* call) const;

    std::string venue_id_;
    Bps default_yield_bps_;
    Bps default_utilization_bps_;
    Amount default_liquidity_depth_;

    mutable std::mutex mutex_;
    std::map<Asset, AssetBook> books_;
    bool unavailable_ = false;
    std::optional<Amount> withdraw_cap_;
    std::optional<Amount> deposit_cap_;
};

} // namespace core
} // namespace capflow
