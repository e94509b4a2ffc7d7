#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "core/contracts/IPriceOracle.h"
#include "core/contracts/IRiskOracle.h"

namespace capflow {
namespace core {

// Risk scores set by the operator (or loaded from config). A per-asset entry
// overrides the venue-wide one. Unknown venues throw.
class ConfiguredRiskOracle : public IRiskOracle {
public:
    void setVenueRisk(const VenueId& venue, int score);
    void setAssetVenueRisk(const Asset& asset, const VenueId& venue, int score);

    int riskScore(const Asset& asset, const VenueId& venue) override;

private:
    mutable std::mutex mutex_;
    std::map<VenueId, int> venue_scores_;
    std::map<std::pair<Asset, VenueId>, int> asset_scores_;
};

class ConfiguredPriceOracle : public IPriceOracle {
public:
    void setPrice(const Asset& asset, double price);

    double price(const Asset& asset) override;

private:
    mutable std::mutex mutex_;
    std::map<Asset, double> prices_;
};

} // namespace core
} // namespace capflow
