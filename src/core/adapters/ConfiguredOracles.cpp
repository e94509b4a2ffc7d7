#include "core/adapters/ConfiguredOracles.h"

#include <algorithm>
#include <stdexcept>

namespace capflow {
namespace core {

void ConfiguredRiskOracle::setVenueRisk(const VenueId& venue, int score) {
    std::lock_guard<std::mutex> lock(mutex_);
    venue_scores_[venue] = std::clamp(score, 0, 100);
}

void ConfiguredRiskOracle::setAssetVenueRisk(const Asset& asset, const VenueId& venue, int score) {
    std::lock_guard<std::mutex> lock(mutex_);
    asset_scores_[{asset, venue}] = std::clamp(score, 0, 100);
}

int ConfiguredRiskOracle::riskScore(const Asset& asset, const VenueId& venue) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto specific = asset_scores_.find({asset, venue});
    if (specific != asset_scores_.end()) {
        return specific->second;
    }
    auto it = venue_scores_.find(venue);
    if (it == venue_scores_.end()) {
        throw std::out_of_range("no risk score for venue " + venue);
    }
    return it->second;
}

void ConfiguredPriceOracle::setPrice(const Asset& asset, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[asset] = price;
}

double ConfiguredPriceOracle::price(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(asset);
    if (it == prices_.end()) {
        throw std::out_of_range("no price for asset " + asset);
    }
    return it->second;
}

} // namespace core
} // namespace capflow
