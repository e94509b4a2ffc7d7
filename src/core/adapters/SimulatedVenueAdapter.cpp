#include "core/adapters/SimulatedVenueAdapter.h"

#include <algorithm>

namespace capflow {
namespace core {

SimulatedVenueAdapter::SimulatedVenueAdapter(std::string venue_id, Bps yield_bps, Bps utilization_bps,
                                             Amount liquidity_depth)
    : venue_id_(std::move(venue_id))
    , default_yield_bps_(yield_bps)
    , default_utilization_bps_(utilization_bps)
    , default_liquidity_depth_(liquidity_depth) {}

void SimulatedVenueAdapter::throwIfUnavailable(const char* call) const {
    if (unavailable_) {
        throw VenueUnavailableError(venue_id_ + ": " + call + " unavailable");
    }
}

Amount SimulatedVenueAdapter::deposit(const Asset& asset, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnavailable("deposit");
    Amount accepted = std::max<Amount>(0, amount);
    if (deposit_cap_) {
        accepted = std::min(accepted, *deposit_cap_);
    }
    books_[asset].held += accepted;
    return accepted;
}

Amount SimulatedVenueAdapter::withdraw(const Asset& asset, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnavailable("withdraw");
    auto& book = books_[asset];
    Amount released = std::clamp<Amount>(amount, 0, book.held);
    if (withdraw_cap_) {
        released = std::min(released, *withdraw_cap_);
    }
    book.held -= released;
    return released;
}

Bps SimulatedVenueAdapter::queryUtilization(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnavailable("queryUtilization");
    auto it = books_.find(asset);
    return (it != books_.end() && it->second.utilization_bps) ? *it->second.utilization_bps : default_utilization_bps_;
}

Bps SimulatedVenueAdapter::queryYield(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnavailable("queryYield");
    auto it = books_.find(asset);
    return (it != books_.end() && it->second.yield_bps) ? *it->second.yield_bps : default_yield_bps_;
}

Amount SimulatedVenueAdapter::queryLiquidityDepth(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnavailable("queryLiquidityDepth");
    auto it = books_.find(asset);
    return (it != books_.end() && it->second.liquidity_depth) ? *it->second.liquidity_depth : default_liquidity_depth_;
}

void SimulatedVenueAdapter::setYield(const Asset& asset, Bps yield_bps) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_[asset].yield_bps = yield_bps;
}

void SimulatedVenueAdapter::setUtilization(const Asset& asset, Bps utilization_bps) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_[asset].utilization_bps = utilization_bps;
}

void SimulatedVenueAdapter::setLiquidityDepth(const Asset& asset, Amount depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_[asset].liquidity_depth = depth;
}

void SimulatedVenueAdapter::setUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

void SimulatedVenueAdapter::setWithdrawCap(std::optional<Amount> cap) {
    std::lock_guard<std::mutex> lock(mutex_);
    withdraw_cap_ = cap;
}

void SimulatedVenueAdapter::setDepositCap(std::optional<Amount> cap) {
    std::lock_guard<std::mutex> lock(mutex_);
    deposit_cap_ = cap;
}

Amount SimulatedVenueAdapter::held(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(asset);
    return (it == books_.end()) ? 0 : it->second.held;
}

} // namespace core
} // namespace capflow
