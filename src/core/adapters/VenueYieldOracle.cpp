#include "core/adapters/VenueYieldOracle.h"

namespace capflow {
namespace core {

VenueYieldOracle::VenueYieldOracle(std::shared_ptr<ledger::VenueRegistry> registry)
    : registry_(std::move(registry)) {}

Bps VenueYieldOracle::yieldBps(const Asset& asset, const VenueId& venue) {
    auto adapter = registry_->adapter(venue);
    if (!adapter) {
        throw VenueUnavailableError("no adapter for venue " + venue);
    }
    return adapter->queryYield(asset);
}

} // namespace core
} // namespace capflow
