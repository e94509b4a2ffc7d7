#include "ledger/VenueRegistry.h"
#include "common/Logger.h"

namespace capflow {
namespace ledger {

OperationResult VenueRegistry::registerVenue(VenueDescriptor venue) {
    if (venue.id.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "venue id is empty");
    }
    if (venue.id == kUnallocatedVenue) {
        return OperationResult::failure(ErrorCode::VALIDATION, "venue id is reserved: " + venue.id);
    }
    if (!venue.adapter) {
        return OperationResult::failure(ErrorCode::VALIDATION, "venue has no adapter: " + venue.id);
    }
    if (venue.fixed_execution_cost < 0 || venue.execution_cost_bps < 0 || venue.max_capacity < 0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "venue cost/capacity must be non-negative: " + venue.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (venues_.count(venue.id) > 0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "venue already registered: " + venue.id);
    }
    LOG_INFO("Venue registered: id={}, kind={}, capacity={}", venue.id, venueKindToString(venue.kind), venue.max_capacity);
    const VenueId id = venue.id;
    venues_.emplace(id, std::move(venue));
    return OperationResult::success();
}

OperationResult VenueRegistry::setFrozen(const VenueId& id, bool frozen) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = venues_.find(id);
    if (it == venues_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "unknown venue: " + id);
    }
    if (it->second.frozen != frozen) {
        LOG_WARN("Venue {}: {}", id, frozen ? "frozen" : "unfrozen");
    }
    it->second.frozen = frozen;
    return OperationResult::success();
}

bool VenueRegistry::contains(const VenueId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return venues_.count(id) > 0;
}

bool VenueRegistry::isFrozen(const VenueId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = venues_.find(id);
    return it != venues_.end() && it->second.frozen;
}

std::optional<VenueDescriptor> VenueRegistry::get(const VenueId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = venues_.find(id);
    if (it == venues_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<core::IVenueAdapter> VenueRegistry::adapter(const VenueId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = venues_.find(id);
    return (it == venues_.end()) ? nullptr : it->second.adapter;
}

std::vector<VenueId> VenueRegistry::venueIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VenueId> ids;
    ids.reserve(venues_.size());
    for (const auto& entry : venues_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace ledger
} // namespace capflow
