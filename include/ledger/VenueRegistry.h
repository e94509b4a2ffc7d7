#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common/Errors.h"
#include "common/Types.h"
#include "core/contracts/IVenueAdapter.h"

namespace capflow {
namespace ledger {

struct VenueDescriptor {
    VenueId id;
    VenueKind kind = VenueKind::LENDING;
    std::shared_ptr<core::IVenueAdapter> adapter;
    Amount fixed_execution_cost = 0;
    Bps execution_cost_bps = 0;
    Amount max_capacity = 0;    // 0 = unbounded
    bool frozen = false;        // emergency state: no new capital, not reallocatable
};

// Venues known to the engine. Asset-agnostic: per-asset metrics come from the adapter.
class VenueRegistry {
public:
    OperationResult registerVenue(VenueDescriptor venue);
    OperationResult setFrozen(const VenueId& id, bool frozen);

    bool contains(const VenueId& id) const;
    bool isFrozen(const VenueId& id) const;
    std::optional<VenueDescriptor> get(const VenueId& id) const;
    std::shared_ptr<core::IVenueAdapter> adapter(const VenueId& id) const;

    // Sorted ascending by id.
    std::vector<VenueId> venueIds() const;

private:
    mutable std::mutex mutex_;
    std::map<VenueId, VenueDescriptor> venues_;
};

} // namespace ledger
} // namespace capflow
