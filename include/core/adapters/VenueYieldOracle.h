#pragma once

#include <memory>

#include "core/contracts/IYieldOracle.h"
#include "ledger/VenueRegistry.h"

namespace capflow {
namespace core {

// Yield read straight from each venue's adapter.
class VenueYieldOracle : public IYieldOracle {
public:
    explicit VenueYieldOracle(std::shared_ptr<ledger::VenueRegistry> registry);

    Bps yieldBps(const Asset& asset, const VenueId& venue) override;

private:
    std::shared_ptr<ledger::VenueRegistry> registry_;
};

} // namespace core
} // namespace capflow
