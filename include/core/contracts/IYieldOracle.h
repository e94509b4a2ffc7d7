#pragma once

#include "common/Types.h"

namespace capflow {
namespace core {

// Best-effort current yield of an asset in a venue. Staleness is the caller's
// concern; implementations may throw when no value is available.
class IYieldOracle {
public:
    virtual ~IYieldOracle() = default;

    virtual Bps yieldBps(const Asset& asset, const VenueId& venue) = 0;
};

} // namespace core
} // namespace capflow
