#pragma once

#include "common/Types.h"

namespace capflow {
namespace core {

// Risk score 0 (safest) .. 100 per venue and asset.
class IRiskOracle {
public:
    virtual ~IRiskOracle() = default;

    virtual int riskScore(const Asset& asset, const VenueId& venue) = 0;
};

} // namespace core
} // namespace capflow
