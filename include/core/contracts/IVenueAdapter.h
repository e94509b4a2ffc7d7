#pragma once

#include <stdexcept>
#include <string>

#include "common/Types.h"

namespace capflow {
namespace core {

// Thrown by adapters when the downstream venue cannot serve a call.
class VenueUnavailableError : public std::runtime_error {
public:
    explicit VenueUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

// Narrow surface of one yield venue (lending market, AMM, vault, staking).
// Calls are synchronous round-trips and must be safe to repeat for the same
// logical request. Failures are reported by throwing.
class IVenueAdapter {
public:
    virtual ~IVenueAdapter() = default;

    // Returns the amount actually accepted / released.
    virtual Amount deposit(const Asset& asset, Amount amount) = 0;
    virtual Amount withdraw(const Asset& asset, Amount amount) = 0;

    virtual Bps queryUtilization(const Asset& asset) = 0;
    virtual Bps queryYield(const Asset& asset) = 0;
    virtual Amount queryLiquidityDepth(const Asset& asset) = 0;
};

} // namespace core
} // namespace capflow
