#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace capflow {

using Timestamp = std::chrono::system_clock::time_point;
using Asset = std::string;
using VenueId = std::string;
using Amount = std::int64_t;   // integral asset units
using Bps = int;               // basis points, 10000 = 100%

constexpr Bps kBpsDenominator = 10000;

// Engine-held bucket for capital that is not placed in any venue.
inline const VenueId kUnallocatedVenue = "unallocated";

enum class VenueKind { LENDING, TRADING, VAULT_STRATEGY, STAKING };

inline const char* venueKindToString(VenueKind kind) {
    switch (kind) {
        case VenueKind::LENDING: return "LENDING";
        case VenueKind::TRADING: return "TRADING";
        case VenueKind::VAULT_STRATEGY: return "VAULT_STRATEGY";
        case VenueKind::STAKING: return "STAKING";
    }
    return "LENDING";
}

inline VenueKind venueKindFromString(const std::string& value) {
    if (value == "TRADING" || value == "trading" || value == "amm") return VenueKind::TRADING;
    if (value == "VAULT_STRATEGY" || value == "vault" || value == "vault_strategy") return VenueKind::VAULT_STRATEGY;
    if (value == "STAKING" || value == "staking") return VenueKind::STAKING;
    return VenueKind::LENDING;
}

struct VenueWeight {
    VenueId venue;
    Bps weight_bps = 0;
};

// amount * bps / 10000, floored. Intermediate widened to avoid overflow.
inline Amount applyBps(Amount amount, Bps bps) {
    const __int128 wide = static_cast<__int128>(amount) * bps;
    return static_cast<Amount>(wide / kBpsDenominator);
}

} // namespace capflow
