#pragma once

#include <string>
#include <utility>

namespace capflow {

enum class ErrorCode {
    NONE,
    VALIDATION,
    INSUFFICIENT_LIQUIDITY,
    INVARIANT_VIOLATION,
    STALE_OPPORTUNITY,
    EXPIRED,
    VENUE_UNAVAILABLE,
    RATE_LIMITED,
    ASSET_LOCKED,
    UNAUTHORIZED,
    PAUSED
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::VALIDATION: return "VALIDATION";
        case ErrorCode::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case ErrorCode::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case ErrorCode::STALE_OPPORTUNITY: return "STALE_OPPORTUNITY";
        case ErrorCode::EXPIRED: return "EXPIRED";
        case ErrorCode::VENUE_UNAVAILABLE: return "VENUE_UNAVAILABLE";
        case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorCode::ASSET_LOCKED: return "ASSET_LOCKED";
        case ErrorCode::UNAUTHORIZED: return "UNAUTHORIZED";
        case ErrorCode::PAUSED: return "PAUSED";
    }
    return "NONE";
}

// Outcome of every public operation. Nothing is thrown across the API;
// adapter exceptions are converted at the call site.
struct OperationResult {
    ErrorCode code = ErrorCode::NONE;
    std::string reason;

    bool ok() const { return code == ErrorCode::NONE; }

    static OperationResult success() { return {}; }
    static OperationResult failure(ErrorCode code, std::string reason) {
        return OperationResult{code, std::move(reason)};
    }
};

} // namespace capflow
