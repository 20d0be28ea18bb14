// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>

namespace vanilla {

/// Broad error classes surfaced to callers
enum class ErrorKind {
    InvalidInput,         ///< Malformed or conflicting inputs, unknown selectors
    NumericalDegeneracy   ///< Zero or non-finite volatility * sqrt(expiry)
};

/// Error codes for batch validation and kernel failures
enum class PricingErrorCode {
    MissingUnderlying,        ///< Neither spots nor forwards supplied
    ConflictingUnderlying,    ///< Both spots and forwards supplied
    ConflictingDiscounting,   ///< Both discount rates and discount factors supplied
    ConflictingCarry,         ///< Both continuous dividends and cost of carries supplied
    BatchSizeMismatch,        ///< A supplied sequence differs in length from strikes
    OptionTypeCountMismatch,  ///< Per-element option types differ in length from the batch
    UnknownGreek,             ///< Greek selector is not one of the five supported
    UnknownOptionType,        ///< Option-type flag is not call/put or boolean-like
    InvalidStrike,
    InvalidSpot,
    InvalidForward,
    InvalidVolatility,
    InvalidExpiry,
    NonFiniteInput,
    DegenerateVariance        ///< volatility * sqrt(expiry) is zero or non-finite
};

/// Detailed pricing error passed through the expected failure path
struct PricingError {
    PricingErrorCode code;
    double value;  // The offending value (length for size mismatches, 0 if not applicable)
    size_t index;  // Element index, or field index for size mismatches

    PricingError(PricingErrorCode code,
                 double value = 0.0,
                 size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Classify an error code
constexpr ErrorKind error_kind(PricingErrorCode code) noexcept {
    return code == PricingErrorCode::DegenerateVariance
        ? ErrorKind::NumericalDegeneracy
        : ErrorKind::InvalidInput;
}

inline ErrorKind error_kind(const PricingError& error) noexcept {
    return error_kind(error.code);
}

/// Human-readable description of an error code
const char* describe(PricingErrorCode code) noexcept;

/// Output stream operator for PricingError
inline std::ostream& operator<<(std::ostream& os, const PricingError& err) {
    os << "PricingError{code=" << static_cast<int>(err.code)
       << " (" << describe(err.code) << ")"
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

} // namespace vanilla
