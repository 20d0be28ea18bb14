// SPDX-License-Identifier: MIT
#include "vanilla/support/error_types.hpp"

namespace vanilla {

const char* describe(PricingErrorCode code) noexcept {
    switch (code) {
        case PricingErrorCode::MissingUnderlying:
            return "Either spots or forwards must be supplied";
        case PricingErrorCode::ConflictingUnderlying:
            return "Spots and forwards may not both be supplied";
        case PricingErrorCode::ConflictingDiscounting:
            return "At most one of discount rates and discount factors may be supplied";
        case PricingErrorCode::ConflictingCarry:
            return "At most one of continuous dividends and cost of carries may be supplied";
        case PricingErrorCode::BatchSizeMismatch:
            return "All batch inputs must have the same length";
        case PricingErrorCode::OptionTypeCountMismatch:
            return "Per-element option types must match the batch length";
        case PricingErrorCode::UnknownGreek:
            return "Greek must be one of delta, gamma, theta, vega, rho";
        case PricingErrorCode::UnknownOptionType:
            return "Option type must be call/put or a boolean";
        case PricingErrorCode::InvalidStrike:
            return "Strike must be positive and finite";
        case PricingErrorCode::InvalidSpot:
            return "Spot must be positive and finite";
        case PricingErrorCode::InvalidForward:
            return "Forward must be positive and finite";
        case PricingErrorCode::InvalidVolatility:
            return "Volatility must be non-negative and finite";
        case PricingErrorCode::InvalidExpiry:
            return "Expiry must be positive and finite";
        case PricingErrorCode::NonFiniteInput:
            return "Rates, discount factors, dividends and carries must be finite";
        case PricingErrorCode::DegenerateVariance:
            return "Volatility * sqrt(expiry) must be positive and finite";
    }
    return "Unknown pricing error";
}

} // namespace vanilla
