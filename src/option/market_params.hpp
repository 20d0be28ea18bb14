// SPDX-License-Identifier: MIT
/**
 * @file market_params.hpp
 * @brief Canonical market parameters and the normalizer that produces them
 *
 * normalize() reconciles the alternative input forms of MarketInputs into
 * one complete, self-consistent set of per-option market variables:
 *
 *   discount_factor = exp(-discount_rate * expiry)
 *   cost_of_carry   = discount_rate - continuous_dividend
 *   forward         = spot * exp(cost_of_carry * expiry)
 *
 * whichever side of each relation was supplied.
 */

#pragma once

#include "vanilla/option/market_inputs.hpp"
#include "vanilla/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <vector>

namespace vanilla {

/**
 * @brief Canonical market variables for a batch (struct of arrays)
 *
 * Every member has the same length; element i describes option i.
 */
struct MarketParams {
    std::vector<double> strike;
    std::vector<double> volatility;
    std::vector<double> expiry;
    std::vector<double> spot;
    std::vector<double> forward;
    std::vector<double> discount_rate;
    std::vector<double> discount_factor;
    std::vector<double> continuous_dividend;
    std::vector<double> cost_of_carry;

    size_t size() const { return strike.size(); }
    bool empty() const { return strike.empty(); }
};

/// Member positions reported in PricingError::index by check_param_sizes()
enum class ParamField : size_t {
    Strike = 0,
    Volatility,
    Expiry,
    Spot,
    Forward,
    DiscountRate,
    DiscountFactor,
    ContinuousDividend,
    CostOfCarry
};

/// Check that every member has the length of `strike`
///
/// Parameters built by normalize() always pass. Hand-assembled ones may not,
/// and every kernel indexes all members up to size().
///
/// @return BatchSizeMismatch with the offending length as value and its
///         ParamField as index
std::expected<void, PricingError> check_param_sizes(const MarketParams& params);

/// Normalize raw inputs into canonical market parameters
///
/// Resolution order: discount rate (given, from factors, or zero), dividend
/// (given or zero), carry (given or rate - dividend), discount factor (given
/// or from rate), then whichever of spot/forward was not supplied. When the
/// carry is supplied directly the dividend is derived as rate - carry.
///
/// Zero volatility or zero expiry is not rejected here.
///
/// @return MarketParams, or BatchSizeMismatch when sequence lengths differ
std::expected<MarketParams, PricingError> normalize(const MarketInputs& inputs);

/// Resolve a keyword-style query, then normalize it
std::expected<MarketParams, PricingError> normalize(const VanillaQuery& query);

/**
 * @brief Validate canonical parameters element by element
 *
 * Checks for:
 * - Positive, finite strike, spot and forward
 * - Non-negative, finite volatility
 * - Positive, finite expiry
 * - Finite rates, discount factors, dividends and carries
 *
 * Member lengths are checked first (see check_param_sizes()).
 *
 * @param params Canonical parameters to validate
 * @return void on success; the first failing element's error otherwise
 */
std::expected<void, PricingError> validate_market_params(const MarketParams& params);

}  // namespace vanilla
