// SPDX-License-Identifier: MIT
/**
 * @file market_inputs.hpp
 * @brief Batch market inputs with mutually-exclusive alternatives as tagged variants
 *
 * Each alternative group (spot or forward, rate or factor, dividend or
 * carry) is a std::variant, so a MarketInputs value can only ever name one
 * driving input per group. VanillaQuery is the keyword-style form where
 * every alternative is optional; resolve_inputs() enforces the exclusivity
 * rules when converting it.
 */

#pragma once

#include "vanilla/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <variant>
#include <vector>

namespace vanilla {

/// Current underlying prices, one per option
struct SpotPrices { std::vector<double> values; };

/// Forward prices for delivery at expiry, one per option
struct ForwardPrices { std::vector<double> values; };

/// Continuously-compounded risk-free rates
struct DiscountRates { std::vector<double> values; };

/// Discount factors to expiry
struct DiscountFactors { std::vector<double> values; };

/// Continuous dividend yields
struct ContinuousDividends { std::vector<double> values; };

/// Cost of carry (rate minus dividend yield), supplied directly
struct CostOfCarry { std::vector<double> values; };

using UnderlyingInput = std::variant<SpotPrices, ForwardPrices>;

/// std::monostate means zero rates
using DiscountInput = std::variant<std::monostate, DiscountRates, DiscountFactors>;

/// std::monostate means zero dividends
using CarryInput = std::variant<std::monostate, ContinuousDividends, CostOfCarry>;

/**
 * @brief Raw market inputs for a batch of European vanilla options
 *
 * Element i of every sequence describes option i. All sequences must have
 * the length of `strikes` (see check_batch_sizes()).
 */
struct MarketInputs {
    std::vector<double> strikes;       ///< Strike prices (K)
    std::vector<double> volatilities;  ///< Annualized volatilities (σ)
    std::vector<double> expiries;      ///< Times to expiry in years (T)
    UnderlyingInput underlying;        ///< Spots or forwards
    DiscountInput discounting{};       ///< Rates, factors, or zero rates
    CarryInput carry{};                ///< Dividends, carries, or zero dividends

    size_t size() const { return strikes.size(); }
};

/**
 * @brief Keyword-style batch query
 *
 * Mirrors a call site with named optional arguments: exactly one of
 * spots/forwards, at most one of discount_rates/discount_factors and at
 * most one of continuous_dividends/cost_of_carries.
 */
struct VanillaQuery {
    std::vector<double> strikes;
    std::vector<double> volatilities;
    std::vector<double> expiries;
    std::optional<std::vector<double>> spots;
    std::optional<std::vector<double>> forwards;
    std::optional<std::vector<double>> discount_rates;
    std::optional<std::vector<double>> discount_factors;
    std::optional<std::vector<double>> continuous_dividends;
    std::optional<std::vector<double>> cost_of_carries;
};

/// Field positions reported in PricingError::index for BatchSizeMismatch
enum class InputField : size_t {
    Strikes = 0,
    Volatilities,
    Expiries,
    Underlying,
    Discounting,
    Carry
};

/// Convert a keyword-style query, enforcing the exclusivity rules
///
/// @return MarketInputs on success; MissingUnderlying, ConflictingUnderlying,
///         ConflictingDiscounting or ConflictingCarry otherwise
std::expected<MarketInputs, PricingError> resolve_inputs(const VanillaQuery& query);

/// Rvalue overload: moves the sequences instead of copying them
std::expected<MarketInputs, PricingError> resolve_inputs(VanillaQuery&& query);

/// Check that every supplied sequence has the length of `strikes`
///
/// On mismatch the error value is the offending length and the index is
/// the InputField of the offending sequence.
std::expected<void, PricingError> check_batch_sizes(const MarketInputs& inputs);

}  // namespace vanilla
