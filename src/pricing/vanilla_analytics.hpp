// SPDX-License-Identifier: MIT
/**
 * @file vanilla_analytics.hpp
 * @brief One-call batch pricing and Greeks for European vanilla options
 *
 * Each entry point resolves the keyword-style query, normalizes it and runs
 * the requested kernel. Validation happens before any numeric work; an
 * error rejects the whole batch.
 *
 * ```cpp
 * VanillaQuery query{
 *     .strikes = {90.0, 100.0, 110.0},
 *     .volatilities = {0.2, 0.2, 0.2},
 *     .expiries = {1.0, 1.0, 1.0},
 *     .spots = std::vector<double>{100.0, 100.0, 100.0},
 *     .discount_rates = std::vector<double>{0.03, 0.03, 0.03},
 * };
 * auto calls = vanilla_prices(query, OptionType::CALL);
 * auto deltas = vanilla_greeks(query, "delta", "put");
 * ```
 */

#pragma once

#include "vanilla/option/market_inputs.hpp"
#include "vanilla/option/option_types.hpp"
#include "vanilla/option/pricer_config.hpp"
#include "vanilla/option/vanilla_pricer.hpp"
#include "vanilla/support/error_types.hpp"
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace vanilla {

/// Black-Scholes prices for a batch of calls or puts
std::expected<std::vector<double>, PricingError>
vanilla_prices(const VanillaQuery& query, OptionType type, const PricerConfig& config = {});

/// Black-Scholes prices with one option type per element
std::expected<std::vector<double>, PricingError>
vanilla_prices(const VanillaQuery& query, std::span<const OptionType> types,
               const PricerConfig& config = {});

/// Black-Scholes prices with a text option-type flag ("call", "put", "true", ...)
std::expected<std::vector<double>, PricingError>
vanilla_prices(const VanillaQuery& query, std::string_view option_type,
               const PricerConfig& config = {});

/// One Greek for a batch of calls or puts
std::expected<std::vector<double>, PricingError>
vanilla_greeks(const VanillaQuery& query, Greek greek, OptionType type,
               const PricerConfig& config = {});

/// One Greek with one option type per element
std::expected<std::vector<double>, PricingError>
vanilla_greeks(const VanillaQuery& query, Greek greek, std::span<const OptionType> types,
               const PricerConfig& config = {});

/// One Greek selected by name, with a text option-type flag
///
/// Both selectors are parsed before the query is touched, so an unknown
/// Greek or flag fails with InvalidInput even when the query is malformed.
std::expected<std::vector<double>, PricingError>
vanilla_greeks(const VanillaQuery& query, std::string_view greek, std::string_view option_type,
               const PricerConfig& config = {});

/// Price and all five Greeks for a batch
std::expected<GreekSheet, PricingError>
vanilla_greek_sheet(const VanillaQuery& query, OptionType type, const PricerConfig& config = {});

}  // namespace vanilla
