// SPDX-License-Identifier: MIT
/**
 * @file vanilla_pricer.hpp
 * @brief Closed-form Black-Scholes price and Greeks kernels over batches
 *
 * Formulas, with F forward, K strike, S spot, T expiry, σ volatility,
 * b cost of carry, D discount factor and sqrt_var = σ√T:
 *
 *   call  = D·[F·Φ(d1) - K·Φ(d2)]
 *   put   = call - D·(F - K)
 *   delta = Φ(d1)                       (put: Φ(d1) - 1)
 *   gamma = φ(d1) / (S·σ·√T)            (same for puts)
 *   vega  = S·√T·φ(d1)                  (same for puts)
 *   theta = S·σ·φ(d1)/√T - b·K·e^(-bT)·Φ(d2)
 *           (put: -S·σ·φ(d1)/√T + b·K·e^(-bT)·Φ(-d2))
 *   rho   = K·T·e^(-bT)·Φ(d2)           (put: -K·T·e^(-bT)·Φ(-d2))
 */

#pragma once

#include "vanilla/option/black_scholes_terms.hpp"
#include "vanilla/option/market_params.hpp"
#include "vanilla/option/option_types.hpp"
#include "vanilla/option/pricer_config.hpp"
#include "vanilla/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace vanilla {

/// Price and all five Greeks for a batch
struct GreekSheet {
    std::vector<double> price;
    std::vector<double> delta;
    std::vector<double> gamma;
    std::vector<double> theta;
    std::vector<double> vega;
    std::vector<double> rho;

    size_t size() const { return price.size(); }

    /// Column for one Greek
    const std::vector<double>& operator[](Greek greek) const;
};

/**
 * @brief Batch Black-Scholes evaluator for European vanilla options
 *
 * Stateless apart from its configuration; every method is const and may be
 * called concurrently. Inputs are validated before any kernel work, and a
 * failure rejects the whole batch.
 *
 * ```cpp
 * auto params = normalize(inputs);
 * VanillaPricer pricer;
 * pricer.set_degeneracy(DegeneracyPolicy::Reject);
 * auto puts = pricer.price(*params, OptionType::PUT);
 * auto vegas = pricer.greek(*params, Greek::Vega, OptionType::CALL);
 * ```
 */
class VanillaPricer {
public:
    VanillaPricer() = default;

    explicit VanillaPricer(const PricerConfig& config)
        : config_(config)
    {}

    VanillaPricer& set_degeneracy(DegeneracyPolicy policy) {
        config_.degeneracy = policy;
        return *this;
    }

    VanillaPricer& set_validate_domain(bool enable) {
        config_.validate_domain = enable;
        return *this;
    }

    VanillaPricer& set_parallel_threshold(size_t threshold) {
        config_.parallel_threshold = threshold;
        return *this;
    }

    const PricerConfig& config() const { return config_; }

    /// Discounted price, one option type for the whole batch
    std::expected<std::vector<double>, PricingError>
    price(const MarketParams& params, OptionType type) const;

    /// Discounted price, one option type per element
    std::expected<std::vector<double>, PricingError>
    price(const MarketParams& params, std::span<const OptionType> types) const;

    /// One Greek, one option type for the whole batch
    std::expected<std::vector<double>, PricingError>
    greek(const MarketParams& params, Greek greek, OptionType type) const;

    /// One Greek, one option type per element
    std::expected<std::vector<double>, PricingError>
    greek(const MarketParams& params, Greek greek, std::span<const OptionType> types) const;

    /// Price and all Greeks from a single evaluation of the shared terms
    std::expected<GreekSheet, PricingError>
    greeks(const MarketParams& params, OptionType type) const;

    /// Price and all Greeks, one option type per element
    std::expected<GreekSheet, PricingError>
    greeks(const MarketParams& params, std::span<const OptionType> types) const;

private:
    /// Member-length check, then the domain and degeneracy checks selected
    /// by the configuration
    std::expected<void, PricingError> precheck(const MarketParams& params) const;

    PricerConfig config_;
};

}  // namespace vanilla
