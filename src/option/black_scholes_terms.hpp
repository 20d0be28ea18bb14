// SPDX-License-Identifier: MIT
/**
 * @file black_scholes_terms.hpp
 * @brief Per-batch Black-Scholes intermediates shared by price and Greeks
 *
 * Every kernel formula is a cheap combination of a handful of
 * transcendental terms. Computing them once per batch lets the pricing
 * kernel and all five Greeks reuse the same d1, d2, CDF and PDF values.
 */

#pragma once

#include "vanilla/option/market_params.hpp"
#include "vanilla/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <vector>

namespace vanilla {

/**
 * @brief Black-Scholes intermediates for a batch (struct of arrays)
 *
 *   sqrt_var    = σ√T
 *   d1          = [ln(F/K) + sqrt_var²/2] / sqrt_var
 *   d2          = d1 - sqrt_var
 *   carry_decay = exp(-b·T)
 */
struct BlackScholesTerms {
    std::vector<double> sqrt_expiry;
    std::vector<double> sqrt_var;
    std::vector<double> d1;
    std::vector<double> d2;
    std::vector<double> cdf_d1;        ///< Φ(d1)
    std::vector<double> cdf_d2;        ///< Φ(d2)
    std::vector<double> cdf_minus_d2;  ///< Φ(-d2), evaluated directly for tail accuracy
    std::vector<double> pdf_d1;        ///< φ(d1)
    std::vector<double> carry_decay;

    size_t size() const { return d1.size(); }
};

/// Evaluate the shared terms for every element
///
/// @param params Canonical parameters; every member must have size() elements
///               (check_param_sizes())
/// @param parallel_threshold Batches at least this large run multi-threaded (0 = never)
BlackScholesTerms compute_terms(const MarketParams& params, size_t parallel_threshold = 0);

/// Check that σ√T is positive and finite for every element
///
/// @return BatchSizeMismatch for ragged parameters; otherwise DegenerateVariance
///         carrying the first failing index and its σ√T
std::expected<void, PricingError> check_variance(const MarketParams& params);

}  // namespace vanilla
