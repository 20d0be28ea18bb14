// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>

namespace vanilla {

/// What the kernels do when volatility * sqrt(expiry) is zero or non-finite
enum class DegeneracyPolicy {
    Propagate,  ///< Evaluate anyway; infinities and NaNs reach the caller
    Reject      ///< Fail the whole batch with DegenerateVariance
};

/// Kernel configuration
struct PricerConfig {
    /// Handling of zero total volatility (d1/d2 divide by it)
    DegeneracyPolicy degeneracy = DegeneracyPolicy::Propagate;

    /// Run validate_market_params() before evaluating
    bool validate_domain = false;

    /// Batches at least this large are split across OpenMP threads (0 = never)
    size_t parallel_threshold = 16384;
};

}  // namespace vanilla
