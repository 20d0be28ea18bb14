// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>

namespace vanilla {

/// Density of d1, shared by gamma, vega and theta
inline double norm_pdf(double x) {
    constexpr double inv_sqrt_2pi = 0.3989422804014327;
    return inv_sqrt_2pi * std::exp(-0.5 * x * x);
}

/// Φ(d1), Φ(d2) and Φ(-d2) for the price, delta, theta and rho columns
inline double norm_cdf(double x) {
    // Deep out-of-the-money strikes push d2 far negative; erfc stays accurate there
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Black-Scholes d1 in forward form
/// d1 = [ln(F/K) + σ²τ/2] / (σ√τ), with sqrt_var = σ√τ
inline double bs_d1_forward(double forward, double strike, double sqrt_var) {
    return (std::log(forward / strike) + 0.5 * sqrt_var * sqrt_var) / sqrt_var;
}

}  // namespace vanilla
