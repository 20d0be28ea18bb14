// SPDX-License-Identifier: MIT
#include "vanilla/option/black_scholes_terms.hpp"
#include "vanilla/math/normal_distribution.hpp"
#include "vanilla/support/parallel.hpp"
#include "vanilla/support/vanilla_trace.h"
#include <cmath>

namespace vanilla {

namespace {

// Fills element i of every term vector. Reads only element i of the inputs.
struct TermsKernel {
    const double* K;
    const double* sigma;
    const double* T;
    const double* F;
    const double* b;

    double* sqrt_T;
    double* sqrt_var;
    double* d1;
    double* d2;
    double* cdf_d1;
    double* cdf_d2;
    double* cdf_minus_d2;
    double* pdf_d1;
    double* carry_decay;

    void operator()(size_t i) const {
        const double st = std::sqrt(T[i]);
        const double sv = sigma[i] * st;
        const double x1 = bs_d1_forward(F[i], K[i], sv);
        const double x2 = x1 - sv;

        sqrt_T[i] = st;
        sqrt_var[i] = sv;
        d1[i] = x1;
        d2[i] = x2;
        cdf_d1[i] = norm_cdf(x1);
        cdf_d2[i] = norm_cdf(x2);
        cdf_minus_d2[i] = norm_cdf(-x2);
        pdf_d1[i] = norm_pdf(x1);
        carry_decay[i] = std::exp(-b[i] * T[i]);
    }
};

}  // namespace

BlackScholesTerms compute_terms(const MarketParams& params, size_t parallel_threshold) {
    const size_t n = params.size();
    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_TERMS, n, 0);

    BlackScholesTerms terms;
    terms.sqrt_expiry.resize(n);
    terms.sqrt_var.resize(n);
    terms.d1.resize(n);
    terms.d2.resize(n);
    terms.cdf_d1.resize(n);
    terms.cdf_d2.resize(n);
    terms.cdf_minus_d2.resize(n);
    terms.pdf_d1.resize(n);
    terms.carry_decay.resize(n);

    const TermsKernel kernel{
        .K = params.strike.data(),
        .sigma = params.volatility.data(),
        .T = params.expiry.data(),
        .F = params.forward.data(),
        .b = params.cost_of_carry.data(),
        .sqrt_T = terms.sqrt_expiry.data(),
        .sqrt_var = terms.sqrt_var.data(),
        .d1 = terms.d1.data(),
        .d2 = terms.d2.data(),
        .cdf_d1 = terms.cdf_d1.data(),
        .cdf_d2 = terms.cdf_d2.data(),
        .cdf_minus_d2 = terms.cdf_minus_d2.data(),
        .pdf_d1 = terms.pdf_d1.data(),
        .carry_decay = terms.carry_decay.data(),
    };

    if (parallel_threshold != 0 && n >= parallel_threshold) {
        VANILLA_PRAGMA_PARALLEL_FOR_SIMD
        for (size_t i = 0; i < n; ++i) {
            kernel(i);
        }
    } else {
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            kernel(i);
        }
    }

    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_TERMS, n);
    return terms;
}

std::expected<void, PricingError> check_variance(const MarketParams& params) {
    if (auto sizes = check_param_sizes(params); !sizes) {
        return sizes;
    }
    for (size_t i = 0; i < params.size(); ++i) {
        const double sqrt_var = params.volatility[i] * std::sqrt(params.expiry[i]);
        if (!(sqrt_var > 0.0) || !std::isfinite(sqrt_var)) {
            VANILLA_TRACE_DEGENERATE_VARIANCE(VANILLA_MODULE_TERMS, i, sqrt_var);
            return std::unexpected(
                PricingError(PricingErrorCode::DegenerateVariance, sqrt_var, i));
        }
    }
    return {};
}

}  // namespace vanilla
