// SPDX-License-Identifier: MIT
#include "vanilla/option/market_params.hpp"
#include "vanilla/support/parallel.hpp"
#include "vanilla/support/vanilla_trace.h"
#include <cmath>
#include <initializer_list>
#include <utility>
#include <variant>

namespace vanilla {

std::expected<MarketParams, PricingError> normalize(const MarketInputs& inputs) {
    if (auto sizes = check_batch_sizes(inputs); !sizes) {
        return std::unexpected(sizes.error());
    }

    const size_t n = inputs.size();
    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_NORMALIZER, n, 0);

    MarketParams p;
    p.strike = inputs.strikes;
    p.volatility = inputs.volatilities;
    p.expiry = inputs.expiries;
    const double* T = p.expiry.data();

    // 1. Discount rate
    if (const auto* rates = std::get_if<DiscountRates>(&inputs.discounting)) {
        p.discount_rate = rates->values;
    } else if (const auto* factors = std::get_if<DiscountFactors>(&inputs.discounting)) {
        p.discount_rate.resize(n);
        const double* df = factors->values.data();
        double* r = p.discount_rate.data();
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            r[i] = -std::log(df[i]) / T[i];
        }
    } else {
        p.discount_rate.assign(n, 0.0);
    }
    const double* r = p.discount_rate.data();

    // 2-3. Dividend and cost of carry
    if (const auto* carries = std::get_if<CostOfCarry>(&inputs.carry)) {
        p.cost_of_carry = carries->values;
        p.continuous_dividend.resize(n);
        const double* b = p.cost_of_carry.data();
        double* q = p.continuous_dividend.data();
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            q[i] = r[i] - b[i];
        }
    } else {
        if (const auto* dividends = std::get_if<ContinuousDividends>(&inputs.carry)) {
            p.continuous_dividend = dividends->values;
        } else {
            p.continuous_dividend.assign(n, 0.0);
        }
        p.cost_of_carry.resize(n);
        const double* q = p.continuous_dividend.data();
        double* b = p.cost_of_carry.data();
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            b[i] = r[i] - q[i];
        }
    }
    const double* b = p.cost_of_carry.data();

    // 4. Discount factor
    if (const auto* factors = std::get_if<DiscountFactors>(&inputs.discounting)) {
        p.discount_factor = factors->values;
    } else {
        p.discount_factor.resize(n);
        double* df = p.discount_factor.data();
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            df[i] = std::exp(-r[i] * T[i]);
        }
    }

    // 5. Spot / forward
    if (const auto* forwards = std::get_if<ForwardPrices>(&inputs.underlying)) {
        p.forward = forwards->values;
        p.spot.resize(n);
        const double* F = p.forward.data();
        double* S = p.spot.data();
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            S[i] = F[i] * std::exp(-b[i] * T[i]);
        }
    } else {
        p.spot = std::get<SpotPrices>(inputs.underlying).values;
        p.forward.resize(n);
        const double* S = p.spot.data();
        double* F = p.forward.data();
        VANILLA_PRAGMA_SIMD
        for (size_t i = 0; i < n; ++i) {
            F[i] = S[i] * std::exp(b[i] * T[i]);
        }
    }

    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_NORMALIZER, n);
    return p;
}

std::expected<MarketParams, PricingError> normalize(const VanillaQuery& query) {
    auto inputs = resolve_inputs(query);
    if (!inputs) {
        return std::unexpected(inputs.error());
    }
    return normalize(*inputs);
}

std::expected<void, PricingError> check_param_sizes(const MarketParams& params) {
    const size_t n = params.size();
    constexpr size_t field_count = static_cast<size_t>(ParamField::CostOfCarry) + 1;
    const std::vector<double>* members[field_count] = {
        &params.strike, &params.volatility, &params.expiry,
        &params.spot, &params.forward, &params.discount_rate,
        &params.discount_factor, &params.continuous_dividend, &params.cost_of_carry,
    };

    for (size_t field = 0; field < field_count; ++field) {
        const size_t len = members[field]->size();
        if (len != n) {
            VANILLA_TRACE_VALIDATION_ERROR(VANILLA_MODULE_NORMALIZER,
                static_cast<int>(PricingErrorCode::BatchSizeMismatch),
                static_cast<double>(len), field);
            return std::unexpected(PricingError(PricingErrorCode::BatchSizeMismatch,
                                                static_cast<double>(len), field));
        }
    }
    return {};
}

std::expected<void, PricingError> validate_market_params(const MarketParams& params) {
    if (auto sizes = check_param_sizes(params); !sizes) {
        return sizes;
    }

    auto reject = [](PricingErrorCode code, double value, size_t index) {
        VANILLA_TRACE_VALIDATION_ERROR(VANILLA_MODULE_NORMALIZER,
                                       static_cast<int>(code), value, index);
        return std::unexpected(PricingError(code, value, index));
    };

    for (size_t i = 0; i < params.size(); ++i) {
        const double K = params.strike[i];
        if (K <= 0.0 || !std::isfinite(K)) {
            return reject(PricingErrorCode::InvalidStrike, K, i);
        }
        const double S = params.spot[i];
        if (S <= 0.0 || !std::isfinite(S)) {
            return reject(PricingErrorCode::InvalidSpot, S, i);
        }
        const double F = params.forward[i];
        if (F <= 0.0 || !std::isfinite(F)) {
            return reject(PricingErrorCode::InvalidForward, F, i);
        }
        const double sigma = params.volatility[i];
        if (sigma < 0.0 || !std::isfinite(sigma)) {
            return reject(PricingErrorCode::InvalidVolatility, sigma, i);
        }
        const double T = params.expiry[i];
        if (T <= 0.0 || !std::isfinite(T)) {
            return reject(PricingErrorCode::InvalidExpiry, T, i);
        }
        for (double v : {params.discount_rate[i], params.discount_factor[i],
                         params.continuous_dividend[i], params.cost_of_carry[i]}) {
            if (!std::isfinite(v)) {
                return reject(PricingErrorCode::NonFiniteInput, v, i);
            }
        }
    }
    return {};
}

}  // namespace vanilla
