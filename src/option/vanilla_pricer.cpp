// SPDX-License-Identifier: MIT
#include "vanilla/option/vanilla_pricer.hpp"
#include "vanilla/support/parallel.hpp"
#include "vanilla/support/vanilla_trace.h"

namespace vanilla {

namespace {

// ===========================================================================
// Per-element formulas
// ===========================================================================

// Read-only view over canonical parameters and shared terms for one batch
struct KernelView {
    const MarketParams& p;
    const BlackScholesTerms& t;

    double price(size_t i, OptionType type) const {
        const double undiscounted_call = p.forward[i] * t.cdf_d1[i] - p.strike[i] * t.cdf_d2[i];
        if (type == OptionType::CALL) {
            return p.discount_factor[i] * undiscounted_call;
        }
        // Put-call parity on the undiscounted values
        return p.discount_factor[i] * (undiscounted_call - (p.forward[i] - p.strike[i]));
    }

    double delta(size_t i, OptionType type) const {
        return type == OptionType::CALL ? t.cdf_d1[i] : t.cdf_d1[i] - 1.0;
    }

    double gamma(size_t i) const {
        return t.pdf_d1[i] / (p.spot[i] * t.sqrt_var[i]);
    }

    double vega(size_t i) const {
        return p.spot[i] * t.sqrt_expiry[i] * t.pdf_d1[i];
    }

    double theta(size_t i, OptionType type) const {
        const double decay = p.spot[i] * p.volatility[i] * t.pdf_d1[i] / t.sqrt_expiry[i];
        const double carry = p.cost_of_carry[i] * p.strike[i] * t.carry_decay[i];
        if (type == OptionType::CALL) {
            return decay - carry * t.cdf_d2[i];
        }
        return -decay + carry * t.cdf_minus_d2[i];
    }

    double rho(size_t i, OptionType type) const {
        const double scale = p.strike[i] * p.expiry[i] * t.carry_decay[i];
        if (type == OptionType::CALL) {
            return scale * t.cdf_d2[i];
        }
        return -scale * t.cdf_minus_d2[i];
    }
};

struct UniformType {
    OptionType type;
    OptionType operator()(size_t) const { return type; }
};

struct PerElementType {
    const OptionType* types;
    OptionType operator()(size_t i) const { return types[i]; }
};

// ===========================================================================
// Batch evaluation
// ===========================================================================

template <typename TypeAt>
std::vector<double> evaluate_price(const KernelView& view, TypeAt type_at, size_t threshold) {
    std::vector<double> out(view.p.size());
    for_each_element(out.data(), out.size(), threshold,
        [&](size_t i) { return view.price(i, type_at(i)); });
    return out;
}

template <typename TypeAt>
std::vector<double> evaluate_greek(const KernelView& view, Greek greek, TypeAt type_at,
                                   size_t threshold) {
    std::vector<double> out(view.p.size());
    double* dst = out.data();
    const size_t n = out.size();

    // Dispatch once per batch so each loop body stays branch-light
    switch (greek) {
        case Greek::Delta:
            for_each_element(dst, n, threshold,
                [&](size_t i) { return view.delta(i, type_at(i)); });
            break;
        case Greek::Gamma:
            for_each_element(dst, n, threshold,
                [&](size_t i) { return view.gamma(i); });
            break;
        case Greek::Theta:
            for_each_element(dst, n, threshold,
                [&](size_t i) { return view.theta(i, type_at(i)); });
            break;
        case Greek::Vega:
            for_each_element(dst, n, threshold,
                [&](size_t i) { return view.vega(i); });
            break;
        case Greek::Rho:
            for_each_element(dst, n, threshold,
                [&](size_t i) { return view.rho(i, type_at(i)); });
            break;
    }
    return out;
}

template <typename TypeAt>
GreekSheet evaluate_sheet(const KernelView& view, TypeAt type_at, size_t threshold) {
    GreekSheet sheet;
    sheet.price = evaluate_price(view, type_at, threshold);
    sheet.delta = evaluate_greek(view, Greek::Delta, type_at, threshold);
    sheet.gamma = evaluate_greek(view, Greek::Gamma, type_at, threshold);
    sheet.theta = evaluate_greek(view, Greek::Theta, type_at, threshold);
    sheet.vega = evaluate_greek(view, Greek::Vega, type_at, threshold);
    sheet.rho = evaluate_greek(view, Greek::Rho, type_at, threshold);
    return sheet;
}

std::expected<void, PricingError> check_type_count(const MarketParams& params,
                                                   std::span<const OptionType> types) {
    if (types.size() != params.size()) {
        VANILLA_TRACE_VALIDATION_ERROR(VANILLA_MODULE_PRICING,
            static_cast<int>(PricingErrorCode::OptionTypeCountMismatch),
            static_cast<double>(types.size()), params.size());
        return std::unexpected(PricingError(PricingErrorCode::OptionTypeCountMismatch,
                                            static_cast<double>(types.size()),
                                            params.size()));
    }
    return {};
}

}  // namespace

// ===========================================================================
// GreekSheet
// ===========================================================================

const std::vector<double>& GreekSheet::operator[](Greek greek) const {
    switch (greek) {
        case Greek::Delta: return delta;
        case Greek::Gamma: return gamma;
        case Greek::Theta: return theta;
        case Greek::Vega:  return vega;
        case Greek::Rho:   return rho;
    }
    return price;  // unreachable for valid enumerators
}

// ===========================================================================
// VanillaPricer
// ===========================================================================

std::expected<void, PricingError> VanillaPricer::precheck(const MarketParams& params) const {
    // Kernels read every member up to size(); ragged input is always rejected
    if (auto sizes = check_param_sizes(params); !sizes) {
        return sizes;
    }
    if (config_.validate_domain) {
        if (auto valid = validate_market_params(params); !valid) {
            return valid;
        }
    }
    if (config_.degeneracy == DegeneracyPolicy::Reject) {
        return check_variance(params);
    }
    return {};
}

std::expected<std::vector<double>, PricingError>
VanillaPricer::price(const MarketParams& params, OptionType type) const {
    if (auto ok = precheck(params); !ok) {
        return std::unexpected(ok.error());
    }

    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_PRICING, params.size(), static_cast<int>(type));
    const auto terms = compute_terms(params, config_.parallel_threshold);
    auto prices = evaluate_price(KernelView{params, terms}, UniformType{type},
                                 config_.parallel_threshold);
    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_PRICING, prices.size());
    return prices;
}

std::expected<std::vector<double>, PricingError>
VanillaPricer::price(const MarketParams& params, std::span<const OptionType> types) const {
    if (auto ok = check_type_count(params, types); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = precheck(params); !ok) {
        return std::unexpected(ok.error());
    }

    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_PRICING, params.size(), -1);
    const auto terms = compute_terms(params, config_.parallel_threshold);
    auto prices = evaluate_price(KernelView{params, terms}, PerElementType{types.data()},
                                 config_.parallel_threshold);
    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_PRICING, prices.size());
    return prices;
}

std::expected<std::vector<double>, PricingError>
VanillaPricer::greek(const MarketParams& params, Greek greek, OptionType type) const {
    if (auto ok = precheck(params); !ok) {
        return std::unexpected(ok.error());
    }

    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_GREEKS, params.size(), static_cast<int>(greek));
    const auto terms = compute_terms(params, config_.parallel_threshold);
    auto values = evaluate_greek(KernelView{params, terms}, greek, UniformType{type},
                                 config_.parallel_threshold);
    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_GREEKS, values.size());
    return values;
}

std::expected<std::vector<double>, PricingError>
VanillaPricer::greek(const MarketParams& params, Greek greek,
                     std::span<const OptionType> types) const {
    if (auto ok = check_type_count(params, types); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = precheck(params); !ok) {
        return std::unexpected(ok.error());
    }

    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_GREEKS, params.size(), static_cast<int>(greek));
    const auto terms = compute_terms(params, config_.parallel_threshold);
    auto values = evaluate_greek(KernelView{params, terms}, greek,
                                 PerElementType{types.data()}, config_.parallel_threshold);
    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_GREEKS, values.size());
    return values;
}

std::expected<GreekSheet, PricingError>
VanillaPricer::greeks(const MarketParams& params, OptionType type) const {
    if (auto ok = precheck(params); !ok) {
        return std::unexpected(ok.error());
    }

    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_GREEKS, params.size(), -1);
    const auto terms = compute_terms(params, config_.parallel_threshold);
    auto sheet = evaluate_sheet(KernelView{params, terms}, UniformType{type},
                                config_.parallel_threshold);
    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_GREEKS, sheet.size());
    return sheet;
}

std::expected<GreekSheet, PricingError>
VanillaPricer::greeks(const MarketParams& params, std::span<const OptionType> types) const {
    if (auto ok = check_type_count(params, types); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = precheck(params); !ok) {
        return std::unexpected(ok.error());
    }

    VANILLA_TRACE_BATCH_START(VANILLA_MODULE_GREEKS, params.size(), -1);
    const auto terms = compute_terms(params, config_.parallel_threshold);
    auto sheet = evaluate_sheet(KernelView{params, terms}, PerElementType{types.data()},
                                config_.parallel_threshold);
    VANILLA_TRACE_BATCH_COMPLETE(VANILLA_MODULE_GREEKS, sheet.size());
    return sheet;
}

}  // namespace vanilla
