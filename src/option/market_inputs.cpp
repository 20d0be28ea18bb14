// SPDX-License-Identifier: MIT
#include "vanilla/option/market_inputs.hpp"
#include "vanilla/support/vanilla_trace.h"
#include <utility>

namespace vanilla {

namespace {

PricingError reject(PricingErrorCode code, double value = 0.0, size_t index = 0) {
    VANILLA_TRACE_VALIDATION_ERROR(VANILLA_MODULE_INPUTS, static_cast<int>(code), value, index);
    return PricingError(code, value, index);
}

// Shared by both resolve_inputs() overloads; Query is const& or && VanillaQuery
template <typename Query>
std::expected<MarketInputs, PricingError> resolve_impl(Query&& query) {
    if (query.spots.has_value() == query.forwards.has_value()) {
        return std::unexpected(reject(query.spots.has_value()
            ? PricingErrorCode::ConflictingUnderlying
            : PricingErrorCode::MissingUnderlying));
    }
    if (query.discount_rates.has_value() && query.discount_factors.has_value()) {
        return std::unexpected(reject(PricingErrorCode::ConflictingDiscounting));
    }
    if (query.continuous_dividends.has_value() && query.cost_of_carries.has_value()) {
        return std::unexpected(reject(PricingErrorCode::ConflictingCarry));
    }

    MarketInputs inputs{
        .strikes = std::forward<Query>(query).strikes,
        .volatilities = std::forward<Query>(query).volatilities,
        .expiries = std::forward<Query>(query).expiries,
        .underlying = SpotPrices{},
    };

    if (query.forwards) {
        inputs.underlying = ForwardPrices{*std::forward<Query>(query).forwards};
    } else {
        inputs.underlying = SpotPrices{*std::forward<Query>(query).spots};
    }

    if (query.discount_rates) {
        inputs.discounting = DiscountRates{*std::forward<Query>(query).discount_rates};
    } else if (query.discount_factors) {
        inputs.discounting = DiscountFactors{*std::forward<Query>(query).discount_factors};
    }

    if (query.continuous_dividends) {
        inputs.carry = ContinuousDividends{*std::forward<Query>(query).continuous_dividends};
    } else if (query.cost_of_carries) {
        inputs.carry = CostOfCarry{*std::forward<Query>(query).cost_of_carries};
    }

    return inputs;
}

template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::expected<MarketInputs, PricingError> resolve_inputs(const VanillaQuery& query) {
    return resolve_impl(query);
}

std::expected<MarketInputs, PricingError> resolve_inputs(VanillaQuery&& query) {
    return resolve_impl(std::move(query));
}

std::expected<void, PricingError> check_batch_sizes(const MarketInputs& inputs) {
    const size_t n = inputs.size();

    auto check = [n](const std::vector<double>& values, InputField field)
        -> std::expected<void, PricingError> {
        if (values.size() != n) {
            return std::unexpected(reject(PricingErrorCode::BatchSizeMismatch,
                                          static_cast<double>(values.size()),
                                          static_cast<size_t>(field)));
        }
        return {};
    };

    if (auto ok = check(inputs.volatilities, InputField::Volatilities); !ok) return ok;
    if (auto ok = check(inputs.expiries, InputField::Expiries); !ok) return ok;

    const auto& underlying = std::visit([](const auto& u) -> const std::vector<double>& {
        return u.values;
    }, inputs.underlying);
    if (auto ok = check(underlying, InputField::Underlying); !ok) return ok;

    auto discounting = std::visit(overloaded{
        [](std::monostate) -> std::expected<void, PricingError> { return {}; },
        [&](const auto& d) -> std::expected<void, PricingError> {
            return check(d.values, InputField::Discounting);
        },
    }, inputs.discounting);
    if (!discounting) return discounting;

    return std::visit(overloaded{
        [](std::monostate) -> std::expected<void, PricingError> { return {}; },
        [&](const auto& c) -> std::expected<void, PricingError> {
            return check(c.values, InputField::Carry);
        },
    }, inputs.carry);
}

}  // namespace vanilla
