// SPDX-License-Identifier: MIT
#include "vanilla/pricing/vanilla_analytics.hpp"
#include "vanilla/option/market_params.hpp"

namespace vanilla {

std::expected<std::vector<double>, PricingError>
vanilla_prices(const VanillaQuery& query, OptionType type, const PricerConfig& config) {
    auto params = normalize(query);
    if (!params) {
        return std::unexpected(params.error());
    }
    return VanillaPricer(config).price(*params, type);
}

std::expected<std::vector<double>, PricingError>
vanilla_prices(const VanillaQuery& query, std::span<const OptionType> types,
               const PricerConfig& config) {
    auto params = normalize(query);
    if (!params) {
        return std::unexpected(params.error());
    }
    return VanillaPricer(config).price(*params, types);
}

std::expected<std::vector<double>, PricingError>
vanilla_prices(const VanillaQuery& query, std::string_view option_type,
               const PricerConfig& config) {
    auto type = parse_option_type(option_type);
    if (!type) {
        return std::unexpected(type.error());
    }
    return vanilla_prices(query, *type, config);
}

std::expected<std::vector<double>, PricingError>
vanilla_greeks(const VanillaQuery& query, Greek greek, OptionType type,
               const PricerConfig& config) {
    auto params = normalize(query);
    if (!params) {
        return std::unexpected(params.error());
    }
    return VanillaPricer(config).greek(*params, greek, type);
}

std::expected<std::vector<double>, PricingError>
vanilla_greeks(const VanillaQuery& query, Greek greek, std::span<const OptionType> types,
               const PricerConfig& config) {
    auto params = normalize(query);
    if (!params) {
        return std::unexpected(params.error());
    }
    return VanillaPricer(config).greek(*params, greek, types);
}

std::expected<std::vector<double>, PricingError>
vanilla_greeks(const VanillaQuery& query, std::string_view greek, std::string_view option_type,
               const PricerConfig& config) {
    auto selected = parse_greek(greek);
    if (!selected) {
        return std::unexpected(selected.error());
    }
    auto type = parse_option_type(option_type);
    if (!type) {
        return std::unexpected(type.error());
    }
    return vanilla_greeks(query, *selected, *type, config);
}

std::expected<GreekSheet, PricingError>
vanilla_greek_sheet(const VanillaQuery& query, OptionType type, const PricerConfig& config) {
    auto params = normalize(query);
    if (!params) {
        return std::unexpected(params.error());
    }
    return VanillaPricer(config).greeks(*params, type);
}

}  // namespace vanilla
