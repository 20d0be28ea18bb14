// SPDX-License-Identifier: MIT
#include "vanilla/option/option_types.hpp"
#include "vanilla/support/vanilla_trace.h"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace vanilla {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace

std::expected<OptionType, PricingError> parse_option_type(std::string_view flag) {
    for (std::string_view call : {"call", "c", "true", "1"}) {
        if (iequals(flag, call)) return OptionType::CALL;
    }
    for (std::string_view put : {"put", "p", "false", "0"}) {
        if (iequals(flag, put)) return OptionType::PUT;
    }

    VANILLA_TRACE_VALIDATION_ERROR(VANILLA_MODULE_INPUTS,
        static_cast<int>(PricingErrorCode::UnknownOptionType), 0.0, flag.size());
    return std::unexpected(PricingError(PricingErrorCode::UnknownOptionType));
}

std::expected<Greek, PricingError> parse_greek(std::string_view name) {
    for (Greek greek : kAllGreeks) {
        if (iequals(name, to_string(greek))) return greek;
    }

    VANILLA_TRACE_VALIDATION_ERROR(VANILLA_MODULE_GREEKS,
        static_cast<int>(PricingErrorCode::UnknownGreek), 0.0, name.size());
    return std::unexpected(PricingError(PricingErrorCode::UnknownGreek));
}

std::string_view to_string(Greek greek) noexcept {
    switch (greek) {
        case Greek::Delta: return "delta";
        case Greek::Gamma: return "gamma";
        case Greek::Theta: return "theta";
        case Greek::Vega:  return "vega";
        case Greek::Rho:   return "rho";
    }
    return "unknown";
}

std::string_view to_string(OptionType type) noexcept {
    return type == OptionType::CALL ? "call" : "put";
}

}  // namespace vanilla
