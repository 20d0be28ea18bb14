// SPDX-License-Identifier: MIT
/**
 * @file option_types.hpp
 * @brief Option-type and Greek selectors with text parsing at the API boundary
 */

#pragma once

#include "vanilla/support/error_types.hpp"
#include <array>
#include <expected>
#include <string_view>

namespace vanilla {

/**
 * Option type enumeration.
 */
enum class OptionType {
    CALL,
    PUT
};

/// Sensitivity selector for the Greeks kernel
enum class Greek { Delta, Gamma, Theta, Vega, Rho };

/// All supported Greeks, in declaration order
inline constexpr std::array<Greek, 5> kAllGreeks = {
    Greek::Delta, Greek::Gamma, Greek::Theta, Greek::Vega, Greek::Rho};

constexpr OptionType option_type_from_flag(bool is_call) noexcept {
    return is_call ? OptionType::CALL : OptionType::PUT;
}

/// Parse an option-type flag
///
/// Accepts "call"/"put", "c"/"p", "true"/"false" and "1"/"0", ignoring
/// case. Anything else is UnknownOptionType.
std::expected<OptionType, PricingError> parse_option_type(std::string_view flag);

/// Parse a Greek name ("delta", "gamma", "theta", "vega", "rho"; case-insensitive)
std::expected<Greek, PricingError> parse_greek(std::string_view name);

/// Lower-case name of a Greek
std::string_view to_string(Greek greek) noexcept;

/// "call" or "put"
std::string_view to_string(OptionType type) noexcept;

}  // namespace vanilla
