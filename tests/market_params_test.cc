// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "vanilla/option/market_params.hpp"
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace vanilla {
namespace {

class NormalizeTest : public ::testing::Test {
protected:
    static constexpr double tolerance = 1e-12;

    MarketInputs make_inputs(UnderlyingInput underlying) const {
        return MarketInputs{
            .strikes = {90.0, 100.0, 120.0},
            .volatilities = {0.15, 0.2, 0.35},
            .expiries = {0.25, 1.0, 3.0},
            .underlying = std::move(underlying),
        };
    }
};

// ===========================================================================
// Defaults
// ===========================================================================

TEST_F(NormalizeTest, DefaultsToZeroRateAndDividend) {
    auto params = normalize(make_inputs(SpotPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());
    ASSERT_EQ(params->size(), 3u);

    for (size_t i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(params->discount_rate[i], 0.0);
        EXPECT_DOUBLE_EQ(params->continuous_dividend[i], 0.0);
        EXPECT_DOUBLE_EQ(params->cost_of_carry[i], 0.0);
        EXPECT_DOUBLE_EQ(params->discount_factor[i], 1.0);
        EXPECT_DOUBLE_EQ(params->forward[i], 100.0);
        EXPECT_DOUBLE_EQ(params->spot[i], 100.0);
    }
}

TEST_F(NormalizeTest, PassesThroughStrikesVolatilitiesExpiries) {
    auto params = normalize(make_inputs(SpotPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->strike, (std::vector<double>{90.0, 100.0, 120.0}));
    EXPECT_EQ(params->volatility, (std::vector<double>{0.15, 0.2, 0.35}));
    EXPECT_EQ(params->expiry, (std::vector<double>{0.25, 1.0, 3.0}));
}

// ===========================================================================
// Derivations
// ===========================================================================

TEST_F(NormalizeTest, RatesAndDividendsDeriveCarryFactorAndForward) {
    auto inputs = make_inputs(SpotPrices{{100.0, 100.0, 100.0}});
    inputs.discounting = DiscountRates{{0.05, 0.03, 0.01}};
    inputs.carry = ContinuousDividends{{0.02, 0.0, 0.03}};

    auto params = normalize(inputs);
    ASSERT_TRUE(params.has_value());

    const std::vector<double> r{0.05, 0.03, 0.01};
    const std::vector<double> q{0.02, 0.0, 0.03};
    const std::vector<double> T{0.25, 1.0, 3.0};
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_NEAR(params->cost_of_carry[i], r[i] - q[i], tolerance);
        EXPECT_NEAR(params->discount_factor[i], std::exp(-r[i] * T[i]), tolerance);
        EXPECT_NEAR(params->forward[i], 100.0 * std::exp((r[i] - q[i]) * T[i]), 1e-10);
    }
}

TEST_F(NormalizeTest, DiscountFactorsDeriveRates) {
    auto inputs = make_inputs(SpotPrices{{100.0, 100.0, 100.0}});
    inputs.discounting = DiscountFactors{{0.99, 0.95, 0.80}};

    auto params = normalize(inputs);
    ASSERT_TRUE(params.has_value());

    EXPECT_NEAR(params->discount_rate[0], -std::log(0.99) / 0.25, tolerance);
    EXPECT_NEAR(params->discount_rate[1], -std::log(0.95) / 1.0, tolerance);
    EXPECT_NEAR(params->discount_rate[2], -std::log(0.80) / 3.0, tolerance);
    // Supplied factors are kept as given
    EXPECT_DOUBLE_EQ(params->discount_factor[2], 0.80);
}

TEST_F(NormalizeTest, DirectCarryDerivesDividend) {
    auto inputs = make_inputs(SpotPrices{{100.0, 100.0, 100.0}});
    inputs.discounting = DiscountRates{{0.04, 0.04, 0.04}};
    inputs.carry = CostOfCarry{{0.01, -0.02, 0.0}};

    auto params = normalize(inputs);
    ASSERT_TRUE(params.has_value());

    EXPECT_DOUBLE_EQ(params->cost_of_carry[1], -0.02);
    EXPECT_NEAR(params->continuous_dividend[0], 0.03, tolerance);
    EXPECT_NEAR(params->continuous_dividend[1], 0.06, tolerance);
    EXPECT_NEAR(params->continuous_dividend[2], 0.04, tolerance);
    EXPECT_NEAR(params->forward[1], 100.0 * std::exp(-0.02 * 1.0), 1e-10);
}

TEST_F(NormalizeTest, ForwardsDeriveSpots) {
    auto inputs = make_inputs(ForwardPrices{{101.0, 105.0, 110.0}});
    inputs.discounting = DiscountRates{{0.05, 0.05, 0.05}};

    auto params = normalize(inputs);
    ASSERT_TRUE(params.has_value());

    EXPECT_NEAR(params->spot[0], 101.0 * std::exp(-0.05 * 0.25), 1e-10);
    EXPECT_NEAR(params->spot[1], 105.0 * std::exp(-0.05 * 1.0), 1e-10);
    EXPECT_NEAR(params->spot[2], 110.0 * std::exp(-0.05 * 3.0), 1e-10);
    EXPECT_DOUBLE_EQ(params->forward[1], 105.0);
}

// ===========================================================================
// Round trips
// ===========================================================================

TEST_F(NormalizeTest, SpotForwardRoundTrip) {
    const std::vector<double> spots{42.0, 100.0, 2500.0};
    auto inputs = make_inputs(SpotPrices{spots});
    inputs.carry = CostOfCarry{{0.07, -0.03, 0.002}};

    auto from_spots = normalize(inputs);
    ASSERT_TRUE(from_spots.has_value());

    inputs.underlying = ForwardPrices{from_spots->forward};
    auto from_forwards = normalize(inputs);
    ASSERT_TRUE(from_forwards.has_value());

    for (size_t i = 0; i < spots.size(); ++i) {
        EXPECT_NEAR(from_forwards->spot[i], spots[i], 1e-12 * spots[i]);
    }
}

TEST_F(NormalizeTest, RateFactorRoundTrip) {
    const std::vector<double> rates{0.05, -0.005, 0.12};
    auto inputs = make_inputs(SpotPrices{{100.0, 100.0, 100.0}});
    inputs.discounting = DiscountRates{rates};

    auto from_rates = normalize(inputs);
    ASSERT_TRUE(from_rates.has_value());

    inputs.discounting = DiscountFactors{from_rates->discount_factor};
    auto from_factors = normalize(inputs);
    ASSERT_TRUE(from_factors.has_value());

    for (size_t i = 0; i < rates.size(); ++i) {
        EXPECT_NEAR(from_factors->discount_rate[i], rates[i], 1e-14);
        EXPECT_NEAR(from_factors->forward[i], from_rates->forward[i], 1e-10);
    }
}

// ===========================================================================
// Errors and edge cases
// ===========================================================================

TEST_F(NormalizeTest, RejectsMismatchedLengths) {
    auto inputs = make_inputs(SpotPrices{{100.0, 100.0}});
    auto params = normalize(inputs);
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().code, PricingErrorCode::BatchSizeMismatch);
}

TEST_F(NormalizeTest, QueryOverloadEnforcesExclusivity) {
    VanillaQuery query;
    query.strikes = {100.0};
    query.volatilities = {0.2};
    query.expiries = {1.0};
    query.spots = std::vector<double>{100.0};
    query.forwards = std::vector<double>{100.0};

    auto params = normalize(query);
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().code, PricingErrorCode::ConflictingUnderlying);
}

TEST_F(NormalizeTest, ZeroExpiryIsNotANormalizerError) {
    MarketInputs inputs{
        .strikes = {100.0},
        .volatilities = {0.0},
        .expiries = {0.0},
        .underlying = SpotPrices{{100.0}},
        .discounting = DiscountRates{{0.05}},
    };
    auto params = normalize(inputs);
    ASSERT_TRUE(params.has_value());
    EXPECT_DOUBLE_EQ(params->discount_factor[0], 1.0);
    EXPECT_DOUBLE_EQ(params->forward[0], 100.0);
}

TEST_F(NormalizeTest, EmptyBatch) {
    MarketInputs inputs{.underlying = SpotPrices{}};
    auto params = normalize(inputs);
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(params->empty());
    EXPECT_TRUE(params->forward.empty());
}

// ===========================================================================
// Domain validation
// ===========================================================================

TEST_F(NormalizeTest, ValidateAcceptsOrdinaryBatch) {
    auto params = normalize(make_inputs(SpotPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(validate_market_params(*params).has_value());
}

TEST_F(NormalizeTest, ValidateReportsFirstBadElement) {
    auto params = normalize(make_inputs(SpotPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());

    params->strike[1] = -10.0;
    auto result = validate_market_params(*params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PricingErrorCode::InvalidStrike);
    EXPECT_EQ(result.error().index, 1u);
    EXPECT_DOUBLE_EQ(result.error().value, -10.0);
}

TEST_F(NormalizeTest, ValidateRejectsNegativeVolatilityAndNaNRate) {
    auto params = normalize(make_inputs(SpotPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());

    auto bad_vol = *params;
    bad_vol.volatility[2] = -0.1;
    EXPECT_EQ(validate_market_params(bad_vol).error().code, PricingErrorCode::InvalidVolatility);

    auto bad_rate = *params;
    bad_rate.discount_rate[0] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validate_market_params(bad_rate).error().code, PricingErrorCode::NonFiniteInput);

    auto zero_vol = *params;
    zero_vol.volatility[0] = 0.0;
    EXPECT_TRUE(validate_market_params(zero_vol).has_value());
}

TEST_F(NormalizeTest, NormalizedParamsHaveUniformSizes) {
    auto params = normalize(make_inputs(ForwardPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(check_param_sizes(*params).has_value());
    EXPECT_TRUE(check_param_sizes(MarketParams{}).has_value());
}

TEST_F(NormalizeTest, RaggedParamsReportFirstShortMember) {
    auto params = normalize(make_inputs(SpotPrices{{100.0, 100.0, 100.0}}));
    ASSERT_TRUE(params.has_value());

    params->discount_factor.pop_back();
    params->cost_of_carry.push_back(0.0);

    auto sizes = check_param_sizes(*params);
    ASSERT_FALSE(sizes.has_value());
    EXPECT_EQ(sizes.error().code, PricingErrorCode::BatchSizeMismatch);
    EXPECT_EQ(sizes.error().index, static_cast<size_t>(ParamField::DiscountFactor));
    EXPECT_DOUBLE_EQ(sizes.error().value, 2.0);

    auto valid = validate_market_params(*params);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, PricingErrorCode::BatchSizeMismatch);
}

}  // namespace
}  // namespace vanilla
