// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "vanilla/support/error_types.hpp"
#include <sstream>
#include <string>

using namespace vanilla;

TEST(ErrorKindTest, DegenerateVarianceIsNumerical) {
    EXPECT_EQ(error_kind(PricingErrorCode::DegenerateVariance), ErrorKind::NumericalDegeneracy);
}

TEST(ErrorKindTest, ExclusivityViolationsAreInvalidInput) {
    EXPECT_EQ(error_kind(PricingErrorCode::MissingUnderlying), ErrorKind::InvalidInput);
    EXPECT_EQ(error_kind(PricingErrorCode::ConflictingUnderlying), ErrorKind::InvalidInput);
    EXPECT_EQ(error_kind(PricingErrorCode::ConflictingDiscounting), ErrorKind::InvalidInput);
    EXPECT_EQ(error_kind(PricingErrorCode::ConflictingCarry), ErrorKind::InvalidInput);
}

TEST(ErrorKindTest, SelectorFailuresAreInvalidInput) {
    EXPECT_EQ(error_kind(PricingError(PricingErrorCode::UnknownGreek)), ErrorKind::InvalidInput);
    EXPECT_EQ(error_kind(PricingError(PricingErrorCode::UnknownOptionType)),
              ErrorKind::InvalidInput);
}

TEST(PricingErrorTest, DefaultsValueAndIndexToZero) {
    PricingError err(PricingErrorCode::BatchSizeMismatch);
    EXPECT_DOUBLE_EQ(err.value, 0.0);
    EXPECT_EQ(err.index, 0u);
}

TEST(PricingErrorTest, StreamsCodeValueAndIndex) {
    PricingError err(PricingErrorCode::InvalidStrike, -5.0, 3);
    std::ostringstream os;
    os << err;

    const std::string text = os.str();
    EXPECT_NE(text.find("PricingError{code="), std::string::npos);
    EXPECT_NE(text.find("value=-5"), std::string::npos);
    EXPECT_NE(text.find("index=3"), std::string::npos);
    EXPECT_NE(text.find("Strike"), std::string::npos);
}

TEST(PricingErrorTest, EveryCodeHasADescription) {
    for (int code = 0; code <= static_cast<int>(PricingErrorCode::DegenerateVariance); ++code) {
        std::string text = describe(static_cast<PricingErrorCode>(code));
        EXPECT_FALSE(text.empty());
        EXPECT_NE(text, "Unknown pricing error") << "code " << code;
    }
}
