/// @file corrector_test.cpp
/// @brief Tests for the Bonferroni corrector

#include <gtest/gtest.h>

#include <limits>

#include "common/error.h"
#include "drift/corrector.h"

namespace driftwatch::drift {
namespace {

TEST(CorrectorTest, SingleTestKeepsAlpha) {
    auto alpha = CorrectedAlpha(0.05, 1);
    ASSERT_TRUE(alpha.ok());
    EXPECT_DOUBLE_EQ(*alpha, 0.05);
}

TEST(CorrectorTest, DividesByTestCount) {
    auto alpha = CorrectedAlpha(0.05, 10);
    ASSERT_TRUE(alpha.ok());
    EXPECT_DOUBLE_EQ(*alpha, 0.005);
}

TEST(CorrectorTest, MonotoneDecreasingInTestCount) {
    double previous = 1.0;
    for (int64_t n = 1; n <= 50; ++n) {
        auto alpha = CorrectedAlpha(kDefaultFamilyAlpha, n);
        ASSERT_TRUE(alpha.ok());
        EXPECT_LT(*alpha, previous);
        previous = *alpha;
    }
}

TEST(CorrectorTest, NonPositiveCountIsInvalidConfiguration) {
    EXPECT_TRUE(IsInvalidConfiguration(CorrectedAlpha(0.05, 0).status()));
    EXPECT_TRUE(IsInvalidConfiguration(CorrectedAlpha(0.05, -3).status()));
}

TEST(CorrectorTest, AlphaOutsideUnitIntervalIsInvalidConfiguration) {
    EXPECT_TRUE(IsInvalidConfiguration(CorrectedAlpha(0.0, 5).status()));
    EXPECT_TRUE(IsInvalidConfiguration(CorrectedAlpha(-0.1, 5).status()));
    EXPECT_TRUE(IsInvalidConfiguration(CorrectedAlpha(1.5, 5).status()));
    EXPECT_TRUE(IsInvalidConfiguration(
        CorrectedAlpha(std::numeric_limits<double>::quiet_NaN(), 5).status()));
}

TEST(CorrectorTest, AlphaOfOneIsAllowed) {
    EXPECT_TRUE(ValidateAlpha(1.0).ok());
    auto alpha = CorrectedAlpha(1.0, 4);
    ASSERT_TRUE(alpha.ok());
    EXPECT_DOUBLE_EQ(*alpha, 0.25);
}

}  // namespace
}  // namespace driftwatch::drift
