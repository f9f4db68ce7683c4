/// @file numeric_comparator_test.cpp
/// @brief Tests for the Kolmogorov-Smirnov comparator

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>

#include "common/error.h"
#include "drift/numeric_comparator.h"
#include "drift/stats.h"

namespace driftwatch::drift {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

class KolmogorovSmirnovComparatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        comparator_ = CreateNumericComparator();
    }

    std::vector<double> Normal(double mean, double stddev, size_t n, unsigned seed) {
        std::mt19937 rng(seed);
        std::normal_distribution<double> dist(mean, stddev);
        std::vector<double> values(n);
        for (auto& v : values) {
            v = dist(rng);
        }
        return values;
    }

    std::unique_ptr<NumericComparator> comparator_;
};

TEST_F(KolmogorovSmirnovComparatorTest, FactoryCreatesKolmogorovSmirnov) {
    ASSERT_NE(comparator_, nullptr);
    EXPECT_EQ(comparator_->Kind(), TestKind::kKolmogorovSmirnov);
    EXPECT_EQ(comparator_->Name(), "KolmogorovSmirnovComparator");
}

TEST_F(KolmogorovSmirnovComparatorTest, IdenticalSamplesDoNotDrift) {
    auto sample = Normal(0.0, 1.0, 200, 42);

    auto result = comparator_->Compare(sample, sample, 0.05);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_DOUBLE_EQ(result->statistic, 0.0);
    EXPECT_DOUBLE_EQ(result->p_value, 1.0);
    EXPECT_FALSE(result->is_drift);
    EXPECT_DOUBLE_EQ(result->corrected_alpha, 0.05);
}

TEST_F(KolmogorovSmirnovComparatorTest, DisjointRangesDrift) {
    std::vector<double> low;
    std::vector<double> high;
    for (int i = 0; i < 50; ++i) {
        low.push_back(i);
        high.push_back(1000 + i);
    }

    auto result = comparator_->Compare(low, high, 0.05);
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->statistic, 1.0);
    EXPECT_LT(result->p_value, 1e-10);
    EXPECT_TRUE(result->is_drift);
}

TEST_F(KolmogorovSmirnovComparatorTest, SameDistributionRarelyDrifts) {
    auto baseline = Normal(10.0, 2.0, 500, 7);
    auto comparison = Normal(10.0, 2.0, 500, 8);

    auto result = comparator_->Compare(baseline, comparison, 1e-4);
    ASSERT_TRUE(result.ok());
    EXPECT_GT(result->p_value, 1e-4);
    EXPECT_FALSE(result->is_drift);
}

TEST_F(KolmogorovSmirnovComparatorTest, PowerGrowsWithSampleSize) {
    auto small_base = Normal(0.0, 1.0, 50, 1);
    auto small_comp = Normal(0.3, 1.0, 50, 2);
    auto large_base = Normal(0.0, 1.0, 5000, 1);
    auto large_comp = Normal(0.3, 1.0, 5000, 2);

    auto small = comparator_->Compare(small_base, small_comp, 0.05);
    auto large = comparator_->Compare(large_base, large_comp, 0.05);
    ASSERT_TRUE(small.ok());
    ASSERT_TRUE(large.ok());
    EXPECT_LT(large->p_value, small->p_value);
    EXPECT_TRUE(large->is_drift);
}

TEST_F(KolmogorovSmirnovComparatorTest, VerdictIncludesEquality) {
    std::vector<double> a = {1, 2, 3, 4, 5, 6, 7, 8};
    std::vector<double> b = {4, 5, 6, 7, 8, 9, 10, 11};
    const double d = stats::KolmogorovSmirnovStatistic(a, b);
    const double p = stats::KolmogorovSmirnovPValue(d, a.size(), b.size());

    auto at_threshold = comparator_->Compare(a, b, p);
    ASSERT_TRUE(at_threshold.ok());
    EXPECT_DOUBLE_EQ(at_threshold->p_value, p);
    EXPECT_TRUE(at_threshold->is_drift);

    auto below_threshold = comparator_->Compare(a, b, p * 0.5);
    ASSERT_TRUE(below_threshold.ok());
    EXPECT_FALSE(below_threshold->is_drift);
}

TEST_F(KolmogorovSmirnovComparatorTest, NaNValuesAreIgnored) {
    std::vector<double> clean = {1.0, 2.0, 3.0, 4.0};
    std::vector<double> with_nulls = {kNaN, 1.0, 2.0, kNaN, 3.0, 4.0};

    auto result = comparator_->Compare(clean, with_nulls, 0.05);
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->statistic, 0.0);
}

TEST_F(KolmogorovSmirnovComparatorTest, TooFewValuesIsInsufficientData) {
    auto one_value = comparator_->Compare({1.0}, {1.0, 2.0, 3.0}, 0.05);
    ASSERT_FALSE(one_value.ok());
    EXPECT_TRUE(IsInsufficientData(one_value.status()));

    auto all_null = comparator_->Compare({1.0, 2.0}, {kNaN, kNaN, kNaN}, 0.05);
    ASSERT_FALSE(all_null.ok());
    EXPECT_TRUE(IsInsufficientData(all_null.status()));

    auto empty = comparator_->Compare({}, {}, 0.05);
    EXPECT_TRUE(IsInsufficientData(empty.status()));
}

TEST_F(KolmogorovSmirnovComparatorTest, SymmetricUnderSwap) {
    auto a = Normal(0.0, 1.0, 300, 3);
    auto b = Normal(0.2, 1.5, 200, 4);

    auto ab = comparator_->Compare(a, b, 0.05);
    auto ba = comparator_->Compare(b, a, 0.05);
    ASSERT_TRUE(ab.ok());
    ASSERT_TRUE(ba.ok());
    EXPECT_DOUBLE_EQ(ab->statistic, ba->statistic);
    EXPECT_DOUBLE_EQ(ab->p_value, ba->p_value);
}

}  // namespace
}  // namespace driftwatch::drift
