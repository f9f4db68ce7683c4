#pragma once

/// @file categorical_comparator.h
/// @brief Chi-squared drift tests for categorical features

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "data/window.h"
#include "drift/test_result.h"

namespace driftwatch::drift {

/// @brief 2 x K table of category counts, one row per window
///
/// Columns are the union of categories observed in either window, the
/// null category first and the rest in ascending order. A category seen
/// in only one window has a zero count in the other.
class ContingencyTable {
public:
    /// @brief Count categories of both windows into a table
    static ContingencyTable Build(const std::vector<data::Category>& baseline,
                                  const std::vector<data::Category>& comparison);

    const std::vector<data::Category>& Categories() const { return categories_; }
    const std::vector<double>& BaselineCounts() const { return baseline_counts_; }
    const std::vector<double>& ComparisonCounts() const { return comparison_counts_; }

    size_t NumCategories() const { return categories_.size(); }
    double BaselineTotal() const;
    double ComparisonTotal() const;

private:
    std::vector<data::Category> categories_;
    std::vector<double> baseline_counts_;
    std::vector<double> comparison_counts_;
};

/// @brief Which chi-squared test a categorical comparator runs
enum class CategoricalTest {
    kContingency,   ///< Two-way test of independence (default)
    kGoodnessOfFit  ///< One-way test against raw baseline counts
};

/// @brief Parse "contingency" or "goodness_of_fit"
/// @return The test, or InvalidConfiguration for any other name
absl::StatusOr<CategoricalTest> CategoricalTestFromString(std::string_view name);

/// @brief Convert categorical test to its configuration name
std::string_view CategoricalTestToString(CategoricalTest test);

/// @brief Abstract base class for categorical comparators
///
/// Nulls (std::nullopt) count as their own category. Implementations
/// hold no mutable state.
class CategoricalComparator {
public:
    virtual ~CategoricalComparator() = default;

    /// @brief Compare the category distributions of two windows
    /// @return Test result, or InsufficientData when either window has no
    ///         observations or fewer than two categories exist overall
    virtual absl::StatusOr<TestResult> Compare(
        const std::vector<data::Category>& baseline,
        const std::vector<data::Category>& comparison,
        double corrected_alpha) const = 0;

    /// @brief Run the test on an already built table
    virtual absl::StatusOr<TestResult> CompareTable(
        const ContingencyTable& table, double corrected_alpha) const = 0;

    virtual TestKind Kind() const = 0;
    virtual std::string Name() const = 0;
};

/// @brief Two-way chi-squared contingency test
///
/// Tests independence between window membership and category. Expected
/// cells are row total * column total / grand total; degrees of freedom
/// are K - 1. With one degree of freedom Yates' continuity correction
/// moves each observed count toward its expectation by at most 0.5.
///
/// Because only proportions matter, a window with the same mix but fewer
/// records is not drift. Drift when p_value < corrected_alpha.
class ChiSquaredContingencyComparator : public CategoricalComparator {
public:
    absl::StatusOr<TestResult> Compare(
        const std::vector<data::Category>& baseline,
        const std::vector<data::Category>& comparison,
        double corrected_alpha) const override;

    absl::StatusOr<TestResult> CompareTable(
        const ContingencyTable& table, double corrected_alpha) const override;

    TestKind Kind() const override { return TestKind::kChiSquaredContingency; }
    std::string Name() const override { return "ChiSquaredContingencyComparator"; }
};

/// @brief One-way chi-squared goodness-of-fit test
///
/// Observed are the comparison counts, expected the raw baseline counts
/// (not rescaled). Degrees of freedom are K - 1. A category the baseline
/// never saw gives an infinite statistic and p = 0.
///
/// Sensitive to volume: the same mix with fewer records is drift. Not a
/// substitute for the contingency test. Drift when p_value < corrected_alpha.
class ChiSquaredGoodnessOfFitComparator : public CategoricalComparator {
public:
    absl::StatusOr<TestResult> Compare(
        const std::vector<data::Category>& baseline,
        const std::vector<data::Category>& comparison,
        double corrected_alpha) const override;

    absl::StatusOr<TestResult> CompareTable(
        const ContingencyTable& table, double corrected_alpha) const override;

    TestKind Kind() const override { return TestKind::kChiSquaredGoodnessOfFit; }
    std::string Name() const override { return "ChiSquaredGoodnessOfFitComparator"; }
};

/// @brief Factory method to create a categorical comparator
std::unique_ptr<CategoricalComparator> CreateCategoricalComparator(
    CategoricalTest test = CategoricalTest::kContingency);

}  // namespace driftwatch::drift
