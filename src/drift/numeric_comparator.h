#pragma once

/// @file numeric_comparator.h
/// @brief Two-sample distribution tests for numeric features

#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "drift/test_result.h"

namespace driftwatch::drift {

/// @brief Abstract base class for numeric two-sample comparators
///
/// Implementations hold no mutable state, so one instance may be shared
/// by concurrent evaluations.
class NumericComparator {
public:
    virtual ~NumericComparator() = default;

    /// @brief Compare two samples of one numeric feature
    /// @param baseline Baseline window values (NaN entries are nulls)
    /// @param comparison Comparison window values (NaN entries are nulls)
    /// @param corrected_alpha Family threshold for the verdict
    /// @return Test result, or InsufficientData when a window has fewer
    ///         than two non-null values
    virtual absl::StatusOr<TestResult> Compare(
        const std::vector<double>& baseline,
        const std::vector<double>& comparison,
        double corrected_alpha) const = 0;

    /// @brief Get the test this comparator runs
    virtual TestKind Kind() const = 0;

    /// @brief Get the comparator name
    virtual std::string Name() const = 0;
};

/// @brief Two-sample Kolmogorov-Smirnov test, asymptotic p-value
///
/// The statistic is the largest gap between the two empirical CDFs. The
/// p-value comes from the limiting Kolmogorov distribution, so it is
/// meant for large continuous samples. Power grows with sample size: a
/// fixed small shift yields ever smaller p-values as N grows.
///
/// Drift when p_value <= corrected_alpha.
class KolmogorovSmirnovComparator : public NumericComparator {
public:
    KolmogorovSmirnovComparator() = default;

    absl::StatusOr<TestResult> Compare(
        const std::vector<double>& baseline,
        const std::vector<double>& comparison,
        double corrected_alpha) const override;

    TestKind Kind() const override { return TestKind::kKolmogorovSmirnov; }
    std::string Name() const override { return "KolmogorovSmirnovComparator"; }

    /// Minimum non-null values per window
    static constexpr size_t kMinSamples = 2;
};

/// @brief Factory method to create the numeric comparator
std::unique_ptr<NumericComparator> CreateNumericComparator();

}  // namespace driftwatch::drift
