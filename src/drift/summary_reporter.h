#pragma once

/// @file summary_reporter.h
/// @brief Descriptive diagnostics comparing two windows
///
/// Nothing here is a hypothesis test. The diagnostics help a reader see
/// what moved; they never produce drift events.

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "data/window.h"
#include "drift/stats.h"

namespace driftwatch::drift {

/// @brief Statistic names in report order
inline constexpr std::array<std::string_view, 8> kSummaryStatistics = {
    "count", "mean", "std", "min", "25%", "50%", "75%", "max"};

/// @brief Guard added to the baseline magnitude in percent change
inline constexpr double kPercentChangeEpsilon = 1e-100;

/// @brief Per-statistic percent change of one numeric feature
struct PercentChange {
    std::string feature;
    stats::DescriptiveStats baseline;
    stats::DescriptiveStats comparison;

    /// (statistic, percent) in kSummaryStatistics order; NaN where the
    /// statistic is undefined in either window
    std::vector<std::pair<std::string, double>> percent;

    /// @brief Look up a statistic by name ("mean", "25%", ...)
    std::optional<double> Get(std::string_view statistic) const;
};

/// @brief Share of null records per window, in percent
struct NullRate {
    std::string feature;
    double baseline_null_pct = 0.0;
    double comparison_null_pct = 0.0;
};

/// @brief Options for the Jensen-Shannon diagnostic
struct JensenShannonOptions {
    size_t bins = 20;
    double threshold = 0.2;
};

/// @brief Jensen-Shannon distance of one numeric feature
struct JensenShannonResult {
    std::string feature;
    double distance = 0.0;
    bool exceeds_threshold = false;
};

/// @brief Mode and cardinality of one categorical feature in one window
struct CategoricalSummary {
    std::string feature;
    std::optional<std::string> mode;  ///< Absent when every value is null
    size_t distinct_count = 0;        ///< Nulls excluded
    size_t missing_count = 0;
};

/// @brief All diagnostics for a pair of windows
struct SummaryReport {
    std::vector<PercentChange> percent_change;
    std::vector<NullRate> null_rates;
    std::vector<JensenShannonResult> jensen_shannon;
    std::vector<CategoricalSummary> baseline_categorical;
    std::vector<CategoricalSummary> comparison_categorical;
};

/// @brief 100 * |a - b| / (|a| + eps); NaN if either input is NaN
double PercentDifference(double baseline, double comparison);

/// @brief Percent change of count, mean, std, min, quartiles and max
/// @return SchemaMismatch for a missing or non-numeric feature
absl::StatusOr<std::vector<PercentChange>> ComputePercentChange(
    const data::Window& baseline,
    const data::Window& comparison,
    const std::vector<std::string>& numeric_features);

/// @brief Null percentage of each feature in both windows
/// @return SchemaMismatch for a missing feature
absl::StatusOr<std::vector<NullRate>> ComputeNullRates(
    const data::Window& baseline,
    const data::Window& comparison,
    const std::vector<std::string>& features);

/// @brief Jensen-Shannon distance of binned numeric features
///
/// Both windows share equal-width bins over their joint range. Features
/// with no non-null values in either window are omitted.
/// @return SchemaMismatch for a missing or non-numeric feature;
///         InvalidConfiguration for zero bins
absl::StatusOr<std::vector<JensenShannonResult>> ComputeJensenShannon(
    const data::Window& baseline,
    const data::Window& comparison,
    const std::vector<std::string>& numeric_features,
    const JensenShannonOptions& options = {});

/// @brief Mode, distinct count and missing count per categorical feature
/// @return SchemaMismatch for a missing feature
absl::StatusOr<std::vector<CategoricalSummary>> SummarizeCategorical(
    const data::Window& window,
    const std::vector<std::string>& categorical_features);

}  // namespace driftwatch::drift
