#pragma once

/// @file drift_monitor.h
/// @brief Orchestrates per-feature drift tests over two windows

#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "data/window.h"
#include "drift/categorical_comparator.h"
#include "drift/corrector.h"
#include "drift/summary_reporter.h"
#include "drift/test_result.h"

namespace driftwatch::drift {

/// @brief Configuration for a drift monitor
struct MonitorOptions {
    /// Family-wise significance level, applied to each family separately
    double alpha = kDefaultFamilyAlpha;

    /// Test used for categorical features
    CategoricalTest categorical_test = CategoricalTest::kContingency;

    /// Worker threads for per-feature tests (1 = evaluate inline)
    size_t num_workers = 1;

    /// Jensen-Shannon diagnostic settings used by Summary()
    JensenShannonOptions jensen_shannon;

    /// @brief Read the "monitor" section of a configuration
    ///
    /// Missing keys keep their defaults.
    /// @return Options, or InvalidConfiguration for bad values
    static absl::StatusOr<MonitorOptions> FromConfig(const Config& config);

    /// @brief Check alpha, worker count and Jensen-Shannon settings
    absl::Status Validate() const;
};

/// @brief Read "features.numeric" and "features.categorical" lists
data::FeaturePartition PartitionFromConfig(const Config& config);

/// @brief Full account of one monitoring run
struct RunReport {
    /// Corrected thresholds; absent for an empty family
    std::optional<double> numeric_alpha;
    std::optional<double> categorical_alpha;

    /// One outcome per partition feature, numeric family first, each
    /// family in partition order
    std::vector<FeatureOutcome> outcomes;

    /// Drifted features, in the same order as outcomes
    std::vector<DriftEvent> events;

    size_t SkippedCount() const;
    bool HasDrift() const { return !events.empty(); }
};

/// @brief Drift monitor over a baseline and a comparison window
///
/// The monitor owns both windows and never mutates them. Drift is
/// reported as data: Run() returns events and leaves the reaction
/// (alerting, retraining) to the caller.
///
/// Example usage:
/// @code
///   data::FeaturePartition partition({"price", "bedrooms"}, {"room_type"});
///   DriftMonitor monitor(std::move(last_week), std::move(this_week), partition);
///
///   auto events = monitor.Run();
///   if (!events.ok()) {
///       // SchemaMismatch or InvalidConfiguration
///   }
///   for (const auto& event : *events) {
///       // Hand off to the action handler
///   }
/// @endcode
class DriftMonitor {
public:
    DriftMonitor(data::Window baseline,
                 data::Window comparison,
                 data::FeaturePartition partition,
                 MonitorOptions options = {});

    /// @brief Run every test and return the features found drifting
    ///
    /// Fails before any test executes on SchemaMismatch or
    /// InvalidConfiguration. Features without enough data are skipped.
    absl::StatusOr<std::vector<DriftEvent>> Run() const;

    /// @brief Like Run(), but also reports thresholds and skipped features
    absl::StatusOr<RunReport> Evaluate() const;

    /// @brief Descriptive diagnostics for the two windows
    ///
    /// Null rates cover every column; the other tables cover the
    /// partition's numeric or categorical features.
    absl::StatusOr<SummaryReport> Summary() const;

    const data::Window& Baseline() const { return baseline_; }
    const data::Window& Comparison() const { return comparison_; }
    const data::FeaturePartition& Partition() const { return partition_; }
    const MonitorOptions& Options() const { return options_; }

private:
    /// @brief Schema and partition checks shared by Evaluate and Summary
    absl::Status ValidateInputs() const;

    data::Window baseline_;
    data::Window comparison_;
    data::FeaturePartition partition_;
    MonitorOptions options_;
};

}  // namespace driftwatch::drift
