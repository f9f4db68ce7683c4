/// @file drift_monitor.cpp
/// @brief Drift monitor implementation

#include "drift/drift_monitor.h"

#include <algorithm>
#include <functional>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/thread_pool.h"
#include "drift/numeric_comparator.h"

namespace driftwatch::drift {

namespace {

using OutcomeTask = std::function<absl::StatusOr<FeatureOutcome>()>;

/// Turn a comparator result into an outcome. InsufficientData becomes a
/// skipped feature; any other error fails the run.
absl::StatusOr<FeatureOutcome> MakeOutcome(const std::string& feature,
                                           data::FeatureKind kind,
                                           TestKind test_kind,
                                           absl::StatusOr<TestResult> result) {
    FeatureOutcome outcome;
    outcome.feature_name = feature;
    outcome.feature_kind = kind;
    outcome.test_kind = test_kind;

    if (!result.ok()) {
        if (!IsInsufficientData(result.status())) {
            return result.status();
        }
        outcome.status = OutcomeStatus::kSkipped;
        outcome.skip_reason = std::string(result.status().message());
        DRIFTWATCH_LOG_WARN("Skipping feature '{}': {}", feature, outcome.skip_reason);
        return outcome;
    }

    outcome.status = result->is_drift ? OutcomeStatus::kDrift : OutcomeStatus::kNoDrift;
    outcome.result = *std::move(result);

    DRIFTWATCH_LOG_DEBUG("Feature '{}' ({}): statistic={:.6g}, p={:.6g}, alpha={:.6g}, {}",
                         feature, TestKindToString(test_kind), outcome.result->statistic,
                         outcome.result->p_value, outcome.result->corrected_alpha,
                         OutcomeStatusToString(outcome.status));
    return outcome;
}

}  // namespace

// =============================================================================
// MonitorOptions
// =============================================================================

absl::StatusOr<MonitorOptions> MonitorOptions::FromConfig(const Config& config) {
    MonitorOptions options;
    options.alpha = config.GetDouble("monitor.alpha", options.alpha);

    if (config.HasKey("monitor.categorical_test")) {
        DRIFTWATCH_ASSIGN_OR_RETURN(
            options.categorical_test,
            CategoricalTestFromString(config.GetString("monitor.categorical_test")));
    }

    if (config.HasKey("monitor.num_workers")) {
        const int64_t workers = config.GetInt("monitor.num_workers", 1);
        if (workers <= 0) {
            return InvalidConfigurationError(
                absl::StrCat("monitor.num_workers must be positive, got ", workers));
        }
        options.num_workers = static_cast<size_t>(workers);
    }

    if (config.HasKey("monitor.js_bins")) {
        const int64_t bins = config.GetInt("monitor.js_bins", 0);
        if (bins <= 0) {
            return InvalidConfigurationError(
                absl::StrCat("monitor.js_bins must be positive, got ", bins));
        }
        options.jensen_shannon.bins = static_cast<size_t>(bins);
    }
    options.jensen_shannon.threshold =
        config.GetDouble("monitor.js_threshold", options.jensen_shannon.threshold);

    DRIFTWATCH_RETURN_IF_ERROR(options.Validate());
    return options;
}

absl::Status MonitorOptions::Validate() const {
    DRIFTWATCH_RETURN_IF_ERROR(ValidateAlpha(alpha));
    if (num_workers == 0) {
        return InvalidConfigurationError("Worker count must be positive");
    }
    if (jensen_shannon.bins == 0) {
        return InvalidConfigurationError("Jensen-Shannon bin count must be positive");
    }
    return absl::OkStatus();
}

data::FeaturePartition PartitionFromConfig(const Config& config) {
    return data::FeaturePartition(config.GetStringList("features.numeric"),
                                  config.GetStringList("features.categorical"));
}

size_t RunReport::SkippedCount() const {
    return static_cast<size_t>(std::count_if(
        outcomes.begin(), outcomes.end(),
        [](const FeatureOutcome& o) { return o.status == OutcomeStatus::kSkipped; }));
}

// =============================================================================
// DriftMonitor
// =============================================================================

DriftMonitor::DriftMonitor(data::Window baseline,
                           data::Window comparison,
                           data::FeaturePartition partition,
                           MonitorOptions options)
    : baseline_(std::move(baseline)),
      comparison_(std::move(comparison)),
      partition_(std::move(partition)),
      options_(std::move(options)) {}

absl::Status DriftMonitor::ValidateInputs() const {
    DRIFTWATCH_RETURN_IF_ERROR(partition_.Validate());
    DRIFTWATCH_RETURN_IF_ERROR(data::CheckSameSchema(baseline_, comparison_));
    return data::CheckPartitionCovered(partition_, baseline_, comparison_);
}

absl::StatusOr<std::vector<DriftEvent>> DriftMonitor::Run() const {
    DRIFTWATCH_ASSIGN_OR_RETURN(auto report, Evaluate());
    return std::move(report.events);
}

absl::StatusOr<RunReport> DriftMonitor::Evaluate() const {
    DRIFTWATCH_RETURN_IF_ERROR(options_.Validate());
    DRIFTWATCH_RETURN_IF_ERROR(ValidateInputs());

    const auto& numeric = partition_.Numeric();
    const auto& categorical = partition_.Categorical();

    // Extract every column up front so a text value in a numeric feature
    // fails the run before any test executes
    std::vector<std::pair<data::NumericColumn, data::NumericColumn>> numeric_columns;
    numeric_columns.reserve(numeric.size());
    for (const auto& feature : numeric) {
        DRIFTWATCH_ASSIGN_OR_RETURN(auto base, baseline_.NumericValues(feature));
        DRIFTWATCH_ASSIGN_OR_RETURN(auto comp, comparison_.NumericValues(feature));
        numeric_columns.emplace_back(std::move(base), std::move(comp));
    }

    std::vector<std::pair<std::vector<data::Category>, std::vector<data::Category>>>
        categorical_columns;
    categorical_columns.reserve(categorical.size());
    for (const auto& feature : categorical) {
        DRIFTWATCH_ASSIGN_OR_RETURN(auto base, baseline_.Categories(feature));
        DRIFTWATCH_ASSIGN_OR_RETURN(auto comp, comparison_.Categories(feature));
        categorical_columns.emplace_back(std::move(base), std::move(comp));
    }

    RunReport report;
    if (!numeric.empty()) {
        DRIFTWATCH_ASSIGN_OR_RETURN(
            report.numeric_alpha,
            CorrectedAlpha(options_.alpha, static_cast<int64_t>(numeric.size())));
        DRIFTWATCH_LOG_INFO("Numeric family: {} tests, corrected alpha {:.6g}",
                            numeric.size(), *report.numeric_alpha);
    }
    if (!categorical.empty()) {
        DRIFTWATCH_ASSIGN_OR_RETURN(
            report.categorical_alpha,
            CorrectedAlpha(options_.alpha, static_cast<int64_t>(categorical.size())));
        DRIFTWATCH_LOG_INFO("Categorical family: {} tests ({}), corrected alpha {:.6g}",
                            categorical.size(),
                            CategoricalTestToString(options_.categorical_test),
                            *report.categorical_alpha);
    }

    const auto numeric_comparator = CreateNumericComparator();
    const auto categorical_comparator = CreateCategoricalComparator(options_.categorical_test);

    std::vector<OutcomeTask> tasks;
    tasks.reserve(partition_.Size());
    for (size_t i = 0; i < numeric.size(); ++i) {
        tasks.emplace_back([&, i]() {
            return MakeOutcome(numeric[i], data::FeatureKind::kNumeric,
                               numeric_comparator->Kind(),
                               numeric_comparator->Compare(numeric_columns[i].first.values,
                                                           numeric_columns[i].second.values,
                                                           *report.numeric_alpha));
        });
    }
    for (size_t i = 0; i < categorical.size(); ++i) {
        tasks.emplace_back([&, i]() {
            return MakeOutcome(categorical[i], data::FeatureKind::kCategorical,
                               categorical_comparator->Kind(),
                               categorical_comparator->Compare(categorical_columns[i].first,
                                                               categorical_columns[i].second,
                                                               *report.categorical_alpha));
        });
    }

    std::vector<absl::StatusOr<FeatureOutcome>> results;
    if (options_.num_workers > 1 && tasks.size() > 1) {
        // Results come back in task order, so outcomes keep partition order
        ThreadPool pool(std::min(options_.num_workers, tasks.size()));
        results = pool.RunInOrder(tasks);
    } else {
        results.reserve(tasks.size());
        for (const auto& task : tasks) {
            results.push_back(task());
        }
    }

    report.outcomes.reserve(results.size());
    for (auto& result : results) {
        if (!result.ok()) {
            return result.status();
        }
        report.outcomes.push_back(*std::move(result));
    }

    for (const auto& outcome : report.outcomes) {
        if (outcome.status != OutcomeStatus::kDrift) {
            continue;
        }
        DRIFTWATCH_LOG_WARN("Drift detected in '{}' ({}): p={:.6g} against alpha {:.6g}",
                            outcome.feature_name, TestKindToString(outcome.test_kind),
                            outcome.result->p_value, outcome.result->corrected_alpha);
        report.events.push_back(DriftEvent{outcome.feature_name, outcome.test_kind,
                                           *outcome.result});
    }

    DRIFTWATCH_LOG_INFO("Evaluated {} features: {} drifted, {} skipped",
                        report.outcomes.size(), report.events.size(), report.SkippedCount());
    return report;
}

absl::StatusOr<SummaryReport> DriftMonitor::Summary() const {
    DRIFTWATCH_RETURN_IF_ERROR(options_.Validate());
    DRIFTWATCH_RETURN_IF_ERROR(ValidateInputs());

    SummaryReport summary;
    DRIFTWATCH_ASSIGN_OR_RETURN(
        summary.percent_change,
        ComputePercentChange(baseline_, comparison_, partition_.Numeric()));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        summary.null_rates,
        ComputeNullRates(baseline_, comparison_, baseline_.Columns()));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        summary.jensen_shannon,
        ComputeJensenShannon(baseline_, comparison_, partition_.Numeric(),
                             options_.jensen_shannon));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        summary.baseline_categorical,
        SummarizeCategorical(baseline_, partition_.Categorical()));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        summary.comparison_categorical,
        SummarizeCategorical(comparison_, partition_.Categorical()));

    for (const auto& js : summary.jensen_shannon) {
        if (js.exceeds_threshold) {
            DRIFTWATCH_LOG_INFO("Jensen-Shannon distance of '{}' is {:.4f} (threshold {:.4f})",
                                js.feature, js.distance, options_.jensen_shannon.threshold);
        }
    }
    return summary;
}

}  // namespace driftwatch::drift
