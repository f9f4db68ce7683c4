/// @file summary_reporter.cpp
/// @brief Descriptive diagnostics implementation

#include "drift/summary_reporter.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

#include "common/error.h"
#include "common/logging.h"

namespace driftwatch::drift {

namespace {

std::array<double, kSummaryStatistics.size()> StatisticValues(const stats::DescriptiveStats& s) {
    return {s.count, s.mean, s.std, s.min, s.q25, s.q50, s.q75, s.max};
}

double NullPercent(size_t nulls, size_t records) {
    if (records == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(nulls) / static_cast<double>(records);
}

}  // namespace

std::optional<double> PercentChange::Get(std::string_view statistic) const {
    for (const auto& [name, value] : percent) {
        if (name == statistic) {
            return value;
        }
    }
    return std::nullopt;
}

double PercentDifference(double baseline, double comparison) {
    if (std::isnan(baseline) || std::isnan(comparison)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return 100.0 * std::abs(baseline - comparison) /
           (std::abs(baseline) + kPercentChangeEpsilon);
}

absl::StatusOr<std::vector<PercentChange>> ComputePercentChange(
    const data::Window& baseline,
    const data::Window& comparison,
    const std::vector<std::string>& numeric_features) {

    std::vector<PercentChange> rows;
    rows.reserve(numeric_features.size());

    for (const auto& feature : numeric_features) {
        DRIFTWATCH_ASSIGN_OR_RETURN(auto base_column, baseline.NumericValues(feature));
        DRIFTWATCH_ASSIGN_OR_RETURN(auto comp_column, comparison.NumericValues(feature));

        PercentChange row;
        row.feature = feature;
        row.baseline = stats::Describe(std::move(base_column.values));
        row.comparison = stats::Describe(std::move(comp_column.values));

        const auto base_values = StatisticValues(row.baseline);
        const auto comp_values = StatisticValues(row.comparison);
        row.percent.reserve(kSummaryStatistics.size());
        for (size_t i = 0; i < kSummaryStatistics.size(); ++i) {
            row.percent.emplace_back(std::string(kSummaryStatistics[i]),
                                     PercentDifference(base_values[i], comp_values[i]));
        }

        rows.push_back(std::move(row));
    }

    return rows;
}

absl::StatusOr<std::vector<NullRate>> ComputeNullRates(
    const data::Window& baseline,
    const data::Window& comparison,
    const std::vector<std::string>& features) {

    std::vector<NullRate> rows;
    rows.reserve(features.size());

    for (const auto& feature : features) {
        DRIFTWATCH_ASSIGN_OR_RETURN(size_t base_nulls, baseline.NullCount(feature));
        DRIFTWATCH_ASSIGN_OR_RETURN(size_t comp_nulls, comparison.NullCount(feature));

        rows.push_back(NullRate{
            feature,
            NullPercent(base_nulls, baseline.NumRecords()),
            NullPercent(comp_nulls, comparison.NumRecords()),
        });
    }

    return rows;
}

absl::StatusOr<std::vector<JensenShannonResult>> ComputeJensenShannon(
    const data::Window& baseline,
    const data::Window& comparison,
    const std::vector<std::string>& numeric_features,
    const JensenShannonOptions& options) {

    if (options.bins == 0) {
        return InvalidConfigurationError("Jensen-Shannon bin count must be positive");
    }

    std::vector<JensenShannonResult> rows;
    rows.reserve(numeric_features.size());

    for (const auto& feature : numeric_features) {
        DRIFTWATCH_ASSIGN_OR_RETURN(auto base_column, baseline.NumericValues(feature));
        DRIFTWATCH_ASSIGN_OR_RETURN(auto comp_column, comparison.NumericValues(feature));

        const auto& base = base_column.values;
        const auto& comp = comp_column.values;
        if (base.empty() || comp.empty()) {
            DRIFTWATCH_LOG_DEBUG("Jensen-Shannon: skipping '{}' (empty window)", feature);
            continue;
        }

        const auto [base_min, base_max] = std::minmax_element(base.begin(), base.end());
        const auto [comp_min, comp_max] = std::minmax_element(comp.begin(), comp.end());
        const double lo = std::min(*base_min, *comp_min);
        const double hi = std::max(*base_max, *comp_max);

        const auto p = stats::NormalizedHistogram(base, lo, hi, options.bins);
        const auto q = stats::NormalizedHistogram(comp, lo, hi, options.bins);

        JensenShannonResult row;
        row.feature = feature;
        row.distance = stats::JensenShannonDistance(p, q);
        row.exceeds_threshold = row.distance > options.threshold;
        rows.push_back(std::move(row));
    }

    return rows;
}

absl::StatusOr<std::vector<CategoricalSummary>> SummarizeCategorical(
    const data::Window& window,
    const std::vector<std::string>& categorical_features) {

    std::vector<CategoricalSummary> rows;
    rows.reserve(categorical_features.size());

    for (const auto& feature : categorical_features) {
        DRIFTWATCH_ASSIGN_OR_RETURN(auto categories, window.Categories(feature));

        CategoricalSummary row;
        row.feature = feature;

        std::map<std::string, size_t> counts;
        for (const auto& category : categories) {
            if (!category.has_value()) {
                ++row.missing_count;
                continue;
            }
            ++counts[*category];
        }

        row.distinct_count = counts.size();
        size_t best = 0;
        for (const auto& [label, count] : counts) {
            if (count > best) {
                best = count;
                row.mode = label;
            }
        }

        rows.push_back(std::move(row));
    }

    return rows;
}

}  // namespace driftwatch::drift
