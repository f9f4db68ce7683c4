/// @file categorical_comparator.cpp
/// @brief Chi-squared comparator implementations

#include "drift/categorical_comparator.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/stats.h"

namespace driftwatch::drift {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

absl::Status CheckTestable(const ContingencyTable& table) {
    if (table.BaselineTotal() <= 0.0) {
        return InsufficientDataError("Baseline window has no observations");
    }
    if (table.ComparisonTotal() <= 0.0) {
        return InsufficientDataError("Comparison window has no observations");
    }
    if (table.NumCategories() < 2) {
        return InsufficientDataError(absl::StrCat(
            "Found ", table.NumCategories(), " distinct categories, need at least 2"));
    }
    return absl::OkStatus();
}

}  // namespace

// =============================================================================
// ContingencyTable
// =============================================================================

ContingencyTable ContingencyTable::Build(const std::vector<data::Category>& baseline,
                                         const std::vector<data::Category>& comparison) {
    // std::nullopt orders before every label, so nulls land in column 0
    std::map<data::Category, std::pair<double, double>> counts;
    for (const auto& category : baseline) {
        counts[category].first += 1.0;
    }
    for (const auto& category : comparison) {
        counts[category].second += 1.0;
    }

    ContingencyTable table;
    table.categories_.reserve(counts.size());
    table.baseline_counts_.reserve(counts.size());
    table.comparison_counts_.reserve(counts.size());
    for (const auto& [category, count] : counts) {
        table.categories_.push_back(category);
        table.baseline_counts_.push_back(count.first);
        table.comparison_counts_.push_back(count.second);
    }
    return table;
}

double ContingencyTable::BaselineTotal() const {
    return std::accumulate(baseline_counts_.begin(), baseline_counts_.end(), 0.0);
}

double ContingencyTable::ComparisonTotal() const {
    return std::accumulate(comparison_counts_.begin(), comparison_counts_.end(), 0.0);
}

// =============================================================================
// CategoricalTest
// =============================================================================

absl::StatusOr<CategoricalTest> CategoricalTestFromString(std::string_view name) {
    std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "contingency" || lowered == "two_way") {
        return CategoricalTest::kContingency;
    }
    if (lowered == "goodness_of_fit" || lowered == "one_way") {
        return CategoricalTest::kGoodnessOfFit;
    }
    return InvalidConfigurationError(absl::StrCat(
        "Unknown categorical test '", absl::string_view(name.data(), name.size()), "' (expected contingency or goodness_of_fit)"));
}

std::string_view CategoricalTestToString(CategoricalTest test) {
    switch (test) {
        case CategoricalTest::kContingency:
            return "contingency";
        case CategoricalTest::kGoodnessOfFit:
            return "goodness_of_fit";
        default:
            return "unknown";
    }
}

// =============================================================================
// ChiSquaredContingencyComparator
// =============================================================================

absl::StatusOr<TestResult> ChiSquaredContingencyComparator::Compare(
    const std::vector<data::Category>& baseline,
    const std::vector<data::Category>& comparison,
    double corrected_alpha) const {
    return CompareTable(ContingencyTable::Build(baseline, comparison), corrected_alpha);
}

absl::StatusOr<TestResult> ChiSquaredContingencyComparator::CompareTable(
    const ContingencyTable& table, double corrected_alpha) const {
    DRIFTWATCH_RETURN_IF_ERROR(CheckTestable(table));

    const double row_totals[2] = {table.BaselineTotal(), table.ComparisonTotal()};
    const double grand_total = row_totals[0] + row_totals[1];
    const std::vector<double>* rows[2] = {&table.BaselineCounts(), &table.ComparisonCounts()};

    const size_t dof = table.NumCategories() - 1;
    const bool yates = dof == 1;

    double chi_squared = 0.0;
    for (size_t col = 0; col < table.NumCategories(); ++col) {
        const double col_total = (*rows[0])[col] + (*rows[1])[col];
        for (size_t row = 0; row < 2; ++row) {
            const double expected = row_totals[row] * col_total / grand_total;
            double observed = (*rows[row])[col];
            if (yates) {
                const double diff = expected - observed;
                const double step = std::min(0.5, std::abs(diff));
                observed += diff > 0.0 ? step : -step;
            }
            const double residual = observed - expected;
            chi_squared += residual * residual / expected;
        }
    }

    TestResult result;
    result.statistic = chi_squared;
    result.p_value = stats::ChiSquaredSurvival(chi_squared, static_cast<double>(dof));
    result.corrected_alpha = corrected_alpha;
    result.is_drift = result.p_value < corrected_alpha;

    DRIFTWATCH_LOG_TRACE("Chi-squared contingency: K={}, yates={}, chi2={:.6f}, p={:.6g}",
                         table.NumCategories(), yates, chi_squared, result.p_value);
    return result;
}

// =============================================================================
// ChiSquaredGoodnessOfFitComparator
// =============================================================================

absl::StatusOr<TestResult> ChiSquaredGoodnessOfFitComparator::Compare(
    const std::vector<data::Category>& baseline,
    const std::vector<data::Category>& comparison,
    double corrected_alpha) const {
    return CompareTable(ContingencyTable::Build(baseline, comparison), corrected_alpha);
}

absl::StatusOr<TestResult> ChiSquaredGoodnessOfFitComparator::CompareTable(
    const ContingencyTable& table, double corrected_alpha) const {
    DRIFTWATCH_RETURN_IF_ERROR(CheckTestable(table));

    const auto& expected = table.BaselineCounts();
    const auto& observed = table.ComparisonCounts();

    double chi_squared = 0.0;
    for (size_t i = 0; i < table.NumCategories(); ++i) {
        if (expected[i] == 0.0) {
            // Category is new in the comparison window
            chi_squared = kInfinity;
            break;
        }
        const double residual = observed[i] - expected[i];
        chi_squared += residual * residual / expected[i];
    }

    const size_t dof = table.NumCategories() - 1;

    TestResult result;
    result.statistic = chi_squared;
    result.p_value = std::isinf(chi_squared)
                         ? 0.0
                         : stats::ChiSquaredSurvival(chi_squared, static_cast<double>(dof));
    result.corrected_alpha = corrected_alpha;
    result.is_drift = result.p_value < corrected_alpha;

    DRIFTWATCH_LOG_TRACE("Chi-squared goodness of fit: K={}, chi2={:.6f}, p={:.6g}",
                         table.NumCategories(), chi_squared, result.p_value);
    return result;
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<CategoricalComparator> CreateCategoricalComparator(CategoricalTest test) {
    switch (test) {
        case CategoricalTest::kGoodnessOfFit:
            return std::make_unique<ChiSquaredGoodnessOfFitComparator>();
        case CategoricalTest::kContingency:
        default:
            return std::make_unique<ChiSquaredContingencyComparator>();
    }
}

}  // namespace driftwatch::drift
