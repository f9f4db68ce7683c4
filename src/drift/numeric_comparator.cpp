/// @file numeric_comparator.cpp
/// @brief Kolmogorov-Smirnov comparator implementation

#include "drift/numeric_comparator.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/stats.h"

namespace driftwatch::drift {

namespace {

std::vector<double> DropNulls(const std::vector<double>& values) {
    std::vector<double> kept;
    kept.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(kept),
                 [](double v) { return !std::isnan(v); });
    return kept;
}

}  // namespace

absl::StatusOr<TestResult> KolmogorovSmirnovComparator::Compare(
    const std::vector<double>& baseline,
    const std::vector<double>& comparison,
    double corrected_alpha) const {

    std::vector<double> base = DropNulls(baseline);
    std::vector<double> comp = DropNulls(comparison);

    if (base.size() < kMinSamples) {
        return InsufficientDataError(absl::StrCat(
            "Baseline window has ", base.size(), " non-null values, need ", kMinSamples));
    }
    if (comp.size() < kMinSamples) {
        return InsufficientDataError(absl::StrCat(
            "Comparison window has ", comp.size(), " non-null values, need ", kMinSamples));
    }

    const size_t n1 = base.size();
    const size_t n2 = comp.size();

    TestResult result;
    result.statistic = stats::KolmogorovSmirnovStatistic(std::move(base), std::move(comp));
    result.p_value = stats::KolmogorovSmirnovPValue(result.statistic, n1, n2);
    result.corrected_alpha = corrected_alpha;
    result.is_drift = result.p_value <= corrected_alpha;

    DRIFTWATCH_LOG_TRACE("KS: n1={}, n2={}, D={:.6f}, p={:.6g}, alpha={:.6g}",
                         n1, n2, result.statistic, result.p_value, corrected_alpha);
    return result;
}

std::unique_ptr<NumericComparator> CreateNumericComparator() {
    return std::make_unique<KolmogorovSmirnovComparator>();
}

}  // namespace driftwatch::drift
