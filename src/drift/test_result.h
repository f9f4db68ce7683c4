#pragma once

/// @file test_result.h
/// @brief Per-feature test results and drift events

#include <optional>
#include <string>
#include <string_view>

#include "data/window.h"

namespace driftwatch::drift {

/// @brief Statistical test applied to a feature
enum class TestKind {
    kKolmogorovSmirnov,       ///< Two-sample KS, numeric features
    kChiSquaredContingency,   ///< Two-way chi-squared independence test
    kChiSquaredGoodnessOfFit  ///< One-way chi-squared against baseline counts
};

/// @brief Convert test kind to string
std::string_view TestKindToString(TestKind kind);

/// @brief Outcome of one hypothesis test
struct TestResult {
    double statistic = 0.0;
    double p_value = 1.0;
    double corrected_alpha = 0.0;  ///< Family threshold the verdict used
    bool is_drift = false;
};

/// @brief Notification for one feature found to have drifted
struct DriftEvent {
    std::string feature_name;
    TestKind test_kind = TestKind::kKolmogorovSmirnov;
    TestResult result;
};

/// @brief Per-feature status of a monitoring run
enum class OutcomeStatus {
    kDrift,
    kNoDrift,
    kSkipped  ///< Not enough data to run the test
};

/// @brief Convert outcome status to string
std::string_view OutcomeStatusToString(OutcomeStatus status);

/// @brief Everything a run learned about one feature
struct FeatureOutcome {
    std::string feature_name;
    data::FeatureKind feature_kind = data::FeatureKind::kNumeric;
    TestKind test_kind = TestKind::kKolmogorovSmirnov;
    OutcomeStatus status = OutcomeStatus::kNoDrift;

    /// Absent when the feature was skipped
    std::optional<TestResult> result;

    /// Why the feature was skipped (empty otherwise)
    std::string skip_reason;
};

}  // namespace driftwatch::drift
