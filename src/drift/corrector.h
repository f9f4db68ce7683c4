#pragma once

/// @file corrector.h
/// @brief Bonferroni multiple-comparison correction

#include <cstdint>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace driftwatch::drift {

/// @brief Default family-wise significance level
inline constexpr double kDefaultFamilyAlpha = 0.05;

/// @brief Require alpha in (0, 1]
/// @return InvalidConfiguration otherwise (NaN included)
absl::Status ValidateAlpha(double family_alpha);

/// @brief Per-test threshold for a family of simultaneous tests
///
/// Returns family_alpha / test_count. The numeric and categorical
/// families are corrected independently; callers compute the value once
/// per family and share it across the family's tests.
/// @return InvalidConfiguration for test_count <= 0 or alpha outside (0, 1]
absl::StatusOr<double> CorrectedAlpha(double family_alpha, int64_t test_count);

}  // namespace driftwatch::drift
