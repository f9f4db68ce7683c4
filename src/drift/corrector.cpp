#include "drift/corrector.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftwatch::drift {

absl::Status ValidateAlpha(double family_alpha) {
    // Written so that NaN fails the check
    if (!(family_alpha > 0.0 && family_alpha <= 1.0)) {
        return InvalidConfigurationError(
            absl::StrCat("Family alpha must be in (0, 1], got ", family_alpha));
    }
    return absl::OkStatus();
}

absl::StatusOr<double> CorrectedAlpha(double family_alpha, int64_t test_count) {
    DRIFTWATCH_RETURN_IF_ERROR(ValidateAlpha(family_alpha));
    if (test_count <= 0) {
        return InvalidConfigurationError(
            absl::StrCat("Test count must be positive, got ", test_count));
    }
    return family_alpha / static_cast<double>(test_count);
}

}  // namespace driftwatch::drift
