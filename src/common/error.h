#pragma once

/// @file error.h
/// @brief driftwatch error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace driftwatch {

/// @brief Error codes specific to driftwatch
///
/// Generic codes map one-to-one onto absl::StatusCode. The drift codes
/// share absl codes with other failures, so the exact code is also
/// attached to the status as a payload (see GetErrorCode).
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kInternal,

    // Drift engine error codes
    kSchemaMismatch,        ///< Windows disagree on schema, or a feature is missing
    kInsufficientData,      ///< A single feature cannot be tested
    kInvalidConfiguration,  ///< Bad alpha, test count or option value
};

/// @brief Payload type URL carrying the ErrorCode of a driftwatch status
inline constexpr std::string_view kErrorCodePayloadUrl =
    "type.driftwatch.dev/driftwatch.ErrorCode";

/// @brief Convert driftwatch error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error code
std::string_view ErrorCodeToString(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the driftwatch error code of a status
///
/// Falls back to the generic code matching the absl code when the status
/// was not created by MakeError.
ErrorCode GetErrorCode(const absl::Status& status);

inline absl::Status SchemaMismatchError(std::string_view message) {
    return MakeError(ErrorCode::kSchemaMismatch, message);
}

inline absl::Status InsufficientDataError(std::string_view message) {
    return MakeError(ErrorCode::kInsufficientData, message);
}

inline absl::Status InvalidConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidConfiguration, message);
}

inline bool IsSchemaMismatch(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kSchemaMismatch;
}

inline bool IsInsufficientData(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kInsufficientData;
}

inline bool IsInvalidConfiguration(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kInvalidConfiguration;
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTWATCH_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTWATCH_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    DRIFTWATCH_ASSIGN_OR_RETURN_IMPL(                                          \
        DRIFTWATCH_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTWATCH_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTWATCH_CONCAT(a, b) DRIFTWATCH_CONCAT_IMPL(a, b)
#define DRIFTWATCH_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTWATCH_CHECK_OR_RETURN(condition, error_status)                    \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace driftwatch
