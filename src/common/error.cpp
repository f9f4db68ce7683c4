#include "error.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace driftwatch {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kSchemaMismatch:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kInvalidConfiguration:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
        case ErrorCode::kInsufficientData:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "ok";
        case ErrorCode::kInvalidArgument:
            return "invalid_argument";
        case ErrorCode::kNotFound:
            return "not_found";
        case ErrorCode::kFailedPrecondition:
            return "failed_precondition";
        case ErrorCode::kOutOfRange:
            return "out_of_range";
        case ErrorCode::kInternal:
            return "internal";
        case ErrorCode::kSchemaMismatch:
            return "schema_mismatch";
        case ErrorCode::kInsufficientData:
            return "insufficient_data";
        case ErrorCode::kInvalidConfiguration:
            return "invalid_configuration";
        case ErrorCode::kUnknown:
        default:
            return "unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(absl::string_view(kErrorCodePayloadUrl.data(), kErrorCodePayloadUrl.size()),
                          absl::Cord(absl::StrCat(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    auto payload = status.GetPayload(absl::string_view(kErrorCodePayloadUrl.data(), kErrorCodePayloadUrl.size()));
    if (payload.has_value()) {
        int value = 0;
        if (absl::SimpleAtoi(std::string(*payload), &value) &&
            value > static_cast<int>(ErrorCode::kOk) &&
            value <= static_cast<int>(ErrorCode::kInvalidConfiguration)) {
            return static_cast<ErrorCode>(value);
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kOutOfRange:
            return ErrorCode::kOutOfRange;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace driftwatch
