/// @file error_test.cpp
/// @brief Tests for driftwatch error codes and status macros

#include <gtest/gtest.h>

#include "common/error.h"

namespace driftwatch {
namespace {

TEST(ErrorTest, DriftCodesMapToAbslCodes) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kSchemaMismatch), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kInsufficientData), absl::StatusCode::kOutOfRange);
    EXPECT_EQ(ToAbslCode(ErrorCode::kInvalidConfiguration),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(ToAbslCode(ErrorCode::kOk), absl::StatusCode::kOk);
}

TEST(ErrorTest, PayloadCarriesExactCode) {
    auto status = SchemaMismatchError("column 'price' missing");

    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "column 'price' missing");
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kSchemaMismatch);
    EXPECT_TRUE(IsSchemaMismatch(status));
    EXPECT_FALSE(IsInsufficientData(status));
    EXPECT_FALSE(IsInvalidConfiguration(status));
}

TEST(ErrorTest, HelpersProduceDistinctCodes) {
    EXPECT_TRUE(IsInsufficientData(InsufficientDataError("one category")));
    EXPECT_TRUE(IsInvalidConfiguration(InvalidConfigurationError("alpha")));
}

TEST(ErrorTest, PlainAbslStatusFallsBackToStatusCode) {
    auto status = absl::InvalidArgumentError("bad");

    EXPECT_EQ(GetErrorCode(status), ErrorCode::kInvalidArgument);
    EXPECT_FALSE(IsSchemaMismatch(status));
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
    EXPECT_EQ(GetErrorCode(absl::DataLossError("x")), ErrorCode::kUnknown);
}

TEST(ErrorTest, ErrorCodeToString) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kSchemaMismatch), "schema_mismatch");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kInsufficientData), "insufficient_data");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kInvalidConfiguration), "invalid_configuration");
}

absl::StatusOr<int> ParsePositive(int value) {
    DRIFTWATCH_CHECK_OR_RETURN(value > 0, InvalidConfigurationError("not positive"));
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    DRIFTWATCH_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status Validate(int value) {
    DRIFTWATCH_RETURN_IF_ERROR(Doubled(value).status());
    return absl::OkStatus();
}

TEST(ErrorTest, MacrosPropagateStatus) {
    auto ok = Doubled(21);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 42);

    auto failed = Doubled(-1);
    ASSERT_FALSE(failed.ok());
    EXPECT_TRUE(IsInvalidConfiguration(failed.status()));

    EXPECT_TRUE(Validate(3).ok());
    EXPECT_TRUE(IsInvalidConfiguration(Validate(0)));
}

}  // namespace
}  // namespace driftwatch
