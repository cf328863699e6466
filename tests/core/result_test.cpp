#include "scingest/core/error.hpp"
#include "scingest/core/result.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

using namespace scingest;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err(std::string("not positive"));
    }
    return Ok(value);
}

Result<void> require_positive(int value, const std::string& name) {
    if (value <= 0) {
        return Err(name + " not positive");
    }
    return Ok();
}

Result<void> check_all(int a, int b) {
    auto first = parse_positive(a);
    if (first.is_error()) {
        return Err(std::move(first.error()));
    }
    auto checked = first_error({require_positive(a, "a"), require_positive(b, "b")});
    if (checked.is_error()) {
        return Err(std::move(checked.error()));
    }
    return Ok();
}

} // namespace

TEST(ResultTest, OkCarriesValue) {
    auto result = parse_positive(7);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 7);
}

TEST(ResultTest, ErrCarriesError) {
    auto result = parse_positive(-1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "not positive");
    EXPECT_EQ(result.value_or(42), 42);
}

TEST(ResultTest, SameTypeForValueAndError) {
    Result<std::string, std::string> ok = Ok(std::string("value"));
    Result<std::string, std::string> err = Err(std::string("error"));
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, ErrorsPropagateExplicitly) {
    EXPECT_TRUE(check_all(1, 2).is_ok());

    auto failed = check_all(0, 5);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error(), "not positive");

    auto second = check_all(1, 0);
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error(), "b not positive");
}

TEST(ResultTest, FirstErrorReportsEarliestFailure) {
    Result<void> ok = Ok();
    Result<void> late = Err(std::string("late"));
    Result<void> early = Err(std::string("early"));

    EXPECT_TRUE(first_error({ok, ok}).is_ok());
    EXPECT_TRUE(first_error<std::string>({}).is_ok());
    auto failed = first_error({ok, early, late});
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error(), "early");
}

TEST(ResultTest, UploadErrorDescribeIncludesChunk) {
    const UploadError error = make_error(ErrorCode::ChunkUploadFailed, "gave up", 4);
    EXPECT_EQ(error.describe(), "ChunkUploadFailed (chunk 4): gave up");
    EXPECT_EQ(make_error(ErrorCode::NotFound, "").describe(), "NotFound");
}

TEST(ResultTest, ErrorCodeNamesRoundTrip) {
    for (auto code : {ErrorCode::InvalidConfig, ErrorCode::NotFound, ErrorCode::ChunkRejected,
                      ErrorCode::ChunkUploadFailed, ErrorCode::IntegrityError, ErrorCode::InvalidTransition,
                      ErrorCode::TimeoutExceeded, ErrorCode::CancelledByUser, ErrorCode::PayloadTooLarge,
                      ErrorCode::IoError, ErrorCode::ConversionFailed}) {
        auto parsed = error_code_from_string(to_string(code));
        ASSERT_TRUE(parsed.has_value()) << to_string(code);
        EXPECT_EQ(*parsed, code);
    }
    EXPECT_FALSE(error_code_from_string("Bogus").has_value());
}

TEST(ResultTest, OnlyExhaustionAndTimeoutAreTransient) {
    EXPECT_TRUE(is_transient(ErrorCode::ChunkUploadFailed));
    EXPECT_TRUE(is_transient(ErrorCode::TimeoutExceeded));
    EXPECT_FALSE(is_transient(ErrorCode::IntegrityError));
    EXPECT_FALSE(is_transient(ErrorCode::CancelledByUser));
    EXPECT_FALSE(is_transient(ErrorCode::ConversionFailed));
}
