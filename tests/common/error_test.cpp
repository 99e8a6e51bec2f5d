// =============================================================================
// rcp-packager - Error Framework and Logger Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "rcp/common/error.h"
#include "rcp/common/logger.h"

namespace rcp::test {

TEST(ErrorTest, ExitCodeCategories) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kUnknownField), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kColumnLengthMismatch), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kOutputTooLarge), 5);
}

TEST(ErrorTest, WhatCarriesCodeAndContext) {
    const IOError error("Failed to open file: a.bin", ErrorContext("a.bin"));
    const std::string what = error.what();
    EXPECT_NE(what.find("[I/O error]"), std::string::npos);
    EXPECT_NE(what.find("file: a.bin"), std::string::npos);
    EXPECT_EQ(error.message(), "Failed to open file: a.bin");
}

TEST(ErrorTest, FieldErrorsRecordFieldNumber) {
    const UnknownFieldError error("Index", 9);
    EXPECT_EQ(error.message(), "Index: unexpected field 9");
    ASSERT_TRUE(error.hasContext());
    EXPECT_EQ(error.context()->fieldNumber, 9U);

    const OutputTooLargeError tooLarge(2048, 1024);
    EXPECT_EQ(tooLarge.requested(), 2048U);
    EXPECT_EQ(tooLarge.limit(), 1024U);
}

TEST(ErrorTest, TryExecuteCapturesExceptions) {
    const auto ok = tryExecute([] { return 7; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 7);

    const auto failed = tryExecute([]() -> int { throw ChecksumError("bad digest"); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kChecksumError);
    EXPECT_EQ(failed.error().message(), "bad digest");
    EXPECT_EQ(failed.error().exitCode(), 4);
}

TEST(ErrorTest, UnwrapOrThrowRethrowsByCategory) {
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kFormatError, "x")),
                 RCPException);
    EXPECT_EQ(unwrapOrThrow(Result<int>{3}), 3);
}

TEST(LoggerTest, VerbosityMapping) {
    EXPECT_EQ(log::levelFromVerbosity(0, false), log::Level::kInfo);
    EXPECT_EQ(log::levelFromVerbosity(1, false), log::Level::kDebug);
    EXPECT_EQ(log::levelFromVerbosity(3, false), log::Level::kTrace);
    EXPECT_EQ(log::levelFromVerbosity(2, true), log::Level::kError);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(log::levelFromString("WARN"), log::Level::kWarning);
    EXPECT_EQ(log::levelFromString("bogus"), log::Level::kInfo);
    EXPECT_EQ(log::levelToString(log::Level::kCritical), "critical");
}

}  // namespace rcp::test
