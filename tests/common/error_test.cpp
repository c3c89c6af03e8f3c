// =============================================================================
// lci - Error Handling Tests
// =============================================================================

#include "lci/common/error.h"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

namespace lci {
namespace {

TEST(ErrorTest, ExitCodesFollowErrorCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumMismatch), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kDecodeError), 12);
}

TEST(ErrorTest, TruncatedErrorCarriesCounts) {
    const TruncatedError e("chunk body", 100, 42);
    EXPECT_EQ(e.code(), ErrorCode::kTruncated);
    EXPECT_EQ(e.expected().value(), 100u);
    EXPECT_EQ(e.got().value(), 42u);
    EXPECT_NE(std::string(e.what()).find("100"), std::string::npos);
}

TEST(ErrorTest, BadMagicErrorReportsValue) {
    const BadMagicError e(0xDEADBEEF, ErrorContext{}.withOffset(0));
    EXPECT_EQ(e.code(), ErrorCode::kBadMagic);
    EXPECT_EQ(e.actual(), 0xDEADBEEFu);
    EXPECT_NE(std::string(e.what()).find("deadbeef"), std::string::npos);
}

TEST(ErrorTest, ErrorValueRoundTripsToException) {
    const Error error(ErrorCode::kTruncatedEntry, "entry 3 truncated");
    try {
        error.throwException();
        FAIL() << "expected an exception";
    } catch (const LCIException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kTruncatedEntry);
        EXPECT_EQ(e.message(), "entry 3 truncated");
    }
}

TEST(ErrorTest, ErrorValueKeepsSubclassForDecodeFailures) {
    EXPECT_THROW(Error(ErrorCode::kDecodeError, "bad deflate").throwException(), CodecError);
    EXPECT_THROW(Error(ErrorCode::kDirectoryDecodeError, "bad count").throwException(),
                 FormatError);
    EXPECT_THROW(Error(ErrorCode::kTruncated, "short").throwException(), TruncatedError);
}

TEST(ErrorTest, CodesWithoutSubclassThrowBaseException) {
    try {
        Error(ErrorCode::kChecksumMismatch, "stored 1, computed 2").throwException();
        FAIL() << "expected an exception";
    } catch (const LCIException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kChecksumMismatch);
        EXPECT_EQ(e.exitCode(), 5);
    }
}

TEST(ErrorTest, ContextFormatsFileAndOffset) {
    ErrorContext ctx("chunk.bin");
    ctx.withOffset(128);
    const std::string text = ctx.format();
    EXPECT_NE(text.find("file: chunk.bin"), std::string::npos);
    EXPECT_NE(text.find("offset: 0x80"), std::string::npos);
}

TEST(ErrorTest, SystemErrorIsPartOfMessage) {
    const IOError e("Failed to stat chunk.bin",
                    std::make_error_code(std::errc::no_such_file_or_directory));
    EXPECT_EQ(e.code(), ErrorCode::kIOError);
    EXPECT_NE(e.message().find("Failed to stat chunk.bin: "), std::string::npos);
}

}  // namespace
}  // namespace lci
