// =============================================================================
// xz-blocks - Error Handling Tests
// =============================================================================
// Unit tests for error codes, the exception hierarchy, error context
// formatting and Result-to-exception conversion.
// =============================================================================

#include "xzb/common/error.h"

#include <gtest/gtest.h>

#include <string>

namespace xzb {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesMatchEnumValues) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidMagic), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kSeekFailed), 13);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kMalformedVarint), "malformed varint");
    EXPECT_EQ(errorCodeToString(ErrorCode::kIndexMarker), "index marker");
    EXPECT_EQ(errorCodeToString(ErrorCode::kOutOfRange), "out of range");
}

TEST(ErrorCodeTest, SuccessPredicates) {
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_FALSE(isError(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kSizeMismatch));
}

// =============================================================================
// ErrorContext Tests
// =============================================================================

TEST(ErrorContextTest, FormatIncludesAllFields) {
    ErrorContext ctx("data.xz");
    ctx.withBlock(3).withOffset(0x40);

    const std::string text = ctx.format();
    EXPECT_NE(text.find("data.xz"), std::string::npos);
    EXPECT_NE(text.find("3"), std::string::npos);
    EXPECT_NE(text.find("0x40"), std::string::npos);
}

TEST(ErrorContextTest, WhatCarriesContext) {
    const InvalidMagicError error("bad signature", ErrorContext("input.xz").withOffset(0));

    EXPECT_TRUE(error.hasContext());
    EXPECT_EQ(error.message(), "bad signature");
    EXPECT_NE(std::string(error.what()).find("bad signature"), std::string::npos);
    EXPECT_NE(std::string(error.what()).find("input.xz"), std::string::npos);
}

// =============================================================================
// Exception Hierarchy Tests
// =============================================================================

TEST(ExceptionTest, FormatErrorsShareBase) {
    EXPECT_THROW(throw InvalidMagicError("x"), FormatError);
    EXPECT_THROW(throw UnsupportedCheckTypeError("x"), FormatError);
    EXPECT_THROW(throw UnsupportedBlockFormatError("x"), FormatError);
    EXPECT_THROW(throw MalformedVarintError("x"), FormatError);
    EXPECT_THROW(throw SizeMismatchError("x"), FormatError);
}

TEST(ExceptionTest, IndexMarkerIsNotAFormatError) {
    try {
        throw IndexMarkerError("index");
    } catch (const FormatError&) {
        FAIL() << "IndexMarkerError must not be a FormatError";
    } catch (const XZBException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kIndexMarker);
    }
}

TEST(ExceptionTest, UnsupportedCheckTypeRecordsId) {
    const UnsupportedCheckTypeError error(std::uint8_t{0x03}, ErrorContext("f.xz"));

    ASSERT_TRUE(error.checkId().has_value());
    EXPECT_EQ(*error.checkId(), 0x03);
    EXPECT_EQ(error.code(), ErrorCode::kUnsupportedCheckType);
}

TEST(ExceptionTest, SizeMismatchRecordsCounts) {
    const SizeMismatchError error(12, 5, ErrorContext("f.xz"));

    EXPECT_EQ(error.expected(), 12u);
    EXPECT_EQ(error.actual(), 5u);
    EXPECT_EQ(error.exitCode(), toExitCode(ErrorCode::kSizeMismatch));
}

TEST(ExceptionTest, IOErrorKeepsSpecificCode) {
    const IOError error(ErrorCode::kFileOpenFailed, "cannot open");
    EXPECT_EQ(error.code(), ErrorCode::kFileOpenFailed);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, UnwrapReturnsValue) {
    Result<int> result = 42;
    EXPECT_EQ(unwrapOrThrow(std::move(result)), 42);
}

TEST(ResultTest, UnwrapThrowsTypedException) {
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kMalformedVarint, "bad")),
                 MalformedVarintError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kSizeMismatch, "bad")),
                 SizeMismatchError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kDecompressionFailed, "bad")),
                 DecompressionError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kOutOfRange, "bad")),
                 OutOfRangeError);
}

TEST(ResultTest, UnwrapAttachesContext) {
    try {
        (void)unwrapOrThrow(makeError<int>(ErrorCode::kMalformedVarint, "bad"),
                            ErrorContext("stream.xz").withOffset(12));
        FAIL() << "expected an exception";
    } catch (const MalformedVarintError& e) {
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->filePath, "stream.xz");
        EXPECT_EQ(e.context()->byteOffset, 12u);
    }
}

}  // namespace
}  // namespace xzb
