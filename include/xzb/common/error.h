// =============================================================================
// xz-blocks - Error Handling Framework
// =============================================================================
// Error handling for the xz-blocks library.
//
// This module provides:
// - ErrorCode enum (values double as process exit codes)
// - XZBException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, block, offset) support
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef XZB_COMMON_ERROR_H
#define XZB_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace xzb {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for all library failures.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid argument value.
    kInvalidArgument = 1,

    /// @brief I/O error.
    /// @note Read failure, short read on a header, etc.
    kIOError = 2,

    /// @brief Generic structural error in the container.
    kFormatError = 3,

    /// @brief Stream header signature mismatch.
    kInvalidMagic = 4,

    /// @brief Check type nibble outside the supported table.
    kUnsupportedCheckType = 5,

    /// @brief Block header lacks an embedded compressed or uncompressed size.
    kUnsupportedBlockFormat = 6,

    /// @brief Variable-length size field is corrupt or overruns the header.
    kMalformedVarint = 7,

    /// @brief Bytes read or decoded differ from the header-declared length.
    kSizeMismatch = 8,

    /// @brief Size indicator 0x00 found where a block header was expected.
    kIndexMarker = 9,

    /// @brief Block index beyond the stream's block count.
    kOutOfRange = 10,

    /// @brief Decode primitive rejected the payload.
    kDecompressionFailed = 11,

    /// @brief Failed to open file.
    kFileOpenFailed = 12,

    /// @brief Seek operation failed.
    kSeekFailed = 13
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kInvalidMagic:
            return "invalid magic";
        case ErrorCode::kUnsupportedCheckType:
            return "unsupported check type";
        case ErrorCode::kUnsupportedBlockFormat:
            return "unsupported block format";
        case ErrorCode::kMalformedVarint:
            return "malformed varint";
        case ErrorCode::kSizeMismatch:
            return "size mismatch";
        case ErrorCode::kIndexMarker:
            return "index marker";
        case ErrorCode::kOutOfRange:
            return "out of range";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kSeekFailed:
            return "seek failed";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Records where in the container an error was detected.
struct ErrorContext {
    /// @brief Source name (file path or borrowed-stream label).
    std::string filePath;

    /// @brief Block index where the error occurred (if applicable).
    std::optional<std::uint64_t> blockIndex;

    /// @brief Byte offset in the source where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the block index.
    /// @return Reference to this for method chaining.
    ErrorContext& withBlock(std::uint64_t index) {
        blockIndex = index;
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all xz-blocks errors.
/// @note Provides error code, message, and optional context.
class XZBException : public std::exception {
public:
    /// @brief Construct with error code and message.
    XZBException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    XZBException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~XZBException() override = default;

    XZBException(const XZBException&) = default;
    XZBException(XZBException&&) noexcept = default;
    XZBException& operator=(const XZBException&) = default;
    XZBException& operator=(XZBException&&) noexcept = default;

    /// @brief Get the formatted message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for invalid arguments.
class InvalidArgumentError : public XZBException {
public:
    explicit InvalidArgumentError(std::string message)
        : XZBException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : XZBException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors.
/// @note Thrown for open failures, seek failures and short header reads.
class IOError : public XZBException {
public:
    IOError(std::string message, ErrorContext context)
        : XZBException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a specific I/O error code and context.
    IOError(ErrorCode code, std::string message, ErrorContext context)
        : XZBException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for structural errors in the container.
/// @note Base class of every specific format error below, so callers may
///       catch FormatError to handle any malformed-input condition.
class FormatError : public XZBException {
public:
    explicit FormatError(std::string message)
        : XZBException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : XZBException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}

protected:
    FormatError(ErrorCode code, std::string message)
        : XZBException(code, std::move(message)) {}

    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : XZBException(code, std::move(message), std::move(context)) {}
};

/// @brief Stream header signature does not match the XZ magic bytes.
class InvalidMagicError : public FormatError {
public:
    explicit InvalidMagicError(std::string message)
        : FormatError(ErrorCode::kInvalidMagic, std::move(message)) {}

    InvalidMagicError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kInvalidMagic, std::move(message), std::move(context)) {}
};

/// @brief Check type nibble has no entry in the check size table.
class UnsupportedCheckTypeError : public FormatError {
public:
    explicit UnsupportedCheckTypeError(std::string message)
        : FormatError(ErrorCode::kUnsupportedCheckType, std::move(message)) {}

    UnsupportedCheckTypeError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kUnsupportedCheckType, std::move(message),
                      std::move(context)) {}

    /// @brief Construct with the offending check id.
    UnsupportedCheckTypeError(std::uint8_t checkId, ErrorContext context)
        : FormatError(ErrorCode::kUnsupportedCheckType, formatUnsupportedCheck(checkId),
                      std::move(context)),
          checkId_(checkId) {}

    /// @brief Get the unsupported check id (if available).
    [[nodiscard]] std::optional<std::uint8_t> checkId() const noexcept { return checkId_; }

private:
    static std::string formatUnsupportedCheck(std::uint8_t checkId);

    std::optional<std::uint8_t> checkId_;
};

/// @brief Block header lacks an embedded compressed or uncompressed size.
class UnsupportedBlockFormatError : public FormatError {
public:
    explicit UnsupportedBlockFormatError(std::string message)
        : FormatError(ErrorCode::kUnsupportedBlockFormat, std::move(message)) {}

    UnsupportedBlockFormatError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kUnsupportedBlockFormat, std::move(message),
                      std::move(context)) {}
};

/// @brief Variable-length size field is corrupt or overruns its buffer.
class MalformedVarintError : public FormatError {
public:
    explicit MalformedVarintError(std::string message)
        : FormatError(ErrorCode::kMalformedVarint, std::move(message)) {}

    MalformedVarintError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kMalformedVarint, std::move(message), std::move(context)) {}
};

/// @brief Byte count read or decoded differs from the declared size.
class SizeMismatchError : public FormatError {
public:
    explicit SizeMismatchError(std::string message)
        : FormatError(ErrorCode::kSizeMismatch, std::move(message)) {}

    SizeMismatchError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kSizeMismatch, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual byte counts.
    SizeMismatchError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : FormatError(ErrorCode::kSizeMismatch, formatSizeMismatch(expected, actual),
                      std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatSizeMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Sentinel: a zero size indicator byte marks the index record.
/// @note Used by Stream to stop block discovery; it is not a parse error.
class IndexMarkerError : public XZBException {
public:
    explicit IndexMarkerError(std::string message)
        : XZBException(ErrorCode::kIndexMarker, std::move(message)) {}

    IndexMarkerError(std::string message, ErrorContext context)
        : XZBException(ErrorCode::kIndexMarker, std::move(message), std::move(context)) {}
};

/// @brief Requested block index is beyond the stream's block count.
class OutOfRangeError : public XZBException {
public:
    explicit OutOfRangeError(std::string message)
        : XZBException(ErrorCode::kOutOfRange, std::move(message)) {}

    OutOfRangeError(std::string message, ErrorContext context)
        : XZBException(ErrorCode::kOutOfRange, std::move(message), std::move(context)) {}
};

/// @brief Decode primitive failed on a block payload.
class DecompressionError : public XZBException {
public:
    explicit DecompressionError(std::string message)
        : XZBException(ErrorCode::kDecompressionFailed, std::move(message)) {}

    DecompressionError(std::string message, ErrorContext context)
        : XZBException(ErrorCode::kDecompressionFailed, std::move(message),
                       std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    /// @param context Context attached to the thrown exception.
    [[noreturn]] void throwException(ErrorContext context = ErrorContext{}) const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @param result The result to check.
/// @param context Context attached to the exception on failure.
/// @return The value if successful.
/// @throws XZBException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result, ErrorContext context = ErrorContext{}) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException(std::move(context));
}

}  // namespace xzb

#endif  // XZB_COMMON_ERROR_H
