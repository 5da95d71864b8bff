// =============================================================================
// xz-blocks - Error Handling Framework Implementation
// =============================================================================

#include "xzb/common/error.h"

#include <format>
#include <sstream>

namespace xzb {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (blockIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "block: " << *blockIndex;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// XZBException Implementation
// =============================================================================

void XZBException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Message Formatting Helpers
// =============================================================================

std::string UnsupportedCheckTypeError::formatUnsupportedCheck(std::uint8_t checkId) {
    return std::format("unsupported check type: 0x{:x}", checkId);
}

std::string SizeMismatchError::formatSizeMismatch(std::uint64_t expected, std::uint64_t actual) {
    return std::format("size mismatch: expected {} bytes, got {}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException(ErrorContext context) const {
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_, std::move(context));
        case ErrorCode::kIOError:
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kSeekFailed:
            throw IOError(code_, message_, std::move(context));
        case ErrorCode::kFormatError:
            throw FormatError(message_, std::move(context));
        case ErrorCode::kInvalidMagic:
            throw InvalidMagicError(message_, std::move(context));
        case ErrorCode::kUnsupportedCheckType:
            throw UnsupportedCheckTypeError(message_, std::move(context));
        case ErrorCode::kUnsupportedBlockFormat:
            throw UnsupportedBlockFormatError(message_, std::move(context));
        case ErrorCode::kMalformedVarint:
            throw MalformedVarintError(message_, std::move(context));
        case ErrorCode::kSizeMismatch:
            throw SizeMismatchError(message_, std::move(context));
        case ErrorCode::kIndexMarker:
            throw IndexMarkerError(message_, std::move(context));
        case ErrorCode::kOutOfRange:
            throw OutOfRangeError(message_, std::move(context));
        case ErrorCode::kDecompressionFailed:
            throw DecompressionError(message_, std::move(context));
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw XZBException(ErrorCode::kSuccess, message_);
    }
    throw XZBException(code_, message_, std::move(context));
}

}  // namespace xzb
