// =============================================================================
// xz-blocks - Common Type Definitions
// =============================================================================
// Core type definitions shared by the xz-blocks library.
//
// This module defines:
// - FileOffset, BlockIndex: Type aliases for positions in a stream
// - ByteBuffer: Owned byte storage for headers and payloads
// - CheckType: Integrity check selector from the stream flags
// =============================================================================

#ifndef XZB_COMMON_TYPES_H
#define XZB_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace xzb {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Absolute byte offset within a source.
using FileOffset = std::uint64_t;

/// @brief Zero-based position of a block within a stream.
using BlockIndex = std::uint64_t;

/// @brief Owned byte storage.
using ByteBuffer = std::vector<std::uint8_t>;

// =============================================================================
// Check Type Enumeration
// =============================================================================

/// @brief Integrity check selector (low nibble of the stream flags).
/// @note Values are the on-disk check ids.
enum class CheckType : std::uint8_t {
    kNone = 0x00,
    kCrc32 = 0x01,
    kCrc64 = 0x04,
    kSha256 = 0x0A
};

/// @brief Get the display name of a check type.
[[nodiscard]] constexpr std::string_view checkTypeToString(CheckType type) noexcept {
    switch (type) {
        case CheckType::kNone:
            return "none";
        case CheckType::kCrc32:
            return "crc32";
        case CheckType::kCrc64:
            return "crc64";
        case CheckType::kSha256:
            return "sha256";
    }
    return "unknown";
}

}  // namespace xzb

#endif  // XZB_COMMON_TYPES_H
