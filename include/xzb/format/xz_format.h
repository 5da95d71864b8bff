// =============================================================================
// xz-blocks - XZ Container Format Definitions
// =============================================================================
// Binary layout constants for the parts of the .xz container this library
// reads.
//
// File Layout (single stream):
// +----------------+
// | Stream Header  |  (12 bytes)
// +----------------+
// |    Block 0     |  header | compressed data | padding | check
// +----------------+
// |      ...       |
// +----------------+
// |    Block N     |
// +----------------+
// |     Index      |  (first byte 0x00, not parsed)
// +----------------+
// | Stream Footer  |  (12 bytes, not parsed)
// +----------------+
//
// Stream Header:
//   [0..6)   magic  FD 37 7A 58 5A 00
//   [6..8)   stream flags (byte 6 reserved, low nibble of byte 7 = check id)
//   [8..12)  CRC32 of the stream flags
//
// Block Header:
//   [0]      size indicator s, header length = s * 4 + 4 (0 => index)
//   [1]      block flags
//   [2..)    compressed size (varint), uncompressed size (varint),
//            filter flags, zero padding
//   last 4   CRC32 of the header
// =============================================================================

#ifndef XZB_FORMAT_XZ_FORMAT_H
#define XZB_FORMAT_XZ_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "xzb/common/types.h"

namespace xzb::format {

// =============================================================================
// Stream Header Constants
// =============================================================================

/// @brief Stream header magic bytes.
inline constexpr std::array<std::uint8_t, 6> kStreamMagic = {
    0xFD, '7', 'z', 'X', 'Z', 0x00
};

/// @brief Total stream header size.
inline constexpr std::size_t kStreamHeaderSize = 12;

/// @brief Offset of the flags byte holding the check id.
inline constexpr std::size_t kStreamCheckFlagOffset = 7;

/// @brief Mask selecting the check id within the flags byte.
inline constexpr std::uint8_t kCheckIdMask = 0x0F;

/// @brief Size of the CRC32 that ends the stream and block headers.
inline constexpr std::size_t kHeaderCrcSize = 4;

// =============================================================================
// Block Header Constants
// =============================================================================

/// @brief Size indicator value that marks the index instead of a block.
inline constexpr std::uint8_t kIndexIndicator = 0x00;

/// @brief Offset of the block flags byte.
inline constexpr std::size_t kBlockFlagsOffset = 1;

/// @brief Offset of the first size field.
inline constexpr std::size_t kBlockSizeFieldsOffset = 2;

/// @brief Block flag bits.
namespace block_flags {

/// @brief Bits 0-1: number of filters minus one.
inline constexpr std::uint8_t kFilterCountMask = 0x03;

/// @brief Bit 6: compressed size field present.
inline constexpr std::uint8_t kHasCompressedSize = 0x40;

/// @brief Bit 7: uncompressed size field present.
inline constexpr std::uint8_t kHasUncompressedSize = 0x80;

}  // namespace block_flags

/// @brief Alignment of compressed payloads and block headers.
inline constexpr std::uint64_t kBlockAlignment = 4;

/// @brief Maximum encoded length of a size field (63-bit value).
inline constexpr std::size_t kMaxVarintBytes = 9;

// =============================================================================
// Helper Functions
// =============================================================================

/// @brief Validate stream header magic bytes.
[[nodiscard]] constexpr bool validateMagic(std::span<const std::uint8_t> header) noexcept {
    if (header.size() < kStreamMagic.size()) {
        return false;
    }
    for (std::size_t i = 0; i < kStreamMagic.size(); ++i) {
        if (header[i] != kStreamMagic[i]) {
            return false;
        }
    }
    return true;
}

/// @brief Header length encoded by a size indicator byte.
[[nodiscard]] constexpr std::size_t blockHeaderLength(std::uint8_t sizeIndicator) noexcept {
    return static_cast<std::size_t>(sizeIndicator) * 4 + 4;
}

/// @brief Round a byte count up to the next multiple of 4.
[[nodiscard]] constexpr std::uint64_t padToAlignment(std::uint64_t size) noexcept {
    return (size + (kBlockAlignment - 1)) & ~(kBlockAlignment - 1);
}

/// @brief Map a check id to its on-disk check size.
/// @return Size in bytes, or nullopt for ids this library does not support.
[[nodiscard]] constexpr std::optional<std::size_t> checkSizeFor(std::uint8_t checkId) noexcept {
    switch (static_cast<CheckType>(checkId)) {
        case CheckType::kCrc32:
            return 4;
        case CheckType::kCrc64:
            return 8;
        case CheckType::kSha256:
            return 32;
        default:
            return std::nullopt;
    }
}

}  // namespace xzb::format

#endif  // XZB_FORMAT_XZ_FORMAT_H
