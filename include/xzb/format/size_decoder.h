// =============================================================================
// xz-blocks - Size Field Decoder
// =============================================================================
// Decoder for the variable-length integers used by XZ block headers.
//
// Encoding: little-endian base-128. Each byte carries 7 value bits; the high
// bit is set on every byte except the last one. A value fits in at most
// kMaxVarintBytes bytes, and a multi-byte encoding never ends in 0x00.
//
// Usage:
//   auto decoded = decodeSize(headerBytes, cursor);
//   if (!decoded) { ... decoded.error().code() == ErrorCode::kMalformedVarint }
//   cursor += decoded->bytesConsumed;
// =============================================================================

#ifndef XZB_FORMAT_SIZE_DECODER_H
#define XZB_FORMAT_SIZE_DECODER_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "xzb/common/error.h"

namespace xzb::format {

/// @brief Largest value a size field can hold (63 bits).
inline constexpr std::uint64_t kMaxSizeValue = UINT64_MAX / 2;

/// @brief A decoded size field.
struct DecodedSize {
    /// @brief Decoded integer.
    std::uint64_t value = 0;

    /// @brief Number of bytes the encoding occupied.
    std::size_t bytesConsumed = 0;
};

/// @brief Decode one size field.
/// @param data Buffer holding the field; decoding never reads past its end.
/// @param position Index of the field's first byte within data.
/// @return The decoded value and its length, or kMalformedVarint when the
///         field is unterminated within data, longer than kMaxVarintBytes,
///         or ends with a zero continuation byte.
[[nodiscard]] Result<DecodedSize> decodeSize(std::span<const std::uint8_t> data,
                                             std::size_t position);

/// @brief Encode a size field.
/// @param value Value to encode (at most kMaxSizeValue).
/// @param output Output buffer with room for kMaxVarintBytes bytes.
/// @return Number of bytes written.
[[nodiscard]] std::size_t encodeSize(std::uint64_t value, std::uint8_t* output) noexcept;

}  // namespace xzb::format

#endif  // XZB_FORMAT_SIZE_DECODER_H
