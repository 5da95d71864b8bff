// =============================================================================
// xz-blocks - LZMA2 Block Payload Decoder
// =============================================================================
// Binding to liblzma's raw decoder for a single-filter LZMA2 chain.
//
// Block payloads are decoded with one fixed filter configuration derived from
// an LZMA preset (the preset only determines the dictionary size the decoder
// allocates). The decoder is stateless between calls and safe to share across
// threads.
// =============================================================================

#ifndef XZB_ALGO_LZMA2_DECODER_H
#define XZB_ALGO_LZMA2_DECODER_H

#include <cstdint>
#include <span>

#include "xzb/common/error.h"
#include "xzb/common/types.h"

namespace xzb::algo {

/// @brief Default preset for the fixed LZMA2 filter configuration.
inline constexpr std::uint32_t kDefaultLzmaPreset = 7;

/// @brief Highest preset liblzma accepts (without the extreme flag).
inline constexpr std::uint32_t kMaxLzmaPreset = 9;

/// @brief Raw LZMA2 decoder for block payloads.
class Lzma2Decoder {
public:
    /// @brief Create a decoder using the given preset's LZMA2 options.
    /// @throws InvalidArgumentError if liblzma rejects the preset.
    explicit Lzma2Decoder(std::uint32_t preset = kDefaultLzmaPreset);

    /// @brief Decode a raw LZMA2 payload.
    /// @param compressed Exact compressed bytes of one block (no padding).
    /// @param expectedSize Number of bytes the payload must decode to.
    /// @return Decoded bytes, kDecompressionFailed if liblzma rejects the
    ///         input, or kSizeMismatch if the output length differs from
    ///         expectedSize.
    [[nodiscard]] Result<ByteBuffer> decode(std::span<const std::uint8_t> compressed,
                                            std::uint64_t expectedSize) const;

    /// @brief Preset the filter options were derived from.
    [[nodiscard]] std::uint32_t preset() const noexcept { return preset_; }

    /// @brief Dictionary size of the fixed filter configuration.
    [[nodiscard]] std::uint32_t dictionarySize() const noexcept { return dictionarySize_; }

private:
    std::uint32_t preset_;
    std::uint32_t dictionarySize_ = 0;
};

}  // namespace xzb::algo

#endif  // XZB_ALGO_LZMA2_DECODER_H
