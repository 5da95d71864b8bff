// =============================================================================
// xz-blocks - XZ Block
// =============================================================================
// One block of an XZ stream: its parsed header and lazily read payloads.
//
// A Block reads and decodes its header when constructed. Payloads are read
// from the source (and decoded) on first request and handed out as shared
// handles; the Block itself keeps only weak references, so a payload stays in
// memory exactly as long as some caller holds it.
//
// Block geometry (offsets relative to the source):
//   offset()                                   header start
//   offset() + headerLength()                  compressed payload
//   ... + compressedSizePadded()               check field (checkSize() bytes)
//   endOffset()                                next block or the index
//
// Thread Safety:
// - All member functions are thread-safe; source reads go through the
//   SharedSource lock and decoding runs outside it.
// =============================================================================

#ifndef XZB_FORMAT_BLOCK_H
#define XZB_FORMAT_BLOCK_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "xzb/algo/lzma2_decoder.h"
#include "xzb/common/error.h"
#include "xzb/common/types.h"
#include "xzb/common/weak_cache.h"
#include "xzb/io/source.h"

namespace xzb::format {

/// @brief Shared handle to a block payload.
using PayloadHandle = std::shared_ptr<const ByteBuffer>;

/// @brief A single XZ block.
class Block {
public:
    /// @brief Read and decode the block header at offset.
    /// @param source Shared source of the enclosing stream.
    /// @param offset Absolute offset of the block header.
    /// @param checkSize Size of the per-block check field for this stream.
    /// @param decoder Payload decoder; a default one is created when null.
    /// @throws IndexMarkerError if the byte at offset is the index indicator.
    /// @throws UnsupportedBlockFormatError if either size field is absent.
    /// @throws MalformedVarintError if a size field is corrupt.
    /// @throws SizeMismatchError if the header is cut short by end of data.
    /// @throws FormatError if no byte exists at offset.
    Block(std::shared_ptr<io::SharedSource> source, FileOffset offset, std::size_t checkSize,
          std::shared_ptr<const algo::Lzma2Decoder> decoder = nullptr);

    // Non-copyable, non-movable (payload caches own mutexes)
    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;
    Block(Block&&) = delete;
    Block& operator=(Block&&) = delete;

    // =========================================================================
    // Header Fields
    // =========================================================================

    /// @brief Absolute offset of the block header.
    [[nodiscard]] FileOffset offset() const noexcept { return offset_; }

    /// @brief Header length including the size byte and the trailing CRC32.
    [[nodiscard]] std::size_t headerLength() const noexcept { return header_.size(); }

    /// @brief Raw block flags byte.
    [[nodiscard]] std::uint8_t flags() const noexcept { return header_[kFlagsIndex]; }

    /// @brief Number of filters declared by the flags (1-4).
    [[nodiscard]] std::size_t filterCount() const noexcept;

    [[nodiscard]] bool hasCompressedSize() const noexcept;
    [[nodiscard]] bool hasUncompressedSize() const noexcept;

    /// @brief Exact compressed payload size, excluding padding.
    [[nodiscard]] std::uint64_t compressedSize() const noexcept { return compressedSize_; }

    /// @brief Compressed payload size rounded up to a multiple of 4.
    [[nodiscard]] std::uint64_t compressedSizePadded() const noexcept {
        return compressedSizePadded_;
    }

    /// @brief Size the payload decodes to.
    [[nodiscard]] std::uint64_t uncompressedSize() const noexcept { return uncompressedSize_; }

    /// @brief Size of the check field following the padded payload.
    [[nodiscard]] std::size_t checkSize() const noexcept { return checkSize_; }

    /// @brief Offset immediately after this block (start of the next block).
    [[nodiscard]] FileOffset endOffset() const noexcept { return endOffset_; }

    /// @brief Raw header bytes.
    [[nodiscard]] std::span<const std::uint8_t> header() const noexcept { return header_; }

    /// @brief Header CRC32 field (last 4 header bytes, not verified).
    [[nodiscard]] std::span<const std::uint8_t> headerCrc32() const noexcept;

    // =========================================================================
    // Payload Access
    // =========================================================================

    /// @brief Read the check field (not verified).
    /// @throws SizeMismatchError if the source ends inside the field.
    [[nodiscard]] ByteBuffer checkBytes() const;

    /// @brief Exact compressed payload bytes.
    /// @throws SizeMismatchError if the source ends inside the payload.
    [[nodiscard]] PayloadHandle compressedData() const;

    /// @brief Decoded payload bytes.
    /// @throws DecompressionError if the payload cannot be decoded.
    /// @throws SizeMismatchError if the decoded length differs from uncompressedSize().
    [[nodiscard]] PayloadHandle uncompressedData() const;

    /// @brief Whether a compressed payload is currently held by some caller.
    [[nodiscard]] bool isCompressedDataResident() const { return compressedCache_.isResident(); }

    /// @brief Whether a decoded payload is currently held by some caller.
    [[nodiscard]] bool isUncompressedDataResident() const {
        return uncompressedCache_.isResident();
    }

    /// @brief How many times the decoded payload has been materialized.
    [[nodiscard]] std::uint64_t decodeCount() const { return uncompressedCache_.computeCount(); }

private:
    static constexpr std::size_t kFlagsIndex = 1;

    [[nodiscard]] ErrorContext context() const;

    std::shared_ptr<io::SharedSource> source_;
    std::shared_ptr<const algo::Lzma2Decoder> decoder_;

    FileOffset offset_;
    std::size_t checkSize_;
    ByteBuffer header_;

    std::uint64_t compressedSize_ = 0;
    std::uint64_t compressedSizePadded_ = 0;
    std::uint64_t uncompressedSize_ = 0;
    FileOffset endOffset_ = 0;

    mutable WeakCache<ByteBuffer> compressedCache_;
    mutable WeakCache<ByteBuffer> uncompressedCache_;
};

}  // namespace xzb::format

#endif  // XZB_FORMAT_BLOCK_H
