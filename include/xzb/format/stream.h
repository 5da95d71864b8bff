// =============================================================================
// xz-blocks - XZ Stream Reader
// =============================================================================
// Reader for a single-stream .xz file with random access to its blocks.
//
// This module provides:
// - StreamOptions: reader configuration
// - Stream: validates the stream header and lazily discovers blocks
//
// Blocks are found by walking the file: each block's end offset is the next
// block's start, until the index indicator (a zero size byte) is reached. The
// walk happens only as far as a request needs it, and its result is kept.
//
// Usage:
//   Stream stream("/path/to/file.xz");
//   for (BlockIndex i = 0; i < stream.blockCount(); ++i) {
//       auto block = stream.getBlock(i);
//       auto data = block->uncompressedData();
//       // process *data...
//   }
//
// Thread Safety:
// - All member functions are thread-safe. Index growth is serialized by an
//   index mutex; raw source access by the SharedSource mutex.
// =============================================================================

#ifndef XZB_FORMAT_STREAM_H
#define XZB_FORMAT_STREAM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "xzb/algo/lzma2_decoder.h"
#include "xzb/common/error.h"
#include "xzb/common/types.h"
#include "xzb/format/block.h"
#include "xzb/format/xz_format.h"
#include "xzb/io/source.h"

namespace xzb::format {

// =============================================================================
// Stream Options
// =============================================================================

/// @brief Reader configuration.
struct StreamOptions {
    /// @brief Reject a stream whose magic bytes do not match.
    /// @note When false, the mismatch is logged as a warning and parsing
    ///       continues.
    bool strictMagic = true;

    /// @brief Preset for the fixed LZMA2 decoder configuration.
    std::uint32_t lzmaPreset = algo::kDefaultLzmaPreset;
};

// =============================================================================
// Stream Class
// =============================================================================

/// @brief A single XZ stream with a lazily built block index.
class Stream {
public:
    /// @brief Raw stream header bytes.
    using HeaderBytes = std::array<std::uint8_t, kStreamHeaderSize>;

    /// @brief Open and parse the stream at a path (owned source).
    /// @throws IOError if the file cannot be opened or read.
    /// @throws InvalidMagicError if the magic mismatches and strictMagic is set.
    /// @throws UnsupportedCheckTypeError if the check type is not supported.
    /// @throws FormatError (or derived) if the first block header is invalid.
    explicit Stream(const std::filesystem::path& path, StreamOptions options = {});

    /// @brief Parse a stream from a caller-owned std::istream (borrowed source).
    /// @note The stream must outlive this Stream and every Block it returns.
    explicit Stream(std::istream& stream, StreamOptions options = {});

    /// @brief Parse a stream from an arbitrary source handle.
    explicit Stream(std::unique_ptr<io::SourceHandle> handle, StreamOptions options = {});

    ~Stream() = default;

    // Non-copyable, non-movable (owns the index mutex)
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;
    Stream(Stream&&) = delete;
    Stream& operator=(Stream&&) = delete;

    // =========================================================================
    // Block Access
    // =========================================================================

    /// @brief Get block n (0-based), discovering blocks up to n as needed.
    /// @return The block; it stays valid after the Stream is destroyed.
    /// @throws OutOfRangeError if the stream has n or fewer blocks.
    /// @throws FormatError (or derived) if a block header on the way is invalid.
    [[nodiscard]] std::shared_ptr<const Block> getBlock(BlockIndex n);

    /// @brief Total number of blocks in the stream.
    /// @note Walks to the index on the first call; later calls are free.
    [[nodiscard]] std::uint64_t blockCount();

    /// @brief Number of blocks discovered so far.
    [[nodiscard]] std::size_t discoveredBlockCount() const;

    /// @brief Whether the index indicator has been reached.
    [[nodiscard]] bool isSealed() const;

    // =========================================================================
    // Stream Metadata
    // =========================================================================

    /// @brief Raw 12-byte stream header.
    [[nodiscard]] const HeaderBytes& header() const noexcept { return header_; }

    /// @brief Whether the header carries the XZ magic bytes.
    [[nodiscard]] bool hasValidMagic() const noexcept { return magicValid_; }

    /// @brief Integrity check type declared by the stream flags.
    [[nodiscard]] CheckType checkType() const noexcept { return checkType_; }

    /// @brief Size of each block's check field.
    [[nodiscard]] std::size_t checkSize() const noexcept { return checkSize_; }

    /// @brief Name of the underlying source.
    [[nodiscard]] const std::string& sourceName() const noexcept { return source_->name(); }

    /// @brief Reader configuration in effect.
    [[nodiscard]] const StreamOptions& options() const noexcept { return options_; }

private:
    /// @brief Read and validate the stream header, then find the first block.
    void open();

    /// @brief Append the block after the last known one.
    /// @return false once the index indicator has been reached.
    /// @note Caller holds indexMutex_.
    bool extendIndexLocked();

    StreamOptions options_;
    std::shared_ptr<io::SharedSource> source_;
    std::shared_ptr<const algo::Lzma2Decoder> decoder_;

    HeaderBytes header_{};
    bool magicValid_ = false;
    CheckType checkType_ = CheckType::kNone;
    std::size_t checkSize_ = 0;

    mutable std::mutex indexMutex_;
    std::vector<std::shared_ptr<const Block>> index_;
    std::optional<std::uint64_t> blockCount_;
};

}  // namespace xzb::format

#endif  // XZB_FORMAT_STREAM_H
