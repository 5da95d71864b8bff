// =============================================================================
// xz-blocks - Test Fixtures
// =============================================================================
// Builders for synthetic and liblzma-encoded XZ streams used across the tests.
//
// XzStreamBuilder lays out a complete single-stream .xz image:
//   stream header | blocks | index | stream footer
// Blocks are either synthetic (hand-written header, arbitrary payload bytes)
// or real (encoded by liblzma's block encoder), so header parsing and payload
// decoding can both be exercised.
// =============================================================================

#ifndef XZB_TESTS_SUPPORT_XZ_FIXTURE_H
#define XZB_TESTS_SUPPORT_XZ_FIXTURE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include "xzb/common/types.h"
#include "xzb/io/source.h"

namespace xzb::test {

// =============================================================================
// Block Description
// =============================================================================

/// @brief Description of a synthetic block.
struct BlockSpec {
    /// @brief Declared compressed size.
    std::uint64_t compressedSize = 0;

    /// @brief Declared uncompressed size.
    std::uint64_t uncompressedSize = 0;

    /// @brief Block flags byte (default: one filter, both sizes present).
    std::uint8_t flags = 0xC0;

    /// @brief Payload written after the header; filled with a pattern of
    ///        compressedSize bytes when empty.
    ByteBuffer payload;

    /// @brief Replaces the encoded size fields verbatim when set.
    std::optional<ByteBuffer> rawSizeFields;

    /// @brief Extra zero padding bytes inside the header.
    std::size_t extraHeaderPadding = 0;
};

/// @brief Build the header bytes for a synthetic block.
[[nodiscard]] ByteBuffer buildBlockHeader(const BlockSpec& spec);

/// @brief Encode bytes with the variable-length size encoding.
[[nodiscard]] ByteBuffer encodeSizeField(std::uint64_t value);

// =============================================================================
// Stream Builder
// =============================================================================

/// @brief Assembles a single-stream .xz image.
class XzStreamBuilder {
public:
    /// @brief Start a stream using the given check id.
    explicit XzStreamBuilder(std::uint8_t checkId = 0x01);

    /// @brief Replace the first magic byte so the signature mismatches.
    XzStreamBuilder& corruptMagic();

    /// @brief Append a synthetic block.
    XzStreamBuilder& addBlock(BlockSpec spec);

    /// @brief Append a block encoded by liblzma (LZMA2, the stream's check).
    XzStreamBuilder& addEncodedBlock(std::span<const std::uint8_t> data, std::uint32_t preset = 6);

    /// @brief Stop after the blocks: no index or footer is written.
    XzStreamBuilder& omitIndex();

    /// @brief Produce the image.
    [[nodiscard]] ByteBuffer build() const;

    /// @brief Start offsets of every block in the built image.
    [[nodiscard]] const std::vector<FileOffset>& blockOffsets() const noexcept {
        return blockOffsets_;
    }

    /// @brief Offset of the index indicator in the built image.
    [[nodiscard]] FileOffset indexOffset() const noexcept;

    /// @brief Header lengths of every block.
    [[nodiscard]] const std::vector<std::size_t>& headerLengths() const noexcept {
        return headerLengths_;
    }

    /// @brief Check size the builder uses for this stream's check id.
    [[nodiscard]] std::size_t checkSize() const noexcept { return checkSize_; }

private:
    struct Record {
        std::uint64_t unpaddedSize;
        std::uint64_t uncompressedSize;
    };

    void appendBlockBytes(const ByteBuffer& bytes, std::size_t headerLength, Record record);

    std::uint8_t checkId_;
    std::size_t checkSize_;
    bool corruptMagic_ = false;
    bool omitIndex_ = false;
    ByteBuffer blocks_;
    std::vector<FileOffset> blockOffsets_;
    std::vector<std::size_t> headerLengths_;
    std::vector<Record> records_;
};

// =============================================================================
// liblzma Helpers
// =============================================================================

/// @brief Encode data as a complete .xz file with liblzma's stream encoder.
[[nodiscard]] ByteBuffer encodeXzFile(std::span<const std::uint8_t> data, std::uint8_t checkId,
                                      std::uint32_t preset = 6);

/// @brief Encode data with liblzma's streaming encoder.
/// @note Streaming blocks do not record their sizes in the block header.
[[nodiscard]] ByteBuffer encodeXzStreaming(std::span<const std::uint8_t> data,
                                           std::uint8_t checkId, std::uint32_t preset = 6);

/// @brief Encode data as a raw LZMA2 payload.
[[nodiscard]] ByteBuffer encodeLzma2Raw(std::span<const std::uint8_t> data,
                                        std::uint32_t preset = 6);

/// @brief Decode a complete .xz image with liblzma's stream decoder.
[[nodiscard]] ByteBuffer decodeXzFile(std::span<const std::uint8_t> image);

// =============================================================================
// Data and File Helpers
// =============================================================================

/// @brief Deterministic data with some repetition (compresses well).
[[nodiscard]] ByteBuffer compressibleBytes(std::size_t size, std::uint32_t seed);

/// @brief Generate a unique temporary file path.
[[nodiscard]] std::filesystem::path tempFilePath();

/// @brief Write bytes to a file.
void writeFile(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);

/// @brief In-memory image readable through a SharedSource.
class MemoryImage {
public:
    explicit MemoryImage(const ByteBuffer& bytes, std::string name = "memory")
        : stream_(std::string(bytes.begin(), bytes.end())),
          source_(std::make_shared<io::SharedSource>(
              std::make_unique<io::BorrowedSource>(stream_, std::move(name)))) {}

    MemoryImage(const MemoryImage&) = delete;
    MemoryImage& operator=(const MemoryImage&) = delete;

    [[nodiscard]] const std::shared_ptr<io::SharedSource>& source() const noexcept {
        return source_;
    }

private:
    std::istringstream stream_;
    std::shared_ptr<io::SharedSource> source_;
};

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace xzb::test

#endif  // XZB_TESTS_SUPPORT_XZ_FIXTURE_H
