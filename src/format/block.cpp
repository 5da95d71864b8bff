// =============================================================================
// xz-blocks - XZ Block Implementation
// =============================================================================

#include "xzb/format/block.h"

#include <string>
#include <utility>

#include "xzb/common/logger.h"
#include "xzb/format/size_decoder.h"
#include "xzb/format/xz_format.h"

namespace xzb::format {

Block::Block(std::shared_ptr<io::SharedSource> source, FileOffset offset, std::size_t checkSize,
             std::shared_ptr<const algo::Lzma2Decoder> decoder)
    : source_(std::move(source)),
      decoder_(decoder ? std::move(decoder) : std::make_shared<const algo::Lzma2Decoder>()),
      offset_(offset),
      checkSize_(checkSize) {
    if (!source_) {
        throw InvalidArgumentError("Block requires a source");
    }

    // Size byte and the rest of the header are read under one lock
    {
        auto lease = source_->acquire();

        header_ = lease.readAt(offset_, 1);
        if (header_.empty()) {
            throw FormatError("Unexpected end of data where a block header was expected",
                              context());
        }
        if (header_[0] == kIndexIndicator) {
            throw IndexMarkerError("Index indicator found instead of a block header", context());
        }

        const std::size_t headerLength = blockHeaderLength(header_[0]);
        ByteBuffer rest = lease.readAt(offset_ + 1, headerLength - 1);
        if (rest.size() != headerLength - 1) {
            throw SizeMismatchError(headerLength, rest.size() + 1, context());
        }
        header_.insert(header_.end(), rest.begin(), rest.end());
    }

    if (!hasCompressedSize() || !hasUncompressedSize()) {
        throw UnsupportedBlockFormatError(
            "Block header does not embed both compressed and uncompressed sizes", context());
    }

    // Size fields may not run into the header CRC32
    const auto fields = std::span<const std::uint8_t>(header_).first(header_.size() -
                                                                     kHeaderCrcSize);
    std::size_t cursor = kBlockSizeFieldsOffset;

    const DecodedSize compressed = unwrapOrThrow(decodeSize(fields, cursor), context());
    cursor += compressed.bytesConsumed;
    const DecodedSize uncompressed = unwrapOrThrow(decodeSize(fields, cursor), context());

    compressedSize_ = compressed.value;
    uncompressedSize_ = uncompressed.value;
    compressedSizePadded_ = padToAlignment(compressedSize_);
    endOffset_ = offset_ + header_.size() + compressedSizePadded_ + checkSize_;
}

std::size_t Block::filterCount() const noexcept {
    return static_cast<std::size_t>(flags() & block_flags::kFilterCountMask) + 1;
}

bool Block::hasCompressedSize() const noexcept {
    return (flags() & block_flags::kHasCompressedSize) != 0;
}

bool Block::hasUncompressedSize() const noexcept {
    return (flags() & block_flags::kHasUncompressedSize) != 0;
}

std::span<const std::uint8_t> Block::headerCrc32() const noexcept {
    return std::span<const std::uint8_t>(header_).last(kHeaderCrcSize);
}

ByteBuffer Block::checkBytes() const {
    const FileOffset checkOffset = offset_ + header_.size() + compressedSizePadded_;
    ByteBuffer check = source_->readAt(checkOffset, checkSize_);
    if (check.size() != checkSize_) {
        throw SizeMismatchError(checkSize_, check.size(),
                                ErrorContext(source_->name()).withOffset(checkOffset));
    }
    return check;
}

PayloadHandle Block::compressedData() const {
    return compressedCache_.getOrCompute([this] {
        XZB_LOG_TRACE("Reading {} compressed bytes of block at 0x{:x}", compressedSize_, offset_);

        ByteBuffer data =
            source_->readAt(offset_ + header_.size(), static_cast<std::size_t>(compressedSize_));
        if (data.size() != compressedSize_) {
            throw SizeMismatchError(compressedSize_, data.size(), context());
        }
        return data;
    });
}

PayloadHandle Block::uncompressedData() const {
    return uncompressedCache_.getOrCompute([this] {
        const PayloadHandle compressed = compressedData();

        XZB_LOG_TRACE("Decoding block at 0x{:x}: {} -> {} bytes", offset_, compressedSize_,
                      uncompressedSize_);

        auto decoded = decoder_->decode(*compressed, uncompressedSize_);
        if (!decoded) {
            XZB_LOG_ERROR("Failed to decode block at 0x{:x} in {}: {}", offset_, source_->name(),
                          decoded.error().message());
            decoded.error().throwException(context());
        }
        return std::move(*decoded);
    });
}

ErrorContext Block::context() const {
    return ErrorContext(source_->name()).withOffset(offset_);
}

}  // namespace xzb::format
