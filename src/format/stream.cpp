// =============================================================================
// xz-blocks - XZ Stream Reader Implementation
// =============================================================================

#include "xzb/format/stream.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "xzb/common/logger.h"

namespace xzb::format {

// =============================================================================
// Construction
// =============================================================================

Stream::Stream(const std::filesystem::path& path, StreamOptions options)
    : Stream(std::make_unique<io::FileSource>(path), options) {}

Stream::Stream(std::istream& stream, StreamOptions options)
    : Stream(std::make_unique<io::BorrowedSource>(stream), options) {}

Stream::Stream(std::unique_ptr<io::SourceHandle> handle, StreamOptions options)
    : options_(options),
      source_(std::make_shared<io::SharedSource>(std::move(handle))),
      decoder_(std::make_shared<const algo::Lzma2Decoder>(options.lzmaPreset)) {
    open();
}

void Stream::open() {
    const ByteBuffer raw = source_->readAt(0, kStreamHeaderSize);
    if (raw.size() != kStreamHeaderSize) {
        throw SizeMismatchError(kStreamHeaderSize, raw.size(),
                                ErrorContext(source_->name()).withOffset(0));
    }
    std::copy(raw.begin(), raw.end(), header_.begin());

    magicValid_ = validateMagic(header_);
    if (!magicValid_) {
        if (options_.strictMagic) {
            throw InvalidMagicError("Invalid XZ stream header magic",
                                    ErrorContext(source_->name()).withOffset(0));
        }
        XZB_LOG_WARNING("Invalid XZ stream header magic in {}, continuing", source_->name());
    }

    const std::uint8_t checkId = header_[kStreamCheckFlagOffset] & kCheckIdMask;
    const auto checkSize = checkSizeFor(checkId);
    if (!checkSize.has_value()) {
        throw UnsupportedCheckTypeError(checkId, ErrorContext(source_->name()));
    }
    checkType_ = static_cast<CheckType>(checkId);
    checkSize_ = *checkSize;

    XZB_LOG_DEBUG("Opened XZ stream {}: check={}, checkSize={}", source_->name(),
                  checkTypeToString(checkType_), checkSize_);

    std::lock_guard<std::mutex> lock(indexMutex_);
    extendIndexLocked();
}

// =============================================================================
// Block Index
// =============================================================================

bool Stream::extendIndexLocked() {
    if (blockCount_.has_value()) {
        return false;
    }

    const FileOffset next = index_.empty() ? kStreamHeaderSize : index_.back()->endOffset();

    try {
        auto block = std::make_shared<const Block>(source_, next, checkSize_, decoder_);
        XZB_LOG_DEBUG("Discovered block {} at 0x{:x}: compressed={}, uncompressed={}",
                      index_.size(), next, block->compressedSize(), block->uncompressedSize());
        index_.push_back(std::move(block));
        return true;
    } catch (const IndexMarkerError&) {
        blockCount_ = index_.size();
        XZB_LOG_DEBUG("Reached index of {} at 0x{:x}: {} blocks", source_->name(), next,
                      *blockCount_);
        return false;
    }
}

std::shared_ptr<const Block> Stream::getBlock(BlockIndex n) {
    std::lock_guard<std::mutex> lock(indexMutex_);

    while (index_.size() <= n) {
        if (!extendIndexLocked()) {
            throw OutOfRangeError(
                fmt::format("Block {} requested, stream has {} blocks", n, index_.size()),
                ErrorContext(source_->name()).withBlock(n));
        }
    }

    return index_[n];
}

std::uint64_t Stream::blockCount() {
    std::lock_guard<std::mutex> lock(indexMutex_);

    while (extendIndexLocked()) {
    }

    return *blockCount_;
}

std::size_t Stream::discoveredBlockCount() const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    return index_.size();
}

bool Stream::isSealed() const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    return blockCount_.has_value();
}

}  // namespace xzb::format
