// =============================================================================
// xz-blocks - Byte Sources Implementation
// =============================================================================

#include "xzb/io/source.h"

#include <algorithm>
#include <utility>

#include "xzb/common/error.h"

namespace xzb::io {

namespace {

constexpr std::size_t kReadChunkSize = 1U << 20;

void seekStream(std::istream& stream, FileOffset offset, const std::string& name) {
    // A previous short read leaves eofbit set, which would fail the seek
    stream.clear();
    stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream.good()) {
        throw IOError(ErrorCode::kSeekFailed, "Failed to seek in source",
                      ErrorContext(name).withOffset(offset));
    }
}

std::size_t readStream(std::istream& stream, std::span<std::uint8_t> buffer,
                       const std::string& name) {
    if (buffer.empty()) {
        return 0;
    }

    stream.read(reinterpret_cast<char*>(buffer.data()),
                static_cast<std::streamsize>(buffer.size()));
    if (stream.bad()) {
        throw IOError("Failed to read from source", ErrorContext(name));
    }

    const auto bytesRead = static_cast<std::size_t>(stream.gcount());
    if (bytesRead < buffer.size()) {
        stream.clear();
    }
    return bytesRead;
}

}  // namespace

// =============================================================================
// FileSource Implementation
// =============================================================================

FileSource::FileSource(std::filesystem::path path)
    : path_(std::move(path)), name_(path_.string()), stream_(path_, std::ios::binary) {
    if (!stream_.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open file: " + name_,
                      ErrorContext(name_));
    }
}

void FileSource::seek(FileOffset offset) {
    seekStream(stream_, offset, name_);
}

std::size_t FileSource::read(std::span<std::uint8_t> buffer) {
    return readStream(stream_, buffer, name_);
}

// =============================================================================
// BorrowedSource Implementation
// =============================================================================

BorrowedSource::BorrowedSource(std::istream& stream, std::string name)
    : stream_(&stream), name_(std::move(name)) {}

void BorrowedSource::seek(FileOffset offset) {
    seekStream(*stream_, offset, name_);
}

std::size_t BorrowedSource::read(std::span<std::uint8_t> buffer) {
    return readStream(*stream_, buffer, name_);
}

// =============================================================================
// SharedSource Implementation
// =============================================================================

SharedSource::SharedSource(std::unique_ptr<SourceHandle> handle) : handle_(std::move(handle)) {
    if (!handle_) {
        throw InvalidArgumentError("SharedSource requires a source handle");
    }
}

SharedSource::Lease SharedSource::acquire() {
    return Lease(mutex_, *handle_);
}

ByteBuffer SharedSource::readAt(FileOffset offset, std::size_t length) {
    return acquire().readAt(offset, length);
}

ByteBuffer SharedSource::Lease::readAt(FileOffset offset, std::size_t length) {
    handle_->seek(offset);

    // Grow in bounded steps: length comes from untrusted headers and may far
    // exceed what the source holds.
    ByteBuffer buffer;
    while (buffer.size() < length) {
        const std::size_t used = buffer.size();
        const std::size_t step = std::min(kReadChunkSize, length - used);
        buffer.resize(used + step);

        const std::size_t bytesRead =
            handle_->read(std::span<std::uint8_t>(buffer.data() + used, step));
        if (bytesRead < step) {
            buffer.resize(used + bytesRead);
            break;
        }
    }
    return buffer;
}

}  // namespace xzb::io
