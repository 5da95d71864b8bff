// =============================================================================
// xz-blocks - Byte Sources
// =============================================================================
// Random-access byte sources and the guard that serializes access to them.
//
// This module provides:
// - SourceHandle: abstract seek + read capability
// - FileSource: opens and owns a file by path
// - BorrowedSource: wraps a caller-owned std::istream
// - SharedSource: one SourceHandle plus the mutex shared by a Stream and all
//   of its Blocks; every read is a single locked seek + read
//
// Usage:
//   auto shared = std::make_shared<SharedSource>(std::make_unique<FileSource>(path));
//   ByteBuffer bytes = shared->readAt(offset, length);
//
//   // Several reads inside one critical section:
//   auto lease = shared->acquire();
//   ByteBuffer first = lease.readAt(offset, 1);
//   ByteBuffer rest = lease.readAt(offset + 1, n);
// =============================================================================

#ifndef XZB_IO_SOURCE_H
#define XZB_IO_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include "xzb/common/types.h"

namespace xzb::io {

// =============================================================================
// SourceHandle
// =============================================================================

/// @brief Seekable, readable byte source.
/// @note Implementations are not thread-safe; wrap them in SharedSource.
class SourceHandle {
public:
    virtual ~SourceHandle() = default;

    /// @brief Move the read cursor to an absolute offset.
    /// @throws IOError if the seek fails.
    virtual void seek(FileOffset offset) = 0;

    /// @brief Read up to buffer.size() bytes at the cursor.
    /// @return Number of bytes read; less than requested only at end of data.
    /// @throws IOError on a read failure other than end of data.
    [[nodiscard]] virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;

    /// @brief Human-readable name used in log lines and error context.
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
};

// =============================================================================
// FileSource
// =============================================================================

/// @brief Source that opens a file by path and closes it on destruction.
class FileSource final : public SourceHandle {
public:
    /// @brief Open the file for binary reading.
    /// @throws IOError (kFileOpenFailed) if the file cannot be opened.
    explicit FileSource(std::filesystem::path path);

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    void seek(FileOffset offset) override;
    [[nodiscard]] std::size_t read(std::span<std::uint8_t> buffer) override;
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    /// @brief Get the opened path.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::string name_;
    std::ifstream stream_;
};

// =============================================================================
// BorrowedSource
// =============================================================================

/// @brief Source over a std::istream owned by the caller.
/// @note The stream must outlive every Stream and Block reading through it.
class BorrowedSource final : public SourceHandle {
public:
    /// @brief Wrap a caller-owned stream.
    /// @param stream Seekable input stream (opened in binary mode).
    /// @param name Label used in log lines and error context.
    explicit BorrowedSource(std::istream& stream, std::string name = "<stream>");

    void seek(FileOffset offset) override;
    [[nodiscard]] std::size_t read(std::span<std::uint8_t> buffer) override;
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

private:
    std::istream* stream_;
    std::string name_;
};

// =============================================================================
// SharedSource
// =============================================================================

/// @brief A SourceHandle guarded by one mutex.
///
/// Thread Safety:
/// - readAt() and Lease operations are atomic with respect to each other.
/// - No ordering is guaranteed between concurrent callers.
class SharedSource {
public:
    /// @brief Exclusive access to the source for the lifetime of the lease.
    class Lease {
    public:
        Lease(Lease&&) noexcept = default;
        Lease& operator=(Lease&&) noexcept = default;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        /// @brief Seek to offset and read up to length bytes.
        /// @return Bytes read; shorter than length only at end of data.
        [[nodiscard]] ByteBuffer readAt(FileOffset offset, std::size_t length);

    private:
        friend class SharedSource;

        Lease(std::mutex& mutex, SourceHandle& handle) : lock_(mutex), handle_(&handle) {}

        std::unique_lock<std::mutex> lock_;
        SourceHandle* handle_;
    };

    /// @brief Take ownership of a source handle.
    /// @throws InvalidArgumentError if handle is null.
    explicit SharedSource(std::unique_ptr<SourceHandle> handle);

    SharedSource(const SharedSource&) = delete;
    SharedSource& operator=(const SharedSource&) = delete;

    /// @brief Lock the source for a sequence of reads.
    [[nodiscard]] Lease acquire();

    /// @brief Locked seek + read of up to length bytes.
    [[nodiscard]] ByteBuffer readAt(FileOffset offset, std::size_t length);

    /// @brief Name of the underlying source.
    [[nodiscard]] const std::string& name() const noexcept { return handle_->name(); }

private:
    std::unique_ptr<SourceHandle> handle_;
    std::mutex mutex_;
};

}  // namespace xzb::io

#endif  // XZB_IO_SOURCE_H
