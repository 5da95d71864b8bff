// =============================================================================
// xz-blocks - Byte Source Tests
// =============================================================================
// Unit tests for file-backed and borrowed sources and the locked
// seek + read performed by SharedSource.
// =============================================================================

#include "xzb/io/source.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "support/xz_fixture.h"
#include "xzb/common/error.h"

namespace xzb::io {
namespace {

using test::TempFileGuard;
using test::tempFilePath;
using test::writeFile;

ByteBuffer sequence(std::size_t size) {
    ByteBuffer bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>(i);
    }
    return bytes;
}

// =============================================================================
// FileSource Tests
// =============================================================================

TEST(FileSourceTest, MissingFileThrowsOpenFailed) {
    const auto path = tempFilePath();
    try {
        FileSource source(path);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileOpenFailed);
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->filePath, path.string());
    }
}

TEST(FileSourceTest, NameIsPath) {
    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), sequence(8));

    FileSource source(guard.path());
    EXPECT_EQ(source.name(), guard.path().string());
    EXPECT_EQ(source.path(), guard.path());
}

TEST(FileSourceTest, ReadsAfterShortReadAtEnd) {
    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), sequence(16));

    SharedSource shared(std::make_unique<FileSource>(guard.path()));

    const ByteBuffer tail = shared.readAt(12, 10);
    EXPECT_EQ(tail, (ByteBuffer{12, 13, 14, 15}));

    // The short read must not poison later reads
    const ByteBuffer head = shared.readAt(0, 4);
    EXPECT_EQ(head, (ByteBuffer{0, 1, 2, 3}));
}

TEST(FileSourceTest, ReadPastEndIsEmpty) {
    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), sequence(4));

    SharedSource shared(std::make_unique<FileSource>(guard.path()));
    EXPECT_TRUE(shared.readAt(4, 1).empty());
    EXPECT_EQ(shared.readAt(3, 1), (ByteBuffer{3}));
}

// =============================================================================
// BorrowedSource Tests
// =============================================================================

TEST(BorrowedSourceTest, ReadsFromCallerStream) {
    std::istringstream input(std::string("\x01\x02\x03\x04\x05", 5));
    SharedSource shared(std::make_unique<BorrowedSource>(input, "memory"));

    EXPECT_EQ(shared.name(), "memory");
    EXPECT_EQ(shared.readAt(1, 3), (ByteBuffer{2, 3, 4}));
    EXPECT_EQ(shared.readAt(3, 8), (ByteBuffer{4, 5}));
    EXPECT_EQ(shared.readAt(0, 1), (ByteBuffer{1}));
}

TEST(BorrowedSourceTest, DefaultName) {
    std::istringstream input("abc");
    BorrowedSource source(input);
    EXPECT_EQ(source.name(), "<stream>");
}

// =============================================================================
// SharedSource Tests
// =============================================================================

TEST(SharedSourceTest, NullHandleRejected) {
    EXPECT_THROW(SharedSource(nullptr), InvalidArgumentError);
}

TEST(SharedSourceTest, LeaseReadsSequence) {
    std::istringstream input(std::string(64, 'a') + std::string(64, 'b'));
    SharedSource shared(std::make_unique<BorrowedSource>(input));

    auto lease = shared.acquire();
    const ByteBuffer first = lease.readAt(63, 1);
    const ByteBuffer second = lease.readAt(64, 2);

    EXPECT_EQ(first, (ByteBuffer{'a'}));
    EXPECT_EQ(second, (ByteBuffer{'b', 'b'}));
}

TEST(SharedSourceTest, OversizedReadReturnsAvailableBytes) {
    std::istringstream input(std::string(64, 'x'));
    SharedSource shared(std::make_unique<BorrowedSource>(input));

    const ByteBuffer bytes = shared.readAt(12, std::size_t{1} << 50);

    EXPECT_EQ(bytes.size(), 52u);
    EXPECT_EQ(bytes, ByteBuffer(52, 'x'));
}

TEST(SharedSourceTest, ReadSpanningSeveralChunks) {
    const ByteBuffer data = test::compressibleBytes((3U << 20) + 123, 9);
    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), data);
    SharedSource shared(std::make_unique<FileSource>(guard.path()));

    const ByteBuffer bytes = shared.readAt(0, data.size() + 4096);

    EXPECT_EQ(bytes, data);
}

TEST(SharedSourceTest, ConcurrentReadsSeeConsistentBytes) {
    const ByteBuffer data = sequence(256);
    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), data);

    SharedSource shared(std::make_unique<FileSource>(guard.path()));

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<int> ok(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            bool allMatch = true;
            for (int i = 0; i < 200; ++i) {
                const std::size_t offset = static_cast<std::size_t>((t * 31 + i * 7) % 240);
                const ByteBuffer got = shared.readAt(offset, 16);
                allMatch = allMatch && got == ByteBuffer(data.begin() + offset,
                                                         data.begin() + offset + 16);
            }
            ok[t] = allMatch ? 1 : 0;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(ok[t], 1) << "thread " << t;
    }
}

}  // namespace
}  // namespace xzb::io
