// =============================================================================
// xz-blocks - LZMA2 Block Payload Decoder Implementation
// =============================================================================

#include "xzb/algo/lzma2_decoder.h"

#include <fmt/format.h>
#include <lzma.h>

#include <algorithm>
#include <string>

namespace xzb::algo {

namespace {

/// Output grows by at most this much per step, so a corrupt declared size
/// never allocates ahead of what the payload actually produces.
constexpr std::size_t kDecodeChunkSize = 1U << 20;

std::string lzmaRetToString(lzma_ret ret) {
    switch (ret) {
        case LZMA_OK:
            return "ok";
        case LZMA_STREAM_END:
            return "stream end";
        case LZMA_MEM_ERROR:
            return "cannot allocate memory";
        case LZMA_MEMLIMIT_ERROR:
            return "memory usage limit reached";
        case LZMA_FORMAT_ERROR:
            return "file format not recognized";
        case LZMA_OPTIONS_ERROR:
            return "invalid or unsupported options";
        case LZMA_DATA_ERROR:
            return "compressed data is corrupt";
        case LZMA_PROG_ERROR:
            return "programming error";
        default:
            return fmt::format("unknown error {}", static_cast<int>(ret));
    }
}

}  // namespace

Lzma2Decoder::Lzma2Decoder(std::uint32_t preset) : preset_(preset) {
    lzma_options_lzma options{};
    if (preset > kMaxLzmaPreset || lzma_lzma_preset(&options, preset)) {
        throw InvalidArgumentError(fmt::format("Unsupported LZMA preset: {}", preset));
    }
    dictionarySize_ = options.dict_size;
}

Result<ByteBuffer> Lzma2Decoder::decode(std::span<const std::uint8_t> compressed,
                                        std::uint64_t expectedSize) const {
    lzma_options_lzma options{};
    if (lzma_lzma_preset(&options, preset_)) {
        return makeError<ByteBuffer>(ErrorCode::kInvalidArgument,
                                     fmt::format("Unsupported LZMA preset: {}", preset_));
    }

    const lzma_filter filters[] = {
        {LZMA_FILTER_LZMA2, &options},
        {LZMA_VLI_UNKNOWN, nullptr},
    };

    ByteBuffer output;
    if (expectedSize >= output.max_size()) {
        return makeError<ByteBuffer>(
            ErrorCode::kSizeMismatch,
            fmt::format("Block header declares {} bytes, more than a buffer can hold",
                        expectedSize));
    }

    lzma_stream stream = LZMA_STREAM_INIT;
    if (const lzma_ret ret = lzma_raw_decoder(&stream, filters); ret != LZMA_OK) {
        lzma_end(&stream);
        return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                     fmt::format("LZMA2 decoder init failed: {}",
                                                 lzmaRetToString(ret)));
    }

    // One spare byte past expectedSize lets an exact payload reach its end
    // marker; anything written into it means the payload is too long.
    const std::uint64_t outputLimit = expectedSize + 1;

    stream.next_in = compressed.data();
    stream.avail_in = compressed.size();

    lzma_ret ret = LZMA_OK;
    while (true) {
        if (stream.avail_out == 0) {
            const std::size_t used = output.size();
            if (used >= outputLimit) {
                break;
            }
            const auto grow = static_cast<std::size_t>(
                std::min<std::uint64_t>(kDecodeChunkSize, outputLimit - used));
            output.resize(used + grow);
            stream.next_out = output.data() + used;
            stream.avail_out = grow;
        }

        ret = lzma_code(&stream, LZMA_FINISH);
        if (ret != LZMA_OK) {
            break;
        }
    }

    const std::uint64_t produced = stream.total_out;
    lzma_end(&stream);

    if (produced > expectedSize) {
        return makeError<ByteBuffer>(
            ErrorCode::kSizeMismatch,
            fmt::format("Payload decodes to more than the {} bytes the block header declares",
                        expectedSize));
    }
    if (ret == LZMA_BUF_ERROR) {
        return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                     "LZMA2 decode failed: payload is truncated");
    }
    if (ret != LZMA_STREAM_END) {
        return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                     fmt::format("LZMA2 decode failed: {}", lzmaRetToString(ret)));
    }

    if (produced != expectedSize) {
        return makeError<ByteBuffer>(
            ErrorCode::kSizeMismatch,
            fmt::format("Decoded {} bytes, block header declares {}", produced, expectedSize));
    }

    output.resize(static_cast<std::size_t>(produced));
    return output;
}

}  // namespace xzb::algo
