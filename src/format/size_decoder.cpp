// =============================================================================
// xz-blocks - Size Field Decoder Implementation
// =============================================================================

#include "xzb/format/size_decoder.h"

#include <fmt/format.h>

#include "xzb/format/xz_format.h"

namespace xzb::format {

Result<DecodedSize> decodeSize(std::span<const std::uint8_t> data, std::size_t position) {
    if (position >= data.size()) {
        return makeError<DecodedSize>(
            ErrorCode::kMalformedVarint,
            fmt::format("Size field starts at {}, past the end of a {}-byte buffer", position,
                        data.size()));
    }

    std::uint64_t value = 0;
    std::size_t i = 0;

    while (true) {
        if (i >= kMaxVarintBytes) {
            return makeError<DecodedSize>(
                ErrorCode::kMalformedVarint,
                fmt::format("Size field longer than {} bytes", kMaxVarintBytes));
        }
        if (position + i >= data.size()) {
            return makeError<DecodedSize>(ErrorCode::kMalformedVarint,
                                          "Size field runs past the end of the buffer");
        }

        const std::uint8_t byte = data[position + i];
        value |= static_cast<std::uint64_t>(byte & 0x7F) << (7 * i);

        if ((byte & 0x80) == 0) {
            if (i > 0 && byte == 0x00) {
                return makeError<DecodedSize>(ErrorCode::kMalformedVarint,
                                              "Zero continuation byte in size field");
            }
            return DecodedSize{value, i + 1};
        }

        ++i;
    }
}

std::size_t encodeSize(std::uint64_t value, std::uint8_t* output) noexcept {
    std::size_t bytesWritten = 0;

    while (value >= 0x80) {
        output[bytesWritten++] = static_cast<std::uint8_t>(value | 0x80);
        value >>= 7;
    }

    output[bytesWritten++] = static_cast<std::uint8_t>(value);
    return bytesWritten;
}

}  // namespace xzb::format
