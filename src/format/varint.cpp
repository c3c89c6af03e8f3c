// =============================================================================
// lci - Variable-Length Integers Implementation
// =============================================================================

#include "lci/format/varint.h"

#include <format>

namespace lci::format {

Result<std::uint64_t> ByteCursor::readUvarint() {
    std::uint64_t value = 0;
    unsigned shift = 0;
    for (std::size_t i = 0; i < kMaxVarintLength; ++i) {
        if (pos_ + i >= data_.size()) {
            return makeError<std::uint64_t>(
                ErrorCode::kMalformedVarint,
                std::format("varint truncated at offset {}", pos_));
        }
        const std::uint8_t byte = data_[pos_ + i];
        if (byte < 0x80) {
            if (i == kMaxVarintLength - 1 && byte > 1) {
                break;
            }
            pos_ += i + 1;
            return value | (static_cast<std::uint64_t>(byte) << shift);
        }
        value |= static_cast<std::uint64_t>(byte & 0x7f) << shift;
        shift += 7;
    }
    return makeError<std::uint64_t>(ErrorCode::kMalformedVarint,
                                    std::format("varint overflows 64 bits at offset {}", pos_));
}

Result<std::int64_t> ByteCursor::readVarint() {
    return readUvarint().transform([](std::uint64_t ux) {
        auto x = static_cast<std::int64_t>(ux >> 1);
        if (ux & 1) {
            x = ~x;
        }
        return x;
    });
}

Result<ByteSpan> ByteCursor::readBytes(std::size_t n) {
    if (n > remaining()) {
        return makeError<ByteSpan>(
            ErrorCode::kTruncated,
            std::format("need {} bytes at offset {}, {} remain", n, pos_, remaining()));
    }
    ByteSpan out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
}

void appendUvarint(ByteBuffer& out, std::uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<std::uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

void appendVarint(ByteBuffer& out, std::int64_t value) {
    auto ux = static_cast<std::uint64_t>(value) << 1;
    if (value < 0) {
        ux = ~ux;
    }
    appendUvarint(out, ux);
}

}  // namespace lci::format
