// =============================================================================
// lci - Chunk Body Implementation
// =============================================================================

#include "lci/format/chunk_body.h"

#include <algorithm>
#include <format>

#include "lci/common/logger.h"

namespace lci::format {

namespace {

constexpr std::size_t kLoadStepSize = 1 << 20;

}  // namespace

ChunkBody::ChunkBody(ByteBuffer data) : data_(std::move(data)) {
    if (data_.size() < kMagicSize) {
        throw TruncatedError("chunk magic", kMagicSize, data_.size());
    }
    const auto magic = readBigEndian<std::uint32_t>(data_);
    if (magic != kChunkMagic) {
        throw BadMagicError(magic, ErrorContext{}.withOffset(0));
    }
    if (data_.size() < kBodyPreambleSize) {
        throw TruncatedError("chunk format and codec", kBodyPreambleSize, data_.size());
    }

    formatVersion_ = data_[kMagicSize];
    auto codec = resolveCodec(formatVersion_, data_[kMagicSize + 1]);
    if (!codec) {
        throw UnknownCodecError(codec.error().message(), ErrorContext{}.withOffset(kMagicSize));
    }
    codec_ = *codec;
}

ChunkBody ChunkBody::load(std::istream& stream, std::size_t dataLength) {
    // Allocation stays at most one step ahead of the bytes read
    ByteBuffer data;
    std::size_t got = 0;
    while (got < dataLength) {
        const std::size_t step = std::min(kLoadStepSize, dataLength - got);
        data.resize(got + step);
        stream.read(reinterpret_cast<char*>(data.data() + got), static_cast<std::streamsize>(step));
        const auto chunk = static_cast<std::size_t>(stream.gcount());
        got += chunk;
        if (chunk != step) {
            throw TruncatedError("chunk body", dataLength, got);
        }
    }

    ChunkBody body(std::move(data));
    LCI_LOG_DEBUG("Loaded chunk body: {} bytes, format {}, codec {}", body.size(),
                  body.formatVersion(), codecName(body.codec()));
    return body;
}

ChunkBody ChunkBody::fromBytes(ByteBuffer bytes) {
    return ChunkBody(std::move(bytes));
}

std::optional<ByteSpan> ChunkBody::slice(const PayloadSlice& slice) const noexcept {
    if (slice.offset > data_.size() || slice.length > data_.size() - slice.offset) {
        return std::nullopt;
    }
    return ByteSpan(data_).subspan(slice.offset, slice.length);
}

}  // namespace lci::format
