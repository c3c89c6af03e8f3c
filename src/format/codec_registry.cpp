// =============================================================================
// lci - Codec Registry Implementation
// =============================================================================

#include "lci/format/codec_registry.h"

#include <format>

#include "lci/format/chunk_format.h"

namespace lci::format {

std::string_view codecName(ChunkCodec codec) noexcept {
    switch (codec) {
        case ChunkCodec::kNone:
            return "none";
        case ChunkCodec::kGzip:
            return "gzip";
        case ChunkCodec::kDumb:
            return "dumb";
        case ChunkCodec::kLz4:
            return "lz4";
        case ChunkCodec::kSnappy:
            return "snappy";
    }
    return "unknown";
}

io::CompressionFormat streamFormat(ChunkCodec codec) noexcept {
    switch (codec) {
        case ChunkCodec::kGzip:
            return io::CompressionFormat::kGzip;
        case ChunkCodec::kLz4:
            return io::CompressionFormat::kLz4Frame;
        case ChunkCodec::kSnappy:
            return io::CompressionFormat::kSnappyFramed;
        case ChunkCodec::kNone:
        case ChunkCodec::kDumb:
            break;
    }
    return io::CompressionFormat::kNone;
}

Result<ChunkCodec> resolveCodec(std::uint8_t format, std::uint8_t code) {
    if (format == kFormatV1) {
        return ChunkCodec::kGzip;
    }
    if (format != kFormatV2) {
        return makeError<ChunkCodec>(ErrorCode::kUnknownCodec,
                                     std::format("unknown chunk format {}", format));
    }
    if (code > static_cast<std::uint8_t>(ChunkCodec::kSnappy)) {
        return makeError<ChunkCodec>(ErrorCode::kUnknownCodec,
                                     std::format("unknown codec code {}", code));
    }
    return static_cast<ChunkCodec>(code);
}

std::unique_ptr<std::istream> openDecompressor(ChunkCodec codec, std::istream& source) {
    return std::make_unique<io::DecompressingStream>(source, streamFormat(codec));
}

}  // namespace lci::format
