// =============================================================================
// lci - Codec Registry
// =============================================================================
// Maps the (format, code) selector bytes of a chunk body to a codec, and
// builds decompressing streams for block payloads.
//
// | code | codec  |
// |------|--------|
// | 0    | none   |
// | 1    | gzip   |
// | 2    | dumb   |  identity, legacy alias of none
// | 3    | lz4    |
// | 4    | snappy |
//
// Format 1 always selects gzip; format 2 looks the code up in the table.
// =============================================================================

#ifndef LCI_FORMAT_CODEC_REGISTRY_H
#define LCI_FORMAT_CODEC_REGISTRY_H

#include <cstdint>
#include <istream>
#include <memory>
#include <string_view>

#include "lci/common/error.h"
#include "lci/io/compressed_stream.h"

namespace lci::format {

/// @brief Block payload codecs.
enum class ChunkCodec : std::uint8_t {
    kNone = 0,
    kGzip = 1,
    kDumb = 2,
    kLz4 = 3,
    kSnappy = 4
};

/// @brief Get human-readable name for a codec.
[[nodiscard]] std::string_view codecName(ChunkCodec codec) noexcept;

/// @brief Stream compression format that implements a codec.
[[nodiscard]] io::CompressionFormat streamFormat(ChunkCodec codec) noexcept;

/// @brief Resolve the codec selected by a body's format and code bytes.
/// @return kUnknownCodec for an unknown format, or an unknown code under format 2.
[[nodiscard]] Result<ChunkCodec> resolveCodec(std::uint8_t format, std::uint8_t code);

/// @brief Build a stream that decompresses source with the given codec.
/// @param source Compressed bytes (must outlive the returned stream).
/// @throws CodecError (kCodecInitError) if the decompressor cannot be constructed.
[[nodiscard]] std::unique_ptr<std::istream> openDecompressor(ChunkCodec codec,
                                                             std::istream& source);

}  // namespace lci::format

#endif  // LCI_FORMAT_CODEC_REGISTRY_H
