// =============================================================================
// lci - Block Materializer
// =============================================================================
// Turns a directory descriptor into a Block: slices the payload out of the
// body, records checksums and digests, decompresses it and decodes entries.
//
// Failures are recorded on the returned Block instead of being thrown, so
// one corrupt block never hides its neighbours.
// =============================================================================

#ifndef LCI_FORMAT_BLOCK_MATERIALIZER_H
#define LCI_FORMAT_BLOCK_MATERIALIZER_H

#include "lci/format/chunk_body.h"
#include "lci/format/chunk_format.h"

namespace lci::format {

/// @brief Options for materializing one block.
struct MaterializeOptions {
    TrailerLayout layout = TrailerLayout::kChecksummed;

    /// @brief Decode entries after decompression.
    bool decodeEntries = true;
};

/// @brief Materialize the block described by descriptor.
/// @note Never throws for corrupt data; see Block::error.
[[nodiscard]] Block materializeBlock(const ChunkBody& body, BlockIndex index,
                                     const BlockDescriptor& descriptor,
                                     const MaterializeOptions& options = {});

/// @brief Decompress a block payload with the body's codec.
/// @throws CodecError (kCodecInitError or kDecodeError).
[[nodiscard]] ByteBuffer decompressPayload(ChunkCodec codec, ByteSpan payload);

}  // namespace lci::format

#endif  // LCI_FORMAT_BLOCK_MATERIALIZER_H
