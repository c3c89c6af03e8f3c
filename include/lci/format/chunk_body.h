// =============================================================================
// lci - Chunk Body
// =============================================================================
// Owned buffer holding the complete chunk body.
//
// The directory and the trailer are addressed by absolute offsets into this
// buffer, so the body is always read in full before anything is parsed.
// Every block payload is a slice of it.
// =============================================================================

#ifndef LCI_FORMAT_CHUNK_BODY_H
#define LCI_FORMAT_CHUNK_BODY_H

#include <cstdint>
#include <istream>
#include <optional>

#include "lci/common/types.h"
#include "lci/format/chunk_format.h"
#include "lci/format/codec_registry.h"

namespace lci::format {

/// @brief A loaded chunk body with its validated preamble.
class ChunkBody {
public:
    /// @brief Read exactly dataLength bytes and validate the preamble.
    /// @throws TruncatedError if fewer than dataLength bytes are available.
    /// @throws BadMagicError if the magic number does not match.
    /// @throws UnknownCodecError if the format or code byte is unknown.
    [[nodiscard]] static ChunkBody load(std::istream& stream, std::size_t dataLength);

    /// @brief Take ownership of an in-memory body and validate the preamble.
    [[nodiscard]] static ChunkBody fromBytes(ByteBuffer bytes);

    [[nodiscard]] ByteSpan bytes() const noexcept { return data_; }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] ChunkCodec codec() const noexcept { return codec_; }

    [[nodiscard]] std::uint8_t formatVersion() const noexcept { return formatVersion_; }

    /// @brief Bounds-checked view of [slice.offset, slice.offset + slice.length).
    /// @return std::nullopt when the slice does not lie inside the body.
    [[nodiscard]] std::optional<ByteSpan> slice(const PayloadSlice& slice) const noexcept;

private:
    explicit ChunkBody(ByteBuffer data);

    ByteBuffer data_;
    ChunkCodec codec_ = ChunkCodec::kNone;
    std::uint8_t formatVersion_ = 0;
};

}  // namespace lci::format

#endif  // LCI_FORMAT_CHUNK_BODY_H
