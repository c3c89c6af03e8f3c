// =============================================================================
// lci - Chunk Format Definitions
// =============================================================================
// Binary layout constants and decoded data model of a log chunk file.
//
// File Layout:
// +------------------+
// | Header Frame     |  BE32 metadataLength, snappy-framed JSON, BE32 dataLength
// +------------------+
// | Body             |  dataLength bytes:
// |   Magic          |    BE32 0x012EE56A
// |   Format         |    1 byte (1 = gzip only, 2 = codec selected by code)
// |   Code           |    1 byte
// |   Block 0..N-1   |    compressed payload [+ BE32 CRC32C]
// |   Directory      |    uvarint N, N x {uvarint count, svarint minT,
// |                  |                    svarint maxT, uvarint offset,
// |                  |                    uvarint length}
// |   [CRC32C]       |    BE32 over the directory (checksummed layout)
// |   Meta Offset    |    BE64 start of the directory
// +------------------+
//
// All multi-byte fixed-width integers are big-endian.
// =============================================================================

#ifndef LCI_FORMAT_CHUNK_FORMAT_H
#define LCI_FORMAT_CHUNK_FORMAT_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lci/common/error.h"
#include "lci/common/types.h"

namespace lci::format {

// =============================================================================
// Constants
// =============================================================================

/// @brief Magic number at the start of every chunk body.
inline constexpr std::uint32_t kChunkMagic = 0x012EE56A;

/// @brief Size of the magic number in bytes.
inline constexpr std::size_t kMagicSize = 4;

/// @brief Legacy body format: payloads are always gzip.
inline constexpr std::uint8_t kFormatV1 = 1;

/// @brief Body format with an explicit codec code byte.
inline constexpr std::uint8_t kFormatV2 = 2;

/// @brief Magic + format byte + code byte.
inline constexpr std::size_t kBodyPreambleSize = kMagicSize + 2;

/// @brief Size of the trailing metadata offset.
inline constexpr std::size_t kMetaOffsetSize = 8;

/// @brief Size of a stored CRC32C checksum.
inline constexpr std::size_t kChecksumSize = 4;

/// @brief Size of each fixed-width header length field.
inline constexpr std::size_t kHeaderLengthFieldSize = 4;

// =============================================================================
// Trailer Layout
// =============================================================================

/// @brief Which trailer layout the body uses.
enum class TrailerLayout : std::uint8_t {
    kChecksummed = 0,  ///< Directory and every block carry a CRC32C
    kLegacy = 1        ///< No stored checksums
};

[[nodiscard]] constexpr bool hasChecksums(TrailerLayout layout) noexcept {
    return layout == TrailerLayout::kChecksummed;
}

// =============================================================================
// Header
// =============================================================================

/// @brief Label name/value pair identifying a series.
struct Label {
    std::string name;
    std::string value;

    bool operator==(const Label&) const = default;
};

/// @brief Decoded header frame.
struct ChunkHeader {
    /// @brief Series fingerprint.
    std::uint64_t fingerprint = 0;

    /// @brief Owner (tenant) identifier.
    std::string userId;

    /// @brief Labels, sorted by name, names unique.
    std::vector<Label> labels;

    /// @brief Inclusive start of the chunk time range.
    ModelTime from = 0;

    /// @brief Inclusive end of the chunk time range.
    ModelTime through = 0;

    /// @brief Series encoding byte.
    std::uint8_t encoding = 0;

    /// @brief Length of the metadata field, including its own 4 bytes.
    std::uint32_t metadataLength = 0;

    /// @brief Length of the body that follows the header frame.
    std::uint32_t dataLength = 0;

    /// @brief Look up a label value by name.
    [[nodiscard]] std::optional<std::string_view> label(std::string_view name) const noexcept;
};

// =============================================================================
// Blocks
// =============================================================================

/// @brief One entry of the metadata directory.
struct BlockDescriptor {
    /// @brief Declared number of entries (never enforced).
    std::uint64_t numEntries = 0;

    /// @brief Declared lower bound of entry timestamps.
    Timestamp minT = 0;

    /// @brief Declared upper bound of entry timestamps.
    Timestamp maxT = 0;

    /// @brief Offset of the compressed payload inside the body.
    std::uint64_t dataOffset = 0;

    /// @brief Length of the compressed payload.
    std::uint64_t dataLength = 0;

    bool operator==(const BlockDescriptor&) const = default;
};

/// @brief A decoded log line.
struct Entry {
    Timestamp timestamp = 0;
    std::string line;

    bool operator==(const Entry&) const = default;
};

/// @brief Location of a byte range inside the body buffer.
struct PayloadSlice {
    std::size_t offset = 0;
    std::size_t length = 0;
};

/// @brief A materialized block.
/// @note The payload is a slice of the owning chunk body; use
///       DecodedChunk::payload() to view it.
struct Block {
    BlockIndex index = kInvalidBlockIndex;

    BlockDescriptor descriptor;

    /// @brief Compressed payload, empty when it could not be sliced.
    PayloadSlice payload;

    /// @brief Checksum stored after the payload (checksummed layout only).
    std::optional<Checksum> storedChecksum;

    /// @brief Checksum computed over the compressed payload.
    Checksum computedChecksum = 0;

    Digest compressedDigest{};

    Digest uncompressedDigest{};

    std::size_t uncompressedLength = 0;

    /// @brief Entries decoded before any failure.
    std::vector<Entry> entries;

    /// @brief Failure that stopped materialization or entry decoding.
    std::optional<Error> error;

    /// @brief True when there is no stored checksum or it matches.
    [[nodiscard]] bool checksumOk() const noexcept {
        return !storedChecksum.has_value() || *storedChecksum == computedChecksum;
    }

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    /// @brief minT <= maxT and every decoded timestamp lies within them.
    [[nodiscard]] bool boundsConsistent() const noexcept;

    /// @brief Decoded entry count equals the declared count.
    [[nodiscard]] bool entryCountMatches() const noexcept {
        return entries.size() == descriptor.numEntries;
    }
};

}  // namespace lci::format

#endif  // LCI_FORMAT_CHUNK_FORMAT_H
