// =============================================================================
// lci - Block Directory Decoder
// =============================================================================
// Locates and decodes the metadata directory at the tail of a chunk body.
//
// Tail layout (read backward from the end of the body):
//   [len-8,  len)     BE64 metaOffset
//   [len-12, len-8)   BE32 CRC32C of the directory (checksummed layout only)
//   [metaOffset, len-12 or len-8)   the directory itself
//
// The stored and computed directory checksums are both recorded; a mismatch
// does not stop decoding. Any descriptor that fails to decode is fatal since
// later descriptors cannot be located without it.
// =============================================================================

#ifndef LCI_FORMAT_BLOCK_DIRECTORY_H
#define LCI_FORMAT_BLOCK_DIRECTORY_H

#include <optional>
#include <vector>

#include "lci/format/chunk_body.h"
#include "lci/format/chunk_format.h"

namespace lci::format {

/// @brief Decoded metadata directory.
struct BlockDirectory {
    /// @brief Start of the directory inside the body.
    std::uint64_t metaOffset = 0;

    /// @brief Checksum stored in the trailer (checksummed layout only).
    std::optional<Checksum> storedChecksum;

    /// @brief Checksum computed over the directory region.
    Checksum computedChecksum = 0;

    /// @brief Descriptors in directory order.
    std::vector<BlockDescriptor> descriptors;

    [[nodiscard]] bool checksumOk() const noexcept {
        return !storedChecksum.has_value() || *storedChecksum == computedChecksum;
    }
};

/// @brief Decode the directory of a loaded body.
/// @throws FormatError (kDirectoryDecodeError) if the trailer is out of
///         bounds or any descriptor is malformed.
[[nodiscard]] BlockDirectory decodeBlockDirectory(const ChunkBody& body, TrailerLayout layout);

}  // namespace lci::format

#endif  // LCI_FORMAT_BLOCK_DIRECTORY_H
