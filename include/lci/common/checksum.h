// =============================================================================
// lci - Checksums and Digests
// =============================================================================
// Integrity primitives used by the chunk decoder.
//
// - CRC32 with the Castagnoli polynomial (CRC32C), used for the metadata
//   directory, every block payload, and snappy frame chunks
// - SHA-256 digests (OpenSSL EVP), kept as informational fingerprints
// =============================================================================

#ifndef LCI_COMMON_CHECKSUM_H
#define LCI_COMMON_CHECKSUM_H

#include <string>

#include "lci/common/types.h"

namespace lci {

/// @brief Compute CRC32C over a buffer.
[[nodiscard]] Checksum crc32c(ByteSpan data) noexcept;

/// @brief Continue a CRC32C computation.
/// @param crc Value returned by a previous crc32c()/crc32cExtend() call (0 to start).
[[nodiscard]] Checksum crc32cExtend(Checksum crc, ByteSpan data) noexcept;

/// @brief CRC32C masked as used by the snappy framing format.
[[nodiscard]] Checksum maskedCrc32c(ByteSpan data) noexcept;

/// @brief Compute the SHA-256 digest of a buffer.
/// @throws IOError if the OpenSSL digest context cannot be created.
[[nodiscard]] Digest sha256(ByteSpan data);

/// @brief Lowercase hex rendering of a digest.
[[nodiscard]] std::string toHex(const Digest& digest);

}  // namespace lci

#endif  // LCI_COMMON_CHECKSUM_H
