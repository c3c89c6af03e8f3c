// =============================================================================
// lci - Entry Stream Decoder
// =============================================================================
// Decodes the entries of one decompressed block:
//   repeat until the buffer is consumed:
//     svarint timestamp   (nanoseconds since the epoch)
//     uvarint lineLength
//     lineLength bytes    (the raw line)
// =============================================================================

#ifndef LCI_FORMAT_ENTRY_DECODER_H
#define LCI_FORMAT_ENTRY_DECODER_H

#include <optional>
#include <vector>

#include "lci/common/error.h"
#include "lci/format/chunk_format.h"
#include "lci/format/varint.h"

namespace lci::format {

/// @brief Pull-style reader over a block's decompressed bytes.
class EntryReader {
public:
    explicit EntryReader(ByteSpan data) noexcept : cursor_(data) {}

    /// @brief Decode the next entry.
    /// @return std::nullopt once the buffer is fully consumed, kTruncatedEntry
    ///         if the entry at the cursor is malformed.
    [[nodiscard]] Result<std::optional<Entry>> next();

    /// @brief Number of entries decoded so far.
    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    [[nodiscard]] std::size_t position() const noexcept { return cursor_.position(); }

private:
    ByteCursor cursor_;
    std::size_t count_ = 0;
};

/// @brief Decode every entry of a block, appending to out.
/// @note Entries decoded before a failure are kept in out.
/// @return kTruncatedEntry on the first malformed entry.
[[nodiscard]] VoidResult decodeEntries(ByteSpan data, std::vector<Entry>& out);

/// @brief Append the encoding of one entry to a buffer.
void appendEntry(ByteBuffer& out, const Entry& entry);

}  // namespace lci::format

#endif  // LCI_FORMAT_ENTRY_DECODER_H
