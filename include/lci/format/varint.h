// =============================================================================
// lci - Variable-Length Integers
// =============================================================================
// LEB128 unsigned varints and zig-zag signed varints over a byte cursor.
//
// A varint is malformed when the buffer ends before its final byte or when it
// does not fit in 64 bits (more than 10 bytes, or a 10th byte above 1).
// =============================================================================

#ifndef LCI_FORMAT_VARINT_H
#define LCI_FORMAT_VARINT_H

#include <cstddef>
#include <cstdint>

#include "lci/common/error.h"
#include "lci/common/types.h"

namespace lci::format {

/// @brief Maximum encoded length of a 64-bit varint.
inline constexpr std::size_t kMaxVarintLength = 10;

/// @brief Sequential reader over a borrowed byte range.
class ByteCursor {
public:
    ByteCursor() = default;

    explicit ByteCursor(ByteSpan data) noexcept : data_(data) {}

    /// @brief Read an unsigned LEB128 varint.
    /// @return kMalformedVarint on truncation or overflow; the cursor is not advanced.
    [[nodiscard]] Result<std::uint64_t> readUvarint();

    /// @brief Read a zig-zag encoded signed varint.
    [[nodiscard]] Result<std::int64_t> readVarint();

    /// @brief Borrow the next n bytes.
    /// @return kTruncated when fewer than n bytes remain.
    [[nodiscard]] Result<ByteSpan> readBytes(std::size_t n);

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

    [[nodiscard]] bool atEnd() const noexcept { return pos_ == data_.size(); }

private:
    ByteSpan data_;
    std::size_t pos_ = 0;
};

/// @brief Append an unsigned LEB128 varint to a buffer.
void appendUvarint(ByteBuffer& out, std::uint64_t value);

/// @brief Append a zig-zag encoded signed varint to a buffer.
void appendVarint(ByteBuffer& out, std::int64_t value);

}  // namespace lci::format

#endif  // LCI_FORMAT_VARINT_H
