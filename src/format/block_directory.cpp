// =============================================================================
// lci - Block Directory Decoder Implementation
// =============================================================================

#include "lci/format/block_directory.h"

#include <format>

#include "lci/common/checksum.h"
#include "lci/common/logger.h"
#include "lci/format/varint.h"

namespace lci::format {

namespace {

[[noreturn]] void throwDirectoryError(std::string message, std::uint64_t offset) {
    throw FormatError(ErrorCode::kDirectoryDecodeError, std::move(message),
                      ErrorContext{}.withOffset(offset));
}

/// @brief Unwrap a varint read or fail the whole directory.
template <typename T>
T require(Result<T> value, std::size_t block, std::string_view field, std::uint64_t offset) {
    if (!value) {
        throwDirectoryError(std::format("block {} {}: {}", block, field, value.error().message()),
                            offset);
    }
    return *value;
}

}  // namespace

BlockDirectory decodeBlockDirectory(const ChunkBody& body, TrailerLayout layout) {
    const ByteSpan bytes = body.bytes();
    const std::size_t trailerSize =
        kMetaOffsetSize + (hasChecksums(layout) ? kChecksumSize : 0);
    if (bytes.size() < kBodyPreambleSize + trailerSize) {
        throwDirectoryError(
            std::format("body of {} bytes is too short for the trailer", bytes.size()), 0);
    }

    const std::size_t metaEnd = bytes.size() - trailerSize;
    BlockDirectory directory;
    directory.metaOffset = readBigEndian<std::uint64_t>(bytes.subspan(bytes.size() - kMetaOffsetSize));
    if (directory.metaOffset > metaEnd) {
        throwDirectoryError(std::format("metadata offset {} beyond directory end {}",
                                        directory.metaOffset, metaEnd),
                            bytes.size() - kMetaOffsetSize);
    }

    const auto metaStart = static_cast<std::size_t>(directory.metaOffset);
    const ByteSpan region = bytes.subspan(metaStart, metaEnd - metaStart);
    directory.computedChecksum = crc32c(region);
    if (hasChecksums(layout)) {
        directory.storedChecksum = readBigEndian<std::uint32_t>(bytes.subspan(metaEnd));
        if (!directory.checksumOk()) {
            LCI_LOG_WARNING("Metadata checksum mismatch: stored {:08x}, computed {:08x}",
                            *directory.storedChecksum, directory.computedChecksum);
        }
    }

    ByteCursor cursor(region);
    auto at = [&] { return static_cast<std::uint64_t>(metaStart + cursor.position()); };

    auto countResult = cursor.readUvarint();
    if (!countResult) {
        throwDirectoryError(std::format("block count: {}", countResult.error().message()), at());
    }
    const std::uint64_t count = *countResult;

    // Every descriptor takes at least five bytes
    if (count > cursor.remaining() / 5) {
        throwDirectoryError(std::format("block count {} exceeds directory size {}", count,
                                        region.size()),
                            at());
    }

    directory.descriptors.reserve(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint64_t offset = at();
        BlockDescriptor d;
        d.numEntries = require(cursor.readUvarint(), i, "entry count", offset);
        d.minT = require(cursor.readVarint(), i, "minT", offset);
        d.maxT = require(cursor.readVarint(), i, "maxT", offset);
        d.dataOffset = require(cursor.readUvarint(), i, "offset", offset);
        d.dataLength = require(cursor.readUvarint(), i, "length", offset);
        directory.descriptors.push_back(d);
    }

    LCI_LOG_DEBUG("Decoded directory at offset {}: {} block(s)", directory.metaOffset,
                  directory.descriptors.size());
    return directory;
}

}  // namespace lci::format
