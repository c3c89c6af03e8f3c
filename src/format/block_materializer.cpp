// =============================================================================
// lci - Block Materializer Implementation
// =============================================================================

#include "lci/format/block_materializer.h"

#include <format>
#include <spanstream>

#include "lci/common/checksum.h"
#include "lci/common/logger.h"
#include "lci/format/entry_decoder.h"

namespace lci::format {

ByteBuffer decompressPayload(ChunkCodec codec, ByteSpan payload) {
    std::ispanstream source(
        std::span<const char>(reinterpret_cast<const char*>(payload.data()), payload.size()));
    auto stream = openDecompressor(codec, source);
    return io::readAll(*stream);
}

Block materializeBlock(const ChunkBody& body, BlockIndex index,
                       const BlockDescriptor& descriptor, const MaterializeOptions& options) {
    Block block;
    block.index = index;
    block.descriptor = descriptor;

    auto fail = [&](ErrorCode code, std::string message) {
        LCI_LOG_WARNING("Block {}: {}", index, message);
        block.error = Error(code, std::move(message));
        return std::move(block);
    };

    if (descriptor.dataOffset > body.size() ||
        descriptor.dataLength > body.size() - descriptor.dataOffset) {
        return fail(ErrorCode::kDecodeError,
                    std::format("payload [{}, +{}) outside body of {} bytes",
                                descriptor.dataOffset, descriptor.dataLength, body.size()));
    }
    const PayloadSlice slice{static_cast<std::size_t>(descriptor.dataOffset),
                             static_cast<std::size_t>(descriptor.dataLength)};
    const ByteSpan payload = *body.slice(slice);
    block.payload = slice;
    block.compressedDigest = sha256(payload);
    block.computedChecksum = crc32c(payload);

    if (hasChecksums(options.layout)) {
        auto stored = body.slice(PayloadSlice{slice.offset + slice.length, kChecksumSize});
        if (!stored) {
            return fail(ErrorCode::kDecodeError,
                        std::format("payload checksum at offset {} outside body of {} bytes",
                                    slice.offset + slice.length, body.size()));
        }
        block.storedChecksum = readBigEndian<std::uint32_t>(*stored);
        if (!block.checksumOk()) {
            LCI_LOG_WARNING("Block {}: checksum mismatch: stored {:08x}, computed {:08x}", index,
                            *block.storedChecksum, block.computedChecksum);
        }
    }

    ByteBuffer plain;
    try {
        plain = decompressPayload(body.codec(), payload);
    } catch (const CodecError& e) {
        return fail(e.code(), std::format("{} decompression failed: {}", codecName(body.codec()),
                                          e.message()));
    }

    block.uncompressedDigest = sha256(plain);
    block.uncompressedLength = plain.size();

    if (options.decodeEntries) {
        if (auto decoded = decodeEntries(plain, block.entries); !decoded) {
            return fail(decoded.error().code(), decoded.error().message());
        }
    }

    LCI_LOG_TRACE("Block {}: {} -> {} bytes, {} entries", index, slice.length,
                  block.uncompressedLength, block.entries.size());
    return block;
}

}  // namespace lci::format
