// =============================================================================
// lci - Chunk Reader Implementation
// =============================================================================

#include "lci/format/chunk_reader.h"

#include <algorithm>
#include <fstream>
#include <numeric>

#include "lci/common/logger.h"
#include "lci/format/block_materializer.h"
#include "lci/format/header_decoder.h"

namespace lci::format {

// =============================================================================
// DecodedChunk Implementation
// =============================================================================

DecodedChunk::DecodedChunk(ChunkBody body, BlockDirectory directory, std::vector<Block> blocks)
    : body_(std::move(body)),
      metaOffset_(directory.metaOffset),
      storedMetadataChecksum_(directory.storedChecksum),
      computedMetadataChecksum_(directory.computedChecksum),
      blocks_(std::move(blocks)) {}

ByteSpan DecodedChunk::payload(const Block& block) const noexcept {
    return body_.slice(block.payload).value_or(ByteSpan{});
}

std::uint64_t DecodedChunk::totalUncompressedSize() const noexcept {
    return std::accumulate(blocks_.begin(), blocks_.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const Block& b) {
                               return sum + b.uncompressedLength;
                           });
}

std::size_t DecodedChunk::failedBlockCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(blocks_.begin(), blocks_.end(), [](const Block& b) { return !b.ok(); }));
}

// =============================================================================
// ChunkReader Implementation
// =============================================================================

DecodedChunk ChunkReader::decodeBody(ChunkBody body) const {
    BlockDirectory directory = decodeBlockDirectory(body, options_.trailerLayout());

    const MaterializeOptions materialize{options_.trailerLayout(), options_.decodeEntries};
    std::vector<Block> blocks;
    blocks.reserve(directory.descriptors.size());
    for (std::size_t i = 0; i < directory.descriptors.size(); ++i) {
        Block block = materializeBlock(body, static_cast<BlockIndex>(i), directory.descriptors[i],
                                       materialize);
        if (options_.failFast && block.error) {
            block.error->throwException();
        }
        blocks.push_back(std::move(block));
    }

    return DecodedChunk(std::move(body), std::move(directory), std::move(blocks));
}

ChunkFile ChunkReader::read(std::istream& stream, std::string name,
                            std::optional<std::uint64_t> available) const {
    ChunkHeader header = decodeHeader(stream);

    const std::uint64_t headerSize = static_cast<std::uint64_t>(header.metadataLength) +
                                     kHeaderLengthFieldSize;
    if (available && header.dataLength > *available - std::min(*available, headerSize)) {
        throw TruncatedError("chunk body", header.dataLength,
                             *available - std::min(*available, headerSize),
                             ErrorContext(name).withOffset(headerSize));
    }

    ChunkBody body = ChunkBody::load(stream, header.dataLength);
    DecodedChunk chunk = decodeBody(std::move(body));

    const std::uint64_t fileSize = headerSize + header.dataLength;
    LCI_LOG_DEBUG("Decoded {}: {} block(s), {} failed", name, chunk.blocks().size(),
                  chunk.failedBlockCount());
    return ChunkFile{std::move(name), fileSize, std::move(header), std::move(chunk)};
}

ChunkFile ChunkReader::readFile(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open file: " + path.string(), ErrorContext(path.string()));
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IOError("Failed to stat " + path.string(), ec);
    }

    ChunkFile result = read(file, path.string(), size);
    result.fileSize = size;
    return result;
}

}  // namespace lci::format
