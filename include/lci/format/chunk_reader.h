// =============================================================================
// lci - Chunk Reader
// =============================================================================
// Decodes a complete chunk file: header frame, body, directory and blocks.
//
// Structural failures (truncation, bad magic, unknown codec, malformed
// directory) throw and no partial chunk is returned. Block failures are
// isolated on the affected Block unless ReaderOptions::failFast is set.
// Checksum mismatches never throw.
//
// Usage:
//   ChunkReader reader;
//   ChunkFile file = reader.readFile("chunk.bin");
//   for (const auto& block : file.chunk.blocks) { ... }
// =============================================================================

#ifndef LCI_FORMAT_CHUNK_READER_H
#define LCI_FORMAT_CHUNK_READER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "lci/format/block_directory.h"
#include "lci/format/chunk_body.h"
#include "lci/format/chunk_format.h"

namespace lci::format {

// =============================================================================
// Options
// =============================================================================

/// @brief Decoder configuration.
struct ReaderOptions {
    /// @brief Throw the first block error instead of isolating it.
    bool failFast = false;

    /// @brief Body has no directory or block checksums.
    bool legacyLayout = false;

    /// @brief Decode entries of every block.
    bool decodeEntries = true;

    [[nodiscard]] TrailerLayout trailerLayout() const noexcept {
        return legacyLayout ? TrailerLayout::kLegacy : TrailerLayout::kChecksummed;
    }
};

// =============================================================================
// Decoded Chunk
// =============================================================================

/// @brief A decoded chunk body.
/// @note Owns the body buffer that every Block payload refers to.
class DecodedChunk {
public:
    DecodedChunk(ChunkBody body, BlockDirectory directory, std::vector<Block> blocks);

    [[nodiscard]] const ChunkBody& body() const noexcept { return body_; }

    [[nodiscard]] ChunkCodec codec() const noexcept { return body_.codec(); }

    [[nodiscard]] std::uint8_t formatVersion() const noexcept { return body_.formatVersion(); }

    [[nodiscard]] std::uint64_t metaOffset() const noexcept { return metaOffset_; }

    [[nodiscard]] std::optional<Checksum> storedMetadataChecksum() const noexcept {
        return storedMetadataChecksum_;
    }

    [[nodiscard]] Checksum computedMetadataChecksum() const noexcept {
        return computedMetadataChecksum_;
    }

    /// @brief True when there is no stored checksum or it matches.
    [[nodiscard]] bool metadataChecksumOk() const noexcept {
        return !storedMetadataChecksum_.has_value() ||
               *storedMetadataChecksum_ == computedMetadataChecksum_;
    }

    [[nodiscard]] const std::vector<Block>& blocks() const noexcept { return blocks_; }

    /// @brief Compressed payload of a block (empty if it could not be sliced).
    [[nodiscard]] ByteSpan payload(const Block& block) const noexcept;

    /// @brief Sum of the uncompressed lengths of all blocks.
    [[nodiscard]] std::uint64_t totalUncompressedSize() const noexcept;

    /// @brief Number of blocks that carry an error.
    [[nodiscard]] std::size_t failedBlockCount() const noexcept;

private:
    ChunkBody body_;
    std::uint64_t metaOffset_ = 0;
    std::optional<Checksum> storedMetadataChecksum_;
    Checksum computedMetadataChecksum_ = 0;
    std::vector<Block> blocks_;
};

/// @brief A decoded chunk file.
struct ChunkFile {
    /// @brief Path or name the chunk was read from.
    std::string path;

    /// @brief Size of the file in bytes.
    std::uint64_t fileSize = 0;

    ChunkHeader header;

    DecodedChunk chunk;
};

// =============================================================================
// ChunkReader
// =============================================================================

/// @brief Reader for chunk files.
class ChunkReader {
public:
    ChunkReader() = default;

    explicit ChunkReader(ReaderOptions options) : options_(options) {}

    [[nodiscard]] const ReaderOptions& options() const noexcept { return options_; }

    /// @brief Decode a loaded body.
    /// @throws FormatError (kDirectoryDecodeError) for a malformed directory.
    /// @throws CodecError / FormatError for a block error when failFast is set.
    [[nodiscard]] DecodedChunk decodeBody(ChunkBody body) const;

    /// @brief Decode a chunk from a stream positioned at the header frame.
    /// @param name Name reported in the result.
    /// @param available Bytes left in the stream, when known. A header whose
    ///        data length exceeds them is rejected before the body is read.
    /// @throws TruncatedError if the stream ends before the declared body does.
    [[nodiscard]] ChunkFile read(std::istream& stream, std::string name,
                                 std::optional<std::uint64_t> available = std::nullopt) const;

    /// @brief Open and decode a chunk file.
    /// @throws IOError if the file cannot be opened.
    [[nodiscard]] ChunkFile readFile(const std::filesystem::path& path) const;

private:
    ReaderOptions options_;
};

}  // namespace lci::format

#endif  // LCI_FORMAT_CHUNK_READER_H
