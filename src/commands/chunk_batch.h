// =============================================================================
// lci - Chunk Batch Decoding
// =============================================================================
// Decodes several chunk files in parallel (one task per file). Results keep
// argument order, and a file that fails to decode does not affect the others.
// =============================================================================

#ifndef LCI_COMMANDS_CHUNK_BATCH_H
#define LCI_COMMANDS_CHUNK_BATCH_H

#include <optional>
#include <string>
#include <vector>

#include "lci/common/error.h"
#include "lci/format/chunk_reader.h"

namespace lci::commands {

/// @brief Decode result for one input file.
struct ChunkOutcome {
    std::string path;

    /// @brief Decoded file, empty on failure.
    std::optional<format::ChunkFile> file;

    /// @brief Failure that prevented decoding.
    std::optional<Error> error;

    [[nodiscard]] bool ok() const noexcept { return file.has_value(); }
};

/// @brief Decode one path, capturing any failure in the outcome.
[[nodiscard]] ChunkOutcome decodeChunkFile(const std::string& path,
                                           const format::ReaderOptions& options);

/// @brief Decode every path.
/// @param threads Worker threads (0 = auto-detect).
[[nodiscard]] std::vector<ChunkOutcome> decodeChunkFiles(const std::vector<std::string>& paths,
                                                         const format::ReaderOptions& options,
                                                         int threads);

}  // namespace lci::commands

#endif  // LCI_COMMANDS_CHUNK_BATCH_H
