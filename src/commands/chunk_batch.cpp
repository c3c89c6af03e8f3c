// =============================================================================
// lci - Chunk Batch Decoding Implementation
// =============================================================================

#include "commands/chunk_batch.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "lci/common/logger.h"

namespace lci::commands {

namespace {

ChunkOutcome decodeOne(const format::ChunkReader& reader, const std::string& path) {
    ChunkOutcome outcome;
    outcome.path = path;
    try {
        outcome.file.emplace(reader.readFile(path));
    } catch (const LCIException& e) {
        LCI_LOG_ERROR("{}: {}", path, e.what());
        outcome.error = Error(e);
    } catch (const std::exception& e) {
        LCI_LOG_ERROR("{}: unexpected error: {}", path, e.what());
        outcome.error = Error(ErrorCode::kIOError, e.what());
    }
    return outcome;
}

}  // namespace

ChunkOutcome decodeChunkFile(const std::string& path, const format::ReaderOptions& options) {
    return decodeOne(format::ChunkReader(options), path);
}

std::vector<ChunkOutcome> decodeChunkFiles(const std::vector<std::string>& paths,
                                           const format::ReaderOptions& options, int threads) {
    std::vector<ChunkOutcome> outcomes(paths.size());
    const format::ChunkReader reader(options);

    tbb::task_arena arena(threads > 0 ? threads : tbb::task_arena::automatic);
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, paths.size()),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  outcomes[i] = decodeOne(reader, paths[i]);
                              }
                          });
    });

    LCI_LOG_DEBUG("Decoded {} file(s)", paths.size());
    return outcomes;
}

}  // namespace lci::commands
