// =============================================================================
// lci - Info Command
// =============================================================================
// Command handler for displaying chunk file contents.
//
// This module provides:
// - InfoCommand: Print header, checksums and (optionally) blocks and lines
// - Text and JSON renderings of a decoded chunk
// - Timestamp and duration formatting helpers
// =============================================================================

#ifndef LCI_COMMANDS_INFO_COMMAND_H
#define LCI_COMMANDS_INFO_COMMAND_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lci/common/error.h"
#include "lci/common/types.h"
#include "lci/format/chunk_reader.h"

namespace lci::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input chunk file paths.
    std::vector<std::string> inputPaths;

    /// @brief Show per-block details.
    bool blockDetails = false;

    /// @brief Print every log line.
    bool printLines = false;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Worker threads (0 = auto-detect).
    int threads = 0;

    format::ReaderOptions reader;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying chunk information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    ~InfoCommand();

    // Non-copyable, movable
    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = every file decoded, otherwise the first failure's code).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    InfoOptions options_;
};

// =============================================================================
// Rendering
// =============================================================================

/// @brief Format a nanosecond epoch timestamp as "YYYY-MM-DD hh:mm:ss.ffffff UTC".
[[nodiscard]] std::string formatTimestamp(Timestamp nanos);

/// @brief Format a nanosecond duration with the largest units first
///        ("1h2m3.5s", "250ms", "0s").
[[nodiscard]] std::string formatDuration(std::int64_t nanos);

/// @brief through - from, saturated to the int64 range.
[[nodiscard]] std::int64_t durationBetween(Timestamp from, Timestamp through) noexcept;

/// @brief Text report for one decoded chunk.
[[nodiscard]] std::string renderChunkText(const format::ChunkFile& file, bool blockDetails,
                                          bool printLines);

/// @brief JSON report for one decoded chunk.
[[nodiscard]] nlohmann::json chunkToJson(const format::ChunkFile& file, bool blockDetails,
                                         bool printLines);

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(InfoOptions options);

}  // namespace lci::commands

#endif  // LCI_COMMANDS_INFO_COMMAND_H
