// =============================================================================
// lci - Verify Command
// =============================================================================
// Command handler for verifying chunk file integrity.
//
// This module provides:
// - VerifyCommand: Check metadata and block checksums, block decoding and
//   block time bounds for every input file
// - verifyChunk(): the checks for one decoded chunk
// =============================================================================

#ifndef LCI_COMMANDS_VERIFY_COMMAND_H
#define LCI_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "commands/chunk_batch.h"
#include "lci/common/error.h"
#include "lci/format/chunk_reader.h"

namespace lci::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    /// @brief Check name.
    std::string checkName;

    /// @brief Whether check passed.
    bool passed = false;

    /// @brief Error message (if failed).
    std::string errorMessage;

    /// @brief Additional details.
    std::string details;
};

/// @brief Verification summary for one file.
struct VerificationSummary {
    std::string path;

    std::uint32_t totalChecks = 0;

    std::uint32_t passedChecks = 0;

    std::uint32_t failedChecks = 0;

    /// @brief Individual results.
    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verify command.
struct VerifyOptions {
    /// @brief Input chunk file paths.
    std::vector<std::string> inputPaths;

    /// @brief Abort a chunk on its first block error, and decode files one
    ///        at a time, stopping at the first that fails.
    bool failFast = false;

    /// @brief Print every check, not only failures.
    bool verbose = false;

    /// @brief Worker threads (0 = auto-detect).
    int threads = 0;

    format::ReaderOptions reader;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying chunk integrity.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = success, kChecksumMismatch = a check failed,
    ///         otherwise the code of the first file that failed to decode).
    [[nodiscard]] int execute();

    /// @brief Per-file summaries of the last execution.
    [[nodiscard]] const std::vector<VerificationSummary>& summaries() const noexcept {
        return summaries_;
    }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    /// @brief Verify and print one outcome, keeping the first failure's exit code.
    /// @return Whether every check passed.
    bool record(const ChunkOutcome& outcome, int& exitCode);

    void printSummary(const VerificationSummary& summary) const;

    VerifyOptions options_;

    std::vector<VerificationSummary> summaries_;
};

/// @brief Run every check against a decoded chunk.
[[nodiscard]] VerificationSummary verifyChunk(const format::ChunkFile& file);

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a verify command from CLI options.
[[nodiscard]] std::unique_ptr<VerifyCommand> createVerifyCommand(VerifyOptions options);

}  // namespace lci::commands

#endif  // LCI_COMMANDS_VERIFY_COMMAND_H
