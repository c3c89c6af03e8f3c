// =============================================================================
// lci - Verify Command Implementation
// =============================================================================

#include "commands/verify_command.h"

#include <iostream>

#include <fmt/format.h>

#include "commands/chunk_batch.h"
#include "lci/common/logger.h"

namespace lci::commands {

namespace {

VerificationResult checkMetadataChecksum(const format::DecodedChunk& chunk) {
    VerificationResult result;
    result.checkName = "Metadata checksum";
    result.passed = chunk.metadataChecksumOk();
    if (!chunk.storedMetadataChecksum()) {
        result.details = fmt::format("no stored checksum, computed {:08x}",
                                     chunk.computedMetadataChecksum());
    } else if (result.passed) {
        result.details = fmt::format("{:08x}", chunk.computedMetadataChecksum());
    } else {
        result.errorMessage = fmt::format("stored {:08x}, computed {:08x}",
                                          *chunk.storedMetadataChecksum(),
                                          chunk.computedMetadataChecksum());
    }
    return result;
}

VerificationResult checkBlockChecksum(const format::Block& block) {
    VerificationResult result;
    result.checkName = fmt::format("Block {} checksum", block.index);
    result.passed = block.checksumOk();
    if (!result.passed) {
        result.errorMessage = fmt::format("stored {:08x}, computed {:08x}",
                                          *block.storedChecksum, block.computedChecksum);
    }
    return result;
}

VerificationResult checkBlockDecoding(const format::Block& block) {
    VerificationResult result;
    result.checkName = fmt::format("Block {} decoding", block.index);
    result.passed = block.ok();
    if (block.error) {
        result.errorMessage = fmt::format("{}: {}", errorCodeToString(block.error->code()),
                                          block.error->message());
    } else {
        result.details = fmt::format("{} entries, {} bytes", block.entries.size(),
                                     block.uncompressedLength);
    }
    return result;
}

VerificationResult checkBlockBounds(const format::Block& block) {
    VerificationResult result;
    result.checkName = fmt::format("Block {} time bounds", block.index);
    result.passed = block.boundsConsistent();
    if (!result.passed) {
        result.errorMessage = fmt::format("entries fall outside [{}, {}]",
                                          block.descriptor.minT, block.descriptor.maxT);
    }
    if (!block.entryCountMatches()) {
        result.details = fmt::format("declared {} entries, decoded {}",
                                     block.descriptor.numEntries, block.entries.size());
    }
    return result;
}

}  // namespace

VerificationSummary verifyChunk(const format::ChunkFile& file) {
    VerificationSummary summary;
    summary.path = file.path;
    summary.addResult(checkMetadataChecksum(file.chunk));
    for (const auto& block : file.chunk.blocks()) {
        summary.addResult(checkBlockChecksum(block));
        summary.addResult(checkBlockDecoding(block));
        summary.addResult(checkBlockBounds(block));
    }
    return summary;
}

// =============================================================================
// VerifyCommand Implementation
// =============================================================================

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {
    options_.reader.failFast = options_.failFast;
}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    summaries_.clear();
    int exitCode = 0;

    if (options_.failFast) {
        // One file at a time so nothing past the first failure is opened
        for (const auto& path : options_.inputPaths) {
            if (!record(decodeChunkFile(path, options_.reader), exitCode)) {
                break;
            }
        }
    } else {
        for (const auto& outcome :
             decodeChunkFiles(options_.inputPaths, options_.reader, options_.threads)) {
            record(outcome, exitCode);
        }
    }

    std::cout.flush();
    return exitCode;
}

bool VerifyCommand::record(const ChunkOutcome& outcome, int& exitCode) {
    VerificationSummary summary;
    if (outcome.ok()) {
        summary = verifyChunk(*outcome.file);
    } else {
        summary.path = outcome.path;
        summary.addResult(VerificationResult{"Decode", false, outcome.error->message(), {}});
    }

    printSummary(summary);
    const bool passed = summary.passed();
    if (!passed && exitCode == 0) {
        exitCode = outcome.ok() ? toExitCode(ErrorCode::kChecksumMismatch)
                                : outcome.error->exitCode();
    }
    summaries_.push_back(std::move(summary));
    return passed;
}

void VerifyCommand::printSummary(const VerificationSummary& summary) const {
    std::cout << fmt::format("{}: {} ({}/{} checks passed)\n", summary.path,
                             summary.passed() ? "OK" : "FAILED", summary.passedChecks,
                             summary.totalChecks);

    for (const auto& result : summary.results) {
        if (!result.passed) {
            std::cout << fmt::format("  [FAIL] {}: {}\n", result.checkName, result.errorMessage);
        } else if (options_.verbose) {
            std::cout << fmt::format("  [PASS] {}{}{}\n", result.checkName,
                                     result.details.empty() ? "" : ": ", result.details);
        }
    }
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<VerifyCommand> createVerifyCommand(VerifyOptions options) {
    return std::make_unique<VerifyCommand>(std::move(options));
}

}  // namespace lci::commands
