// =============================================================================
// lci - Info Command Implementation
// =============================================================================

#include "commands/info_command.h"

#include <chrono>
#include <iostream>
#include <iterator>
#include <limits>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "commands/chunk_batch.h"
#include "lci/common/checksum.h"
#include "lci/common/logger.h"
#include "lci/format/codec_registry.h"

namespace lci::commands {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

/// @brief Whole part of v / 10^precision, plus the fraction with trailing zeros removed.
std::string fixedPoint(std::uint64_t v, int precision) {
    std::uint64_t scale = 1;
    for (int i = 0; i < precision; ++i) {
        scale *= 10;
    }
    std::string out = std::to_string(v / scale);
    if (const std::uint64_t frac = v % scale; frac != 0) {
        std::string digits = fmt::format("{:0{}}", frac, precision);
        digits.erase(digits.find_last_not_of('0') + 1);
        out += '.';
        out += digits;
    }
    return out;
}

std::string_view trimSpace(std::string_view s) {
    constexpr std::string_view kSpace = " \t\n\v\f\r";
    const auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

double ratio(std::uint64_t numerator, std::uint64_t denominator) {
    return denominator == 0 ? 0.0
                            : static_cast<double>(numerator) / static_cast<double>(denominator);
}

std::string checksumText(std::optional<Checksum> stored, Checksum computed) {
    if (!stored) {
        return fmt::format("none (computed: {:08x})", computed);
    }
    if (*stored == computed) {
        return fmt::format("{:08x} OK", *stored);
    }
    return fmt::format("{:08x} BAD (computed: {:08x})", *stored, computed);
}

nlohmann::json checksumJson(std::optional<Checksum> stored, Checksum computed) {
    nlohmann::json j;
    j["stored"] = stored ? nlohmann::json(fmt::format("{:08x}", *stored)) : nlohmann::json();
    j["computed"] = fmt::format("{:08x}", computed);
    j["ok"] = !stored || *stored == computed;
    return j;
}

}  // namespace

// =============================================================================
// Rendering
// =============================================================================

std::string formatTimestamp(Timestamp nanos) {
    std::int64_t seconds = nanos / kNanosPerSecond;
    std::int64_t rem = nanos % kNanosPerSecond;
    if (rem < 0) {
        rem += kNanosPerSecond;
        --seconds;
    }
    const std::chrono::sys_seconds tp{std::chrono::seconds{seconds}};
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06} UTC", tp, rem / 1000);
}

std::string formatDuration(std::int64_t nanos) {
    if (nanos == 0) {
        return "0s";
    }
    const bool negative = nanos < 0;
    std::uint64_t u = negative ? 0 - static_cast<std::uint64_t>(nanos)
                               : static_cast<std::uint64_t>(nanos);
    std::string out;

    if (u < static_cast<std::uint64_t>(kNanosPerSecond)) {
        if (u < 1'000) {
            out = fixedPoint(u, 0) + "ns";
        } else if (u < 1'000'000) {
            out = fixedPoint(u, 3) + "µs";
        } else {
            out = fixedPoint(u, 6) + "ms";
        }
    } else {
        constexpr std::uint64_t kNanosPerMinute = 60ULL * kNanosPerSecond;
        out = fixedPoint(u % kNanosPerMinute, 9) + "s";
        const std::uint64_t minutes = u / kNanosPerMinute;
        if (minutes > 0) {
            const std::uint64_t hours = minutes / 60;
            out = (hours > 0 ? fmt::format("{}h{}m", hours, minutes % 60)
                             : fmt::format("{}m", minutes)) +
                  out;
        }
    }
    return negative ? "-" + out : out;
}

std::int64_t durationBetween(Timestamp from, Timestamp through) noexcept {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (from < 0 && through > kMax + from) {
        return kMax;
    }
    if (from > 0 && through < kMin + from) {
        return kMin;
    }
    return through - from;
}

std::string renderChunkText(const format::ChunkFile& file, bool blockDetails, bool printLines) {
    const auto& header = file.header;
    const auto& chunk = file.chunk;
    std::string out;
    auto it = std::back_inserter(out);

    const Timestamp from = modelTimeToNanos(header.from);
    const Timestamp through = modelTimeToNanos(header.through);

    fmt::format_to(it, "\nChunks file: {}\n", file.path);
    fmt::format_to(it, "Metadata length: {}\n", header.metadataLength);
    fmt::format_to(it, "Data length: {}\n", header.dataLength);
    fmt::format_to(it, "UserID: {}\n", header.userId);
    fmt::format_to(it, "From: {}\n", formatTimestamp(from));
    fmt::format_to(it, "Through: {} ({})\n", formatTimestamp(through),
                   formatDuration(durationBetween(from, through)));
    fmt::format_to(it, "Labels:\n");
    for (const auto& label : header.labels) {
        fmt::format_to(it, "\t {} = {}\n", label.name, label.value);
    }

    fmt::format_to(it, "Encoding: {}\n", format::codecName(chunk.codec()));
    fmt::format_to(it, "Blocks Metadata Checksum: {}\n",
                   checksumText(chunk.storedMetadataChecksum(), chunk.computedMetadataChecksum()));
    if (blockDetails) {
        fmt::format_to(it, "Found {} block(s)\n\n", chunk.blocks().size());
    } else {
        fmt::format_to(it, "Found {} block(s), use -b to show block details\n",
                       chunk.blocks().size());
    }

    for (const auto& block : chunk.blocks()) {
        const auto& d = block.descriptor;
        if (blockDetails) {
            fmt::format_to(it,
                           "Block {:4}: position: {:8}, original length: {:6} (stored: {:6}, "
                           "ratio: {:.2f}), minT: {} maxT: {}, checksum: {}\n",
                           block.index, d.dataOffset, block.uncompressedLength, d.dataLength,
                           ratio(block.uncompressedLength, d.dataLength), formatTimestamp(d.minT),
                           formatTimestamp(d.maxT),
                           checksumText(block.storedChecksum, block.computedChecksum));
            fmt::format_to(it, "Block {:4}: digest compressed: {}, uncompressed: {}\n",
                           block.index, toHex(block.compressedDigest),
                           toHex(block.uncompressedDigest));
        }
        if (block.error) {
            fmt::format_to(it, "Block {:4}: error: {}\n", block.index, block.error->message());
        }
        if (printLines) {
            for (const auto& entry : block.entries) {
                fmt::format_to(it, "{}\t{}\n", formatTimestamp(entry.timestamp),
                               trimSpace(entry.line));
            }
        }
    }

    const std::uint64_t totalSize = chunk.totalUncompressedSize();
    fmt::format_to(it, "Total size of uncompressed data: {} file size: {} ratio: {:.3g}\n",
                   totalSize, file.fileSize, ratio(totalSize, file.fileSize));
    return out;
}

nlohmann::json chunkToJson(const format::ChunkFile& file, bool blockDetails, bool printLines) {
    const auto& header = file.header;
    const auto& chunk = file.chunk;
    const Timestamp from = modelTimeToNanos(header.from);
    const Timestamp through = modelTimeToNanos(header.through);

    nlohmann::json j;
    j["file"] = file.path;
    j["fileSize"] = file.fileSize;
    j["metadataLength"] = header.metadataLength;
    j["dataLength"] = header.dataLength;
    j["fingerprint"] = header.fingerprint;
    j["userID"] = header.userId;
    j["from"] = formatTimestamp(from);
    j["through"] = formatTimestamp(through);
    j["duration"] = formatDuration(durationBetween(from, through));

    nlohmann::json labels = nlohmann::json::object();
    for (const auto& label : header.labels) {
        labels[label.name] = label.value;
    }
    j["labels"] = std::move(labels);

    j["format"] = chunk.formatVersion();
    j["encoding"] = std::string(format::codecName(chunk.codec()));
    j["metadataChecksum"] =
        checksumJson(chunk.storedMetadataChecksum(), chunk.computedMetadataChecksum());
    j["blockCount"] = chunk.blocks().size();

    if (blockDetails || printLines) {
        nlohmann::json blocks = nlohmann::json::array();
        for (const auto& block : chunk.blocks()) {
            const auto& d = block.descriptor;
            nlohmann::json b;
            b["index"] = block.index;
            if (blockDetails) {
                b["position"] = d.dataOffset;
                b["uncompressedLength"] = block.uncompressedLength;
                b["storedLength"] = d.dataLength;
                b["numEntries"] = d.numEntries;
                b["minT"] = formatTimestamp(d.minT);
                b["maxT"] = formatTimestamp(d.maxT);
                b["checksum"] = checksumJson(block.storedChecksum, block.computedChecksum);
                b["compressedDigest"] = toHex(block.compressedDigest);
                b["uncompressedDigest"] = toHex(block.uncompressedDigest);
            }
            if (block.error) {
                b["error"] = {{"code", std::string(errorCodeToString(block.error->code()))},
                              {"message", block.error->message()}};
            }
            if (printLines) {
                nlohmann::json entries = nlohmann::json::array();
                for (const auto& entry : block.entries) {
                    entries.push_back({{"timestamp", formatTimestamp(entry.timestamp)},
                                       {"line", std::string(trimSpace(entry.line))}});
                }
                b["entries"] = std::move(entries);
            }
            blocks.push_back(std::move(b));
        }
        j["blocks"] = std::move(blocks);
    }

    j["totalUncompressedSize"] = chunk.totalUncompressedSize();
    j["ratio"] = ratio(chunk.totalUncompressedSize(), file.fileSize);
    return j;
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    auto outcomes = decodeChunkFiles(options_.inputPaths, options_.reader, options_.threads);

    int exitCode = 0;
    nlohmann::json report = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            if (exitCode == 0) {
                exitCode = outcome.error->exitCode();
            }
            if (options_.jsonOutput) {
                report.push_back({{"file", outcome.path},
                                  {"error",
                                   {{"code", std::string(errorCodeToString(outcome.error->code()))},
                                    {"message", outcome.error->message()}}}});
            }
            continue;
        }

        if (options_.jsonOutput) {
            report.push_back(chunkToJson(*outcome.file, options_.blockDetails, options_.printLines));
        } else {
            std::cout << renderChunkText(*outcome.file, options_.blockDetails,
                                         options_.printLines);
        }
    }

    if (options_.jsonOutput) {
        std::cout << report.dump(2) << '\n';
    }
    std::cout.flush();
    return exitCode;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InfoCommand> createInfoCommand(InfoOptions options) {
    return std::make_unique<InfoCommand>(std::move(options));
}

}  // namespace lci::commands
