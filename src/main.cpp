// =============================================================================
// lci - Log Chunk Inspector
// =============================================================================
// Command-line entry point.
//
//   lci [global options] info   <files...> [-b] [-l] [--json] [--legacy-layout]
//   lci [global options] verify <files...> [--fail-fast] [--legacy-layout]
//
// Reports go to stdout, log messages to the console sink and --log-file.
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "commands/info_command.h"
#include "commands/verify_command.h"
#include "lci/common/error.h"
#include "lci/common/logger.h"

namespace {

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "lci: inspect and verify compressed log chunk files\n"
    "Decodes the header, block directory and blocks of each chunk and reports\n"
    "checksums, digests and (optionally) every log line.";

/// @brief Options shared by every subcommand.
struct GlobalOptions {
    int threads = 0;
    int verbosity = 0;
    bool quiet = false;
    std::string logLevel;
    std::string logFile;

    [[nodiscard]] lci::log::Level level() const noexcept {
        if (!logLevel.empty()) {
            return lci::log::levelFromString(logLevel);
        }
        if (quiet) {
            return lci::log::Level::kError;
        }
        if (verbosity >= 2) {
            return lci::log::Level::kTrace;
        }
        return verbosity == 1 ? lci::log::Level::kDebug : lci::log::Level::kInfo;
    }
};

void addReaderFlags(CLI::App* cmd, lci::format::ReaderOptions& reader) {
    cmd->add_flag("--legacy-layout", reader.legacyLayout,
                  "Chunks carry no directory or block checksums");
}

CLI::App* addInfoCommand(CLI::App& app, lci::commands::InfoOptions& opts) {
    auto* cmd = app.add_subcommand("info", "Print the contents of chunk files");
    cmd->add_option("files", opts.inputPaths, "Chunk files")->required();
    cmd->add_flag("-b,--blocks", opts.blockDetails, "Print block details");
    cmd->add_flag("-l,--lines", opts.printLines, "Print log lines");
    cmd->add_flag("--json", opts.jsonOutput, "Output as JSON");
    addReaderFlags(cmd, opts.reader);
    return cmd;
}

CLI::App* addVerifyCommand(CLI::App& app, lci::commands::VerifyOptions& opts) {
    auto* cmd = app.add_subcommand("verify", "Verify chunk file integrity");
    cmd->add_option("files", opts.inputPaths, "Chunk files")->required();
    cmd->add_flag("--fail-fast", opts.failFast,
                  "Stop at the first block error or failed file, leaving later files unread");
    addReaderFlags(cmd, opts.reader);
    return cmd;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    GlobalOptions global;
    app.add_option("-t,--threads", global.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", global.verbosity, "Increase verbosity (-v, -vv for trace)");
    app.add_flag("-q,--quiet", global.quiet, "Only log errors");
    app.add_option("--log-level", global.logLevel, "Log level, overrides -v and -q")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error", "critical",
                               "fatal"},
                              CLI::ignore_case));
    app.add_option("--log-file", global.logFile, "Also write log messages to this file");

    lci::commands::InfoOptions infoOpts;
    lci::commands::VerifyOptions verifyOpts;
    auto* infoCmd = addInfoCommand(app, infoOpts);
    auto* verifyCmd = addVerifyCommand(app, verifyOpts);
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        lci::log::init(global.logFile, global.level());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    LCI_LOG_DEBUG("lci {} (log level {})", kVersion, lci::log::levelToString(global.level()));

    int exitCode = EXIT_SUCCESS;
    try {
        if (infoCmd->parsed()) {
            infoOpts.threads = global.threads;
            exitCode = lci::commands::createInfoCommand(std::move(infoOpts))->execute();
        } else if (verifyCmd->parsed()) {
            verifyOpts.threads = global.threads;
            verifyOpts.verbose = global.verbosity > 0;
            exitCode = lci::commands::createVerifyCommand(std::move(verifyOpts))->execute();
        }
    } catch (const lci::LCIException& ex) {
        LCI_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        LCI_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    lci::log::shutdown();
    return exitCode;
}
