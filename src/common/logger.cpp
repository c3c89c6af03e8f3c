// =============================================================================
// lci - Logger Module Implementation
// =============================================================================

#include "lci/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lci::log {

namespace {

struct LevelInfo {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

constexpr std::array<LevelInfo, 6> kLevels{{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
}};

const LevelInfo& infoFor(Level level) noexcept {
    const auto it = std::find_if(kLevels.begin(), kLevels.end(),
                                 [level](const LevelInfo& info) { return info.level == level; });
    return it != kLevels.end() ? *it : kLevels[2];
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    // A logger needs at least one sink
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("lci_console"));
    }
    return sinks;
}

}  // namespace

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    return infoFor(level).quillLevel;
}

Level levelFromString(std::string_view levelStr) noexcept {
    if (equalsIgnoreCase(levelStr, "warn")) {
        return Level::kWarning;
    }
    if (equalsIgnoreCase(levelStr, "fatal")) {
        return Level::kCritical;
    }
    for (const auto& info : kLevels) {
        if (equalsIgnoreCase(levelStr, info.name)) {
            return info.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    return infoFor(level).name;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::BackendOptions backendOptions;
    backendOptions.thread_name = "lci_log";
    quill::Backend::start(backendOptions);

    quill::Logger* instance =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    instance->set_log_level(toQuillLevel(config.level));
    gLogger.store(instance, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* instance = logger()) {
        instance->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (quill::Logger* instance = gLogger.exchange(nullptr, std::memory_order_acq_rel)) {
        instance->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace lci::log
