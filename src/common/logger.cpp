// =============================================================================
// xz-blocks - Logger Module Implementation
// =============================================================================

#include "xzb/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xzb::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Global logger instance pointer.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Flag indicating if the logger has been initialized.
std::atomic<bool> gInitialized{false};

/// @brief Mutex for initialization synchronization.
std::mutex gInitMutex;

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// @brief Create sinks and the logger. Caller holds gInitMutex.
void initLocked(const Config& config) {
    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('w');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(fileSink);
    }

    // A logger always needs at least one sink
    if (sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

/// @brief Build the default configuration used by lazy initialization.
Config defaultConfig() {
    Config config;
    if (const char* envLevel = std::getenv(kLogLevelEnvVar); envLevel != nullptr) {
        config.level = levelFromString(envLevel, Level::kWarning);
    }
    return config;
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
        default:
            return quill::LogLevel::Info;
    }
}

Level levelFromString(std::string_view levelStr, Level fallback) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }

    return fallback;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
        default:
            return "info";
    }
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    initLocked(config);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr != nullptr) {
        return loggerPtr;
    }

    std::lock_guard<std::mutex> lock(gInitMutex);
    initLocked(defaultConfig());
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (isInitialized()) {
        quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
        if (loggerPtr != nullptr) {
            loggerPtr->flush_log();
        }
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (isInitialized()) {
        flush();
        quill::Backend::stop();
        gLogger.store(nullptr, std::memory_order_release);
        gInitialized.store(false, std::memory_order_release);
    }
}

}  // namespace xzb::log
