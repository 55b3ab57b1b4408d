// =============================================================================
// vq-tiers - Logger Module Implementation
// =============================================================================

#include "vqt/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vqt::log {

namespace {

constexpr const char* kLoggerName = "vqt";

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

/// @brief Caller holds gInitMutex.
void createLogger(const Config& config) {
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.console || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("vqt_console"));
    }
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

}  // namespace

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

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
    }
    return quill::LogLevel::Info;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    createLogger(config);
}

quill::Logger* logger() {
    if (quill::Logger* existing = gLogger.load(std::memory_order_acquire)) {
        return existing;
    }
    std::lock_guard<std::mutex> lock(gInitMutex);
    createLogger(Config{});
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gLogger.load(std::memory_order_acquire) != nullptr;
}

void flush() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire)) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace vqt::log
