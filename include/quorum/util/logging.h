// QUORUM - Logging
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Leveled, categorized logging for the governance engine. Records go to
// every registered sink whose threshold they meet: the console, a rotating
// file, or a callback (tests and embedders).

#ifndef QUORUM_UTIL_LOGGING_H
#define QUORUM_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace quorum {
namespace util {

class ConfigManager;

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn
std::optional<LogLevel> ParseLogLevel(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* VOTING = "voting";
    constexpr const char* EXECUTION = "execution";
    constexpr const char* CONFIG = "config";
    constexpr const char* CRYPTO = "crypto";
}

// ============================================================================
// Records
// ============================================================================

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point time;
    std::thread::id thread;
};

/**
 * Render a record as a single line:
 *   2024-05-01T12:00:00.123Z WARN  [execution] message (governance.cpp:42)
 * The timestamp and source location are optional.
 */
std::string FormatLogRecord(const LogRecord& record, bool withTime, bool withSource);

// ============================================================================
// Sinks
// ============================================================================

/// Destination for log records. Each sink drops records below its threshold.
class ILogSink {
public:
    explicit ILogSink(LogLevel threshold) : threshold_(threshold) {}
    virtual ~ILogSink() = default;

    virtual void Write(const LogRecord& record) = 0;
    virtual void Flush() {}

    void SetThreshold(LogLevel threshold) { threshold_.store(threshold); }
    LogLevel GetThreshold() const { return threshold_.load(); }
    bool Accepts(LogLevel level) const { return level >= threshold_.load(); }

private:
    std::atomic<LogLevel> threshold_;
};

/// Writes Info and below to stdout, Warn and above to stderr.
class ConsoleSink : public ILogSink {
public:
    /// Colors are used only when the target stream is a terminal
    explicit ConsoleSink(LogLevel threshold = LogLevel::Info, bool colors = true);

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    std::mutex mutex_;
    bool colors_;
};

/// Appends to a file, rotating it to `path.1` .. `path.N` once it grows
/// past `maxBytes`.
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, LogLevel threshold = LogLevel::Debug,
             size_t maxBytes = 10 * 1024 * 1024, size_t keepFiles = 3);
    ~FileSink() override;

    bool IsOpen() const;
    size_t BytesWritten() const;
    const std::string& GetPath() const { return path_; }

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    void Rotate();

    const std::string path_;
    const size_t maxBytes_;
    const size_t keepFiles_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    size_t bytes_{0};
};

/// Hands each accepted record to a function.
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback, LogLevel threshold = LogLevel::Trace)
        : ILogSink(threshold), callback_(std::move(callback)) {}

    void Write(const LogRecord& record) override {
        if (callback_) {
            callback_(record);
        }
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Process-wide logger. A record is emitted when its level is at or above
 * the global level and its category is enabled. With no categories
 * enabled explicitly, every category is.
 */
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void EnableCategory(const std::string& category);
    /// Back to logging every category
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool ShouldLog(LogLevel level, const std::string& category) const;

    void Write(LogLevel level, const std::string& category, std::string message,
               const char* file = nullptr, int line = 0);

    /// printf-style; messages longer than 4 KiB are truncated
    void Writef(LogLevel level, const std::string& category,
                const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    mutable std::mutex categoriesMutex_;
    std::set<std::string> categories_;
};

/**
 * Configure the global logger from the [logging] section:
 *   loglevel        trace|debug|info|warn|error|off (default info)
 *   printtoconsole  console sink on/off (default on)
 *   logfile         path of a rotating file sink (default none)
 *   debug           comma-separated categories to restrict output to
 * Replaces any sinks already registered. Returns false if the level is
 * unknown or the log file cannot be opened; the rest is still applied.
 */
bool InitLogging(const ConfigManager& config);

// ============================================================================
// Stream Interface
// ============================================================================

/// Collects a message with operator<< and writes it on destruction.
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    std::ostringstream buffer_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Macros
// ============================================================================

#define QUORUM_LOGGER ::quorum::util::Logger::Instance()

/// Arguments are not evaluated when the record would be dropped
#define QUORUM_LOG(level, category) \
    if (!QUORUM_LOGGER.ShouldLog(::quorum::util::LogLevel::level, category)) {} \
    else ::quorum::util::LogStream(::quorum::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   QUORUM_LOG(Trace, category)
#define LOG_DEBUG(category)   QUORUM_LOG(Debug, category)
#define LOG_INFO(category)    QUORUM_LOG(Info, category)
#define LOG_WARN(category)    QUORUM_LOG(Warn, category)
#define LOG_ERROR(category)   QUORUM_LOG(Error, category)

#define QUORUM_LOGF(level, category, ...) \
    do { \
        if (QUORUM_LOGGER.ShouldLog(::quorum::util::LogLevel::level, category)) { \
            QUORUM_LOGGER.Writef(::quorum::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  QUORUM_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   QUORUM_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   QUORUM_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  QUORUM_LOGF(Error, category, __VA_ARGS__)

} // namespace util
} // namespace quorum

#endif // QUORUM_UTIL_LOGGING_H
