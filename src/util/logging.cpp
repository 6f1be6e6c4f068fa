// QUORUM - Logging Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/util/logging.h"
#include "quorum/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>

#include <unistd.h>

namespace quorum {
namespace util {

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off" || name == "none") return LogLevel::Off;
    return std::nullopt;
}

namespace {

std::string FormatUtc(std::chrono::system_clock::time_point tp) {
    auto sinceEpoch = tp.time_since_epoch();
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buffer + len, sizeof(buffer) - len, ".%03dZ", static_cast<int>(millis));
    return buffer;
}

const char* Basename(const char* path) {
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // anonymous namespace

std::string FormatLogRecord(const LogRecord& record, bool withTime, bool withSource) {
    std::string line;
    line.reserve(record.message.size() + 64);

    if (withTime) {
        line += FormatUtc(record.time);
        line += ' ';
    }

    std::string level = LogLevelToString(record.level);
    level.resize(5, ' ');
    line += level;
    line += ' ';

    if (!record.category.empty() && record.category != LogCategory::DEFAULT) {
        line += '[';
        line += record.category;
        line += "] ";
    }

    line += record.message;

    if (withSource && record.file) {
        line += " (";
        line += Basename(record.file);
        line += ':';
        line += std::to_string(record.line);
        line += ')';
    }
    return line;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(LogLevel threshold, bool colors)
    : ILogSink(threshold), colors_(colors) {}

void ConsoleSink::Write(const LogRecord& record) {
    FILE* stream = record.level >= LogLevel::Warn ? stderr : stdout;
    std::string line = FormatLogRecord(record, true, false);

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = LevelColor(record.level);
    if (colors_ && *color && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel threshold,
                   size_t maxBytes, size_t keepFiles)
    : ILogSink(threshold)
    , path_(path)
    , maxBytes_(maxBytes)
    , keepFiles_(keepFiles)
    , out_(path, std::ios::out | std::ios::app) {
    if (out_.is_open()) {
        out_.seekp(0, std::ios::end);
        bytes_ = static_cast<size_t>(out_.tellp());
    }
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.is_open();
}

size_t FileSink::BytesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

void FileSink::Write(const LogRecord& record) {
    std::string line = FormatLogRecord(record, true, true);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        return;
    }
    if (maxBytes_ > 0 && bytes_ > 0 && bytes_ + line.size() > maxBytes_) {
        Rotate();
        if (!out_.is_open()) {
            return;
        }
    }
    out_ << line;
    bytes_ += line.size();

    // Warnings and errors are flushed immediately
    if (record.level >= LogLevel::Warn) {
        out_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

void FileSink::Rotate() {
    out_.close();

    if (keepFiles_ > 0) {
        // path.(N-1) -> path.N, ..., path -> path.1; gaps in the chain are fine
        std::remove((path_ + "." + std::to_string(keepFiles_)).c_str());
        for (size_t i = keepFiles_; i > 1; --i) {
            std::rename((path_ + "." + std::to_string(i - 1)).c_str(),
                        (path_ + "." + std::to_string(i)).c_str());
        }
        std::rename(path_.c_str(), (path_ + ".1").c_str());
    }
    out_.open(path_, std::ios::out | std::ios::trunc);
    bytes_ = 0;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::ShouldLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Write(LogLevel level, const std::string& category, std::string message,
                   const char* file, int line) {
    if (!ShouldLog(level, category)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.message = std::move(message);
    record.file = file;
    record.line = line;
    record.time = std::chrono::system_clock::now();
    record.thread = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(level)) {
            sink->Write(record);
        }
    }
}

void Logger::Writef(LogLevel level, const std::string& category,
                    const char* file, int line, const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Write(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

bool InitLogging(const ConfigManager& config) {
    const std::string section = ConfigKeys::LOGGING_SECTION;
    Logger& logger = Logger::Instance();
    logger.ClearSinks();

    bool ok = true;
    std::string levelName = config.GetString(ConfigKeys::LOGLEVEL, "info", section);
    auto level = ParseLogLevel(levelName);
    logger.SetLevel(level.value_or(LogLevel::Info));

    if (config.GetBool(ConfigKeys::PRINTTOCONSOLE, true, section)) {
        logger.AddSink(std::make_shared<ConsoleSink>(logger.GetLevel()));
    }

    std::string logFile = config.GetPath(ConfigKeys::LOGFILE, "", section);
    bool fileOpened = true;
    if (!logFile.empty()) {
        auto sink = std::make_shared<FileSink>(logFile, logger.GetLevel());
        fileOpened = sink->IsOpen();
        if (fileOpened) {
            logger.AddSink(sink);
        }
    }

    logger.EnableAllCategories();
    for (const auto& category : config.GetList(ConfigKeys::DEBUG, section)) {
        logger.EnableCategory(category);
    }

    if (!level) {
        LogErrorF(LogCategory::CONFIG, "Unknown log level '%s', using info", levelName.c_str());
        ok = false;
    }
    if (!fileOpened) {
        LogErrorF(LogCategory::CONFIG, "Cannot open log file %s", logFile.c_str());
        ok = false;
    }
    return ok;
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Write(level_, category_, buffer_.str(), file_, line_);
}

} // namespace util
} // namespace quorum
