// STRATA - Logging Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace strata {
namespace util {

// ============================================================================
// Log Level Functions
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

namespace {

std::string FormatLine(const LogEntry& entry, bool showTimestamp,
                       bool showCategory, bool showThread) {
    std::ostringstream oss;
    if (showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (showCategory && entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (showThread) {
        oss << "[" << entry.threadId << "] ";
    }
    oss << entry.message;
    return oss.str();
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : ConsoleSink(Config{}) {}

ConsoleSink::ConsoleSink(const Config& config)
    : config_(config), level_(config.level) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < level_.load()) {
        return;
    }

    std::string formatted = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    if (config_.useColors && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", GetColorCode(entry.level), formatted.c_str());
    } else {
        std::fprintf(stream, "%s\n", formatted.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

std::string ConsoleSink::Format(const LogEntry& entry) const {
    return FormatLine(entry, config_.showTimestamp, config_.showCategory,
                      config_.showThread);
}

const char* ConsoleSink::GetColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "\033[0m";
    }
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level, bool autoFlush)
    : file_(path, std::ios::out | std::ios::app),
      level_(level),
      autoFlush_(autoFlush) {}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_.load()) {
        return;
    }
    std::string formatted = FormatLine(entry, true, true, true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << formatted;
    if (!entry.file.empty()) {
        file_ << " (" << GetBasename(entry.file) << ':' << entry.line << ')';
    }
    file_ << '\n';
    if (autoFlush_ || entry.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_.load() || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Flush();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::SetCategories(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
    categories_.insert(categories.begin(), categories.end());
    allCategories_.store(categories_.empty());
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategories_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level < level_.load() || level == LogLevel::Off) {
        return false;
    }
    // Failures always get through regardless of category filters
    if (level >= LogLevel::Error) {
        return true;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation)
    : category_(category),
      operation_(std::move(operation)),
      start_(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    if (!Logger::Instance().WillLog(LogLevel::Debug, category_)) {
        return;
    }
    std::ostringstream oss;
    oss << operation_ << " took " << std::fixed << std::setprecision(2)
        << ElapsedMicros() / 1000.0 << "ms";
    Logger::Instance().Log(LogLevel::Debug, category_, oss.str());
}

int64_t ScopedLogTimer::ElapsedMicros() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

// ============================================================================
// Setup
// ============================================================================

void InitLogging(const LoggingOptions& options) {
    Logger& logger = Logger::Instance();
    logger.Flush();
    logger.ClearSinks();
    logger.SetLevel(options.level);
    logger.SetCategories(options.categories);

    if (options.console) {
        ConsoleSink::Config config;
        config.useColors = options.consoleColors;
        config.level = options.level;
        logger.AddSink(std::make_shared<ConsoleSink>(config));
    }
    if (!options.file.empty()) {
        auto sink = std::make_shared<FileSink>(options.file, options.level);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            LOG_ERROR(LogCategory::DEFAULT) << "cannot open log file " << options.file;
        }
    }
}

void ShutdownLogging() {
    Logger& logger = Logger::Instance();
    logger.Flush();
    logger.ClearSinks();
}

} // namespace util
} // namespace strata
