// STRATA - Logging System
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Leveled, category-filtered logging with pluggable sinks. Messages are
// composed with stream macros (LOG_INFO(cat) << ...) or printf-style
// helpers (LogInfoF(cat, fmt, ...)).

#ifndef STRATA_UTIL_LOGGING_H
#define STRATA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace strata {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive); unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CHAIN = "chain";
    constexpr const char* VALIDATION = "validation";
    constexpr const char* MEMPOOL = "mempool";
    constexpr const char* DB = "db";
    constexpr const char* UTXO = "utxo";
    constexpr const char* BENCH = "bench";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Output destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes formatted lines to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_.store(level); }
    LogLevel GetLevel() const override { return level_.load(); }

private:
    Config config_;
    std::atomic<LogLevel> level_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    static const char* GetColorCode(LogLevel level);
};

/// Appends formatted lines to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug,
                      bool autoFlush = false);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_.store(level); }
    LogLevel GetLevel() const override { return level_.load(); }

private:
    std::ofstream file_;
    std::atomic<LogLevel> level_;
    bool autoFlush_;
    mutable std::mutex mutex_;
};

/// Forwards entries to a callback; used by tests to capture output
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_.store(level); }
    LogLevel GetLevel() const override { return level_.load(); }

private:
    Callback callback_;
    std::atomic<LogLevel> level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given categories (empty = all)
    void SetCategories(const std::vector<std::string>& categories);
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> allCategories_{true};
    std::unordered_set<std::string> categories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Accumulates a message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STRATA_LOGGER ::strata::util::Logger::Instance()

#define STRATA_LOG_ENABLED(level, category) \
    STRATA_LOGGER.WillLog(::strata::util::LogLevel::level, category)

#define STRATA_LOG(level, category) \
    if (!STRATA_LOG_ENABLED(level, category)) {} else \
        ::strata::util::LogStream(::strata::util::LogLevel::level, category, \
                                  __FILE__, __LINE__)

#define LOG_TRACE(category)   STRATA_LOG(Trace, category)
#define LOG_DEBUG(category)   STRATA_LOG(Debug, category)
#define LOG_INFO(category)    STRATA_LOG(Info, category)
#define LOG_WARN(category)    STRATA_LOG(Warn, category)
#define LOG_ERROR(category)   STRATA_LOG(Error, category)
#define LOG_FATAL(category)   STRATA_LOG(Fatal, category)

#define STRATA_LOGF(level, category, ...) \
    do { \
        if (STRATA_LOG_ENABLED(level, category)) { \
            STRATA_LOGGER.LogF(::strata::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  STRATA_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   STRATA_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   STRATA_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  STRATA_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the elapsed time of a scope at Debug level on destruction
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

    int64_t ElapsedMicros() const;

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define STRATA_CONCAT_INNER(a, b) a##b
#define STRATA_CONCAT(a, b) STRATA_CONCAT_INNER(a, b)
#define STRATA_LOG_TIMER(category, operation) \
    ::strata::util::ScopedLogTimer STRATA_CONCAT(strata_timer_, __LINE__)(category, operation)

// ============================================================================
// Setup
// ============================================================================

struct LoggingOptions {
    LogLevel level{LogLevel::Info};
    bool console{true};
    bool consoleColors{true};
    /// Log file path; empty disables file output
    std::string file;
    /// Categories to show; empty shows all
    std::vector<std::string> categories;
};

/// Replace all sinks according to options
void InitLogging(const LoggingOptions& options);

/// Flush and remove all sinks
void ShutdownLogging();

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// File name component of a path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace strata

#endif // STRATA_UTIL_LOGGING_H
