// VEIL - Logging
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks. Request signing,
// transition assembly, puzzle proving and storage all report through the
// LOG_* macros below.

#ifndef VEIL_UTIL_LOGGING_H
#define VEIL_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace veil {
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

/// Unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* CIRCUIT = "circuit";
    constexpr const char* REQUEST = "request";
    constexpr const char* TRANSITION = "transition";
    constexpr const char* PUZZLE = "puzzle";
    constexpr const char* STORAGE = "storage";
    constexpr const char* DB = "db";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which parts of an entry a sink prints, in this order
struct LogFormat {
    bool timestamp{true};
    bool level{true};
    bool category{true};
    bool thread{false};
    bool location{false};
};

/// Render an entry as a single line without a trailing newline
std::string FormatEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    /// Called for every entry at or above the sink level
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// Writes to stdout; Warn and above go to stderr when useStderr is set
class ConsoleSink : public ILogSink {
public:
    struct Config {
        LogFormat format;
        bool useColors{true};
        bool useStderr{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() : ConsoleSink(Config{}) {}
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * Appends full-format entries to a file and rotates it past maxSize bytes
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const std::string& path);
    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t written_{0};

    bool Open(std::ios::openmode mode);
    void Rotate();
};

/// Forwards entries to a callback; used by tests to capture output
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
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

    /// Silence one category without touching the level
    void MuteCategory(const std::string& category);
    void UnmuteCategory(const std::string& category);
    void UnmuteAll();
    bool IsMuted(const std::string& category) const;

    void Log(LogLevel level, const std::string& category, std::string message,
             const char* file = nullptr, int line = 0);

    /// printf-style variant of Log
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::set<std::string> muted_;
    std::atomic<bool> anyMuted_{false};
    mutable std::mutex mutedMutex_;
};

// ============================================================================
// Setup
// ============================================================================

/// What a tool asks for in its [log] section
struct LogOptions {
    LogLevel level{LogLevel::Info};
    std::string file;
    bool console{true};
};

/// Replace the logger's sinks with the ones described by options. Returns
/// false if the log file could not be opened; console logging still works.
bool ConfigureLogging(const LogOptions& options);

// ============================================================================
// Log Stream
// ============================================================================

/**
 * Collects a message and hands it to the logger on destruction
 */
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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
// Scoped Log Timer
// ============================================================================

/// Logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation)
        : category_(category)
        , operation_(std::move(operation))
        , start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Macros
// ============================================================================

#define VEIL_LOGGER ::veil::util::Logger::Instance()

#define VEIL_LOG(level, category) \
    if (!VEIL_LOGGER.WillLog(::veil::util::LogLevel::level, category)) {} else \
        ::veil::util::LogStream(::veil::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   VEIL_LOG(Trace, category)
#define LOG_DEBUG(category)   VEIL_LOG(Debug, category)
#define LOG_INFO(category)    VEIL_LOG(Info, category)
#define LOG_WARN(category)    VEIL_LOG(Warn, category)
#define LOG_ERROR(category)   VEIL_LOG(Error, category)
#define LOG_FATAL(category)   VEIL_LOG(Fatal, category)

#define VEIL_LOGF(level, category, ...) \
    VEIL_LOGGER.LogF(::veil::util::LogLevel::level, category, __FILE__, __LINE__, __VA_ARGS__)

#define LogDebugF(category, ...)  VEIL_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   VEIL_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   VEIL_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  VEIL_LOGF(Error, category, __VA_ARGS__)

#define VEIL_LOG_CONCAT_INNER(a, b) a##b
#define VEIL_LOG_CONCAT(a, b) VEIL_LOG_CONCAT_INNER(a, b)
#define VEIL_LOG_TIMER(category, operation) \
    ::veil::util::ScopedLogTimer VEIL_LOG_CONCAT(veil_timer_, __LINE__)(category, operation)

} // namespace util
} // namespace veil

#endif // VEIL_UTIL_LOGGING_H
