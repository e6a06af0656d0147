// VEIL - Logging
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace veil {
namespace util {

namespace {

struct LevelName {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35;1m"},
    {LogLevel::Off,   "OFF",   "\033[0m"},
};

const LevelName& Lookup(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry;
        }
    }
    return LEVEL_NAMES[2];
}

void AppendTimestamp(std::ostream& out, std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local;
    localtime_r(&seconds, &local);
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
}

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    return Lookup(level).name;
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper(str.size(), '\0');
    std::transform(str.begin(), str.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (const auto& entry : LEVEL_NAMES) {
        if (upper == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

std::string FormatEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream out;
    if (format.timestamp) {
        AppendTimestamp(out, entry.timestamp);
        out << ' ';
    }
    if (format.level) {
        out << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (format.category && !entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        out << '[' << entry.category << "] ";
    }
    if (format.thread) {
        out << '[' << entry.threadId << "] ";
    }
    if (format.location && entry.file) {
        out << Basename(entry.file) << ':' << entry.line << ' ';
    }
    out << entry.message;
    return out.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(const Config& config)
    : ILogSink(config.level), config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatEntry(entry, config_.format);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Warn) ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", Lookup(entry.level).color, line.c_str());
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

FileSink::FileSink(const std::string& path) : FileSink([&path] {
    Config config;
    config.path = path;
    return config;
}()) {}

FileSink::FileSink(const Config& config) : ILogSink(config.level), config_(config) {
    if (!config_.path.empty()) {
        Open(config_.append ? (std::ios::out | std::ios::app) : std::ios::out);
    }
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::Open(std::ios::openmode mode) {
    file_.open(config_.path, mode);
    if (!file_.is_open()) {
        return false;
    }
    file_.seekp(0, std::ios::end);
    written_ = static_cast<size_t>(file_.tellp());
    return true;
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    LogFormat full;
    full.thread = true;
    full.location = true;
    std::string line = FormatEntry(entry, full);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (written_ + line.size() > config_.maxSize && written_ > 0) {
        Rotate();
        if (!file_.is_open()) {
            return;
        }
    }
    file_ << line;
    written_ += line.size();
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// path -> path.1 -> path.2 ... ; the oldest beyond maxFiles is overwritten
void FileSink::Rotate() {
    file_.close();
    for (size_t i = config_.maxFiles; i > 1; --i) {
        std::string from = config_.path + "." + std::to_string(i - 1);
        std::string to = config_.path + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    std::string first = config_.path + ".1";
    std::rename(config_.path.c_str(), first.c_str());
    Open(std::ios::out | std::ios::trunc);
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : ILogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
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

void Logger::MuteCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutedMutex_);
    muted_.insert(category);
    anyMuted_ = true;
}

void Logger::UnmuteCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutedMutex_);
    muted_.erase(category);
    anyMuted_ = !muted_.empty();
}

void Logger::UnmuteAll() {
    std::lock_guard<std::mutex> lock(mutedMutex_);
    muted_.clear();
    anyMuted_ = false;
}

bool Logger::IsMuted(const std::string& category) const {
    if (!anyMuted_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutedMutex_);
    return muted_.count(category) != 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && !IsMuted(category);
}

void Logger::Log(LogLevel level, const std::string& category, std::string message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = std::move(message);
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    std::vector<char> buffer(256);
    va_list args;
    va_start(args, format);
    va_list retry;
    va_copy(retry, args);
    int needed = std::vsnprintf(buffer.data(), buffer.size(), format, args);
    if (needed >= static_cast<int>(buffer.size())) {
        buffer.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), format, retry);
    }
    va_end(retry);
    va_end(args);

    Log(level, category, needed < 0 ? std::string(format) : std::string(buffer.data()), file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// Setup
// ============================================================================

bool ConfigureLogging(const LogOptions& options) {
    Logger& logger = Logger::Instance();
    logger.Flush();
    logger.ClearSinks();
    logger.SetLevel(options.level);

    if (options.console) {
        ConsoleSink::Config console;
        console.level = options.level;
        logger.AddSink(std::make_shared<ConsoleSink>(console));
    }
    if (options.file.empty()) {
        return true;
    }

    FileSink::Config fileConfig;
    fileConfig.path = options.file;
    fileConfig.level = options.level;
    auto sink = std::make_shared<FileSink>(fileConfig);
    if (!sink->IsOpen()) {
        LOG_WARN(LogCategory::DEFAULT) << "Cannot open log file " << options.file;
        return false;
    }
    logger.AddSink(std::move(sink));
    return true;
}

// ============================================================================
// LogStream / ScopedLogTimer
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

ScopedLogTimer::~ScopedLogTimer() {
    if (!Logger::Instance().WillLog(LogLevel::Debug, category_)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    Logger::Instance().Log(LogLevel::Debug, category_,
                           operation_ + " took " + std::to_string(elapsed.count()) + "ms");
}

} // namespace util
} // namespace veil
