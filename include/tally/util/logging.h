// TALLY - Logging
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Process-wide logger with a level threshold, per-category switches and
// pluggable sinks. Messages are composed with the LOG_* stream macros:
//
//     LOG_DEBUG(LogCategory::WALLET) << "Folded " << n << " transactions";
//
// The stream operands are only evaluated when the message will be logged.

#ifndef TALLY_UTIL_LOGGING_H
#define TALLY_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace tally {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off     ///< Threshold only: nothing is logged
};

/// Upper-case name ("TRACE" .. "OFF")
const char* LogLevelName(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn
std::optional<LogLevel> ParseLogLevel(const std::string& name);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* WALLET = "wallet";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point time;
};

/// "[time ]LEVEL [category] message"; the default category is not shown
std::string FormatLogRecord(const LogRecord& record, bool withTime);

// ============================================================================
// Sinks
// ============================================================================

/// Destination for records at or above its own minimum level
class LogSink {
public:
    explicit LogSink(LogLevel minLevel) : minLevel_(minLevel) {}
    virtual ~LogSink() = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    bool Accepts(LogLevel level) const { return level >= minLevel_.load(); }
    void SetMinLevel(LogLevel level) { minLevel_.store(level); }

    /// Called with the logger's sink lock held
    virtual void Write(const LogRecord& record) = 0;
    virtual void Flush() {}

private:
    std::atomic<LogLevel> minLevel_;
};

/// Writes formatted lines to a stream the caller keeps alive (std::cerr, ...)
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(std::ostream& out,
                         LogLevel minLevel = LogLevel::Info,
                         bool withTime = true);

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    std::ostream& out_;
    bool withTime_;
};

/// Appends formatted lines, with source location, to a file
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogLevel minLevel = LogLevel::Debug);

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    std::string path_;
    std::ofstream file_;
};

/// Hands every accepted record to a function
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback, LogLevel minLevel = LogLevel::Trace);

    void Write(const LogRecord& record) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * The process-wide logger.
 *
 * A record is dispatched when its level passes the logger threshold and its
 * category is not disabled; each sink then applies its own minimum level.
 * All members are safe to call from any thread.
 */
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void SetCategoryEnabled(const std::string& category, bool enabled);
    bool IsCategoryEnabled(const std::string& category) const;

    /// Re-enable every category
    void ResetCategories();

    bool ShouldLog(LogLevel level, const std::string& category) const;

    void Write(LogLevel level, const std::string& category, std::string message,
               const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex categoryMutex_;
    std::set<std::string> disabledCategories_;

    mutable std::mutex sinkMutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

// ============================================================================
// Stream Interface
// ============================================================================

/// One message under construction; handed to the logger when destroyed
class LogMessage {
public:
    LogMessage(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogMessage();

    LogMessage(const LogMessage&) = delete;
    LogMessage& operator=(const LogMessage&) = delete;

    std::ostream& Stream() { return buffer_; }

private:
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    std::ostringstream buffer_;
};

} // namespace util
} // namespace tally

// The empty-if/else shape keeps a caller's own else bound to the caller's if
#define TALLY_LOG(level, category)                                                   \
    if (!::tally::util::Logger::Instance().ShouldLog(                                \
            ::tally::util::LogLevel::level, category)) {                             \
    } else                                                                           \
        ::tally::util::LogMessage(::tally::util::LogLevel::level, category,          \
                                  __FILE__, __LINE__).Stream()

#define LOG_TRACE(category) TALLY_LOG(Trace, category)
#define LOG_DEBUG(category) TALLY_LOG(Debug, category)
#define LOG_INFO(category)  TALLY_LOG(Info, category)
#define LOG_WARN(category)  TALLY_LOG(Warn, category)
#define LOG_ERROR(category) TALLY_LOG(Error, category)
#define LOG_FATAL(category) TALLY_LOG(Fatal, category)

#endif // TALLY_UTIL_LOGGING_H
