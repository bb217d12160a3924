// TALLY - Logging Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/util/logging.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace tally {
namespace util {

namespace {

const char* const LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

std::string FormatTime(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      time.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
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

} // namespace

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelName(LogLevel level) {
    int index = static_cast<int>(level);
    if (index < 0 || index > static_cast<int>(LogLevel::Off)) {
        return "?";
    }
    return LEVEL_NAMES[index];
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string upper(name.size(), '\0');
    std::transform(name.begin(), name.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }

    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        if (upper == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

std::string FormatLogRecord(const LogRecord& record, bool withTime) {
    std::ostringstream oss;
    if (withTime) {
        oss << FormatTime(record.time) << ' ';
    }
    oss << std::left << std::setw(5) << LogLevelName(record.level) << ' ';
    if (!record.category.empty() && record.category != LogCategory::DEFAULT) {
        oss << '[' << record.category << "] ";
    }
    oss << record.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(std::ostream& out, LogLevel minLevel, bool withTime)
    : LogSink(minLevel), out_(out), withTime_(withTime) {}

void ConsoleSink::Write(const LogRecord& record) {
    out_ << FormatLogRecord(record, withTime_) << '\n';
}

void ConsoleSink::Flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, LogLevel minLevel)
    : LogSink(minLevel), path_(path), file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << FormatLogRecord(record, true);
    if (record.file != nullptr) {
        file_ << " (" << Basename(record.file) << ':' << record.line << ')';
    }
    file_ << '\n';
}

void FileSink::Flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

CallbackSink::CallbackSink(Callback callback, LogLevel minLevel)
    : LogSink(minLevel), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogRecord& record) {
    if (callback_) {
        callback_(record);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    return sinks_.size();
}

void Logger::SetCategoryEnabled(const std::string& category, bool enabled) {
    std::lock_guard<std::mutex> lock(categoryMutex_);
    if (enabled) {
        disabledCategories_.erase(category);
    } else {
        disabledCategories_.insert(category);
    }
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoryMutex_);
    return disabledCategories_.count(category) == 0;
}

void Logger::ResetCategories() {
    std::lock_guard<std::mutex> lock(categoryMutex_);
    disabledCategories_.clear();
}

bool Logger::ShouldLog(LogLevel level, const std::string& category) const {
    LogLevel threshold = level_.load();
    if (threshold == LogLevel::Off || level == LogLevel::Off || level < threshold) {
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

    std::lock_guard<std::mutex> lock(sinkMutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(level)) {
            sink->Write(record);
        }
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogMessage
// ============================================================================

LogMessage::~LogMessage() {
    Logger::Instance().Write(level_, category_, buffer_.str(), file_, line_);
}

} // namespace util
} // namespace tally
