// TOKENLEDGER - Logging Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace tokenledger {
namespace util {

namespace {

const char* const kLevelNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

std::string LocalTime(std::chrono::system_clock::time_point tp) {
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < sizeof(kLevelNames) / sizeof(kLevelNames[0]) ? kLevelNames[index] : "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        if (upper == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

std::string FormatLogEntry(const LogEntry& entry, bool withTimestamp) {
    std::string line;
    if (withTimestamp) {
        line = LocalTime(entry.timestamp) + " ";
    }
    line += "[";
    line += LogLevelToString(entry.level);
    line += "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        line += "[" + entry.category + "] ";
    }
    return line + entry.message;
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::Emit(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, config_.showTimestamp);
    FILE* stream = (config_.errorsToStderr && entry.level >= LogLevel::Error) ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stream, "%s\n", line.c_str());
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

FileSink::FileSink(const std::string& path, LogLevel level)
    : LogSink(level), out_(path, std::ios::out | std::ios::app) {}

void FileSink::Emit(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, true);
    if (!entry.file.empty()) {
        size_t slash = entry.file.find_last_of('/');
        line += " (" + entry.file.substr(slash == std::string::npos ? 0 : slash + 1) +
                ":" + std::to_string(entry.line) + ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return;
    }
    initialized_ = true;
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
    sinks_.clear();
    initialized_ = false;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!allowedCategories_) {
        allowedCategories_.emplace();
    }
    allowedCategories_->insert(category);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (allowedCategories_) {
        allowedCategories_->erase(category);
    }
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    allowedCategories_.reset();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !allowedCategories_ || allowedCategories_->count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < GetLevel()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
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

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Submit(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category, const char* file, int line,
                  const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    int needed = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);

    std::string message;
    if (needed > 0) {
        std::vector<char> buffer(static_cast<size_t>(needed) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), format, args);
        message.assign(buffer.data(), static_cast<size_t>(needed));
    }
    va_end(args);

    Log(level, category, message, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, buffer_.str(), file_, line_);
}

} // namespace util
} // namespace tokenledger
