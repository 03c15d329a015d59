// TOKENLEDGER - Logging System
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Process-wide leveled logger. Entries carry a category (ledger, fees,
// staking, ...) that can be filtered, and fan out to any number of sinks,
// each with its own threshold.

#ifndef TOKENLEDGER_UTIL_LOGGING_H
#define TOKENLEDGER_UTIL_LOGGING_H

#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace tokenledger {
namespace util {

// ============================================================================
// Levels and Categories
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

/// Case-insensitive; unknown names map to Info
LogLevel LogLevelFromString(const std::string& name);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* FEES = "fees";
    constexpr const char* STAKING = "staking";
    constexpr const char* VESTING = "vesting";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// "[LEVEL] [category] message", optionally prefixed with local time
std::string FormatLogEntry(const LogEntry& entry, bool withTimestamp);

// ============================================================================
// Sinks
// ============================================================================

/**
 * Output destination. Entries below the sink's own level are dropped
 * before Emit is called.
 */
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    void Submit(const LogEntry& entry) {
        if (entry.level >= level_) {
            Emit(entry);
        }
    }

    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_ = level; }
    LogLevel GetLevel() const { return level_; }

protected:
    virtual void Emit(const LogEntry& entry) = 0;

private:
    LogLevel level_;
};

/// stdout, with Error and Fatal optionally diverted to stderr
class ConsoleSink : public LogSink {
public:
    struct Config {
        LogLevel level{LogLevel::Info};
        bool showTimestamp{true};
        bool errorsToStderr{true};
    };

    ConsoleSink() : ConsoleSink(Config()) {}
    explicit ConsoleSink(const Config& config)
        : LogSink(config.level), config_(config) {}

    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends timestamped lines with their source location
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);

    bool IsOpen() const { return out_.is_open(); }
    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    std::ofstream out_;
    std::mutex mutex_;
};

/// Hands each entry to a function
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : LogSink(level), callback_(std::move(callback)) {}

protected:
    void Emit(const LogEntry& entry) override {
        if (callback_) {
            callback_(entry);
        }
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink once
    void Initialize();

    /// Flush and drop every sink
    void Shutdown();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;

    /// Enabling any category switches from "all" to an explicit allow list
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category, const char* file, int line,
              const char* format, ...);

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    LogLevel level_{LogLevel::Info};
    std::optional<std::set<std::string>> allowedCategories_;
    bool initialized_{false};
};

// ============================================================================
// Stream Interface
// ============================================================================

/// Collects one message and submits it when destroyed
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

// Streamed operands are not evaluated when the entry would be dropped
#define TOKENLEDGER_LOG(level, category) \
    if (!::tokenledger::util::Logger::Instance().WillLog( \
            ::tokenledger::util::LogLevel::level, category)) {} \
    else ::tokenledger::util::LogStream(::tokenledger::util::LogLevel::level, \
                                        category, __FILE__, __LINE__)

#define LOG_TRACE(category)   TOKENLEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   TOKENLEDGER_LOG(Debug, category)
#define LOG_INFO(category)    TOKENLEDGER_LOG(Info, category)
#define LOG_WARN(category)    TOKENLEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   TOKENLEDGER_LOG(Error, category)

} // namespace util
} // namespace tokenledger

#endif // TOKENLEDGER_UTIL_LOGGING_H
