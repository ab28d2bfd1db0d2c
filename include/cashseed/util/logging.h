// CASHSEED - Logging System
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Process-wide logger with level and category filtering. Entries go to the
// registered sinks only; with no sink installed the library is silent.
//
// Mnemonic words, passphrases, seeds and private keys must never be passed
// to the logger. Fingerprints, word counts, indices and formats may be.

#ifndef CASHSEED_UTIL_LOGGING_H
#define CASHSEED_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace cashseed {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted, anything else is Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* MNEMONIC = "mnemonic";
    constexpr const char* SEED = "seed";
    constexpr const char* DERIVE = "derive";
    constexpr const char* ADDRESS = "address";
    constexpr const char* TOOL = "tool";
}

// ============================================================================
// Sinks
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
};

/// Output destination. Entries below the sink's own level are not delivered.
class ILogSink {
public:
    explicit ILogSink(LogLevel level = LogLevel::Debug) : level_(level) {}
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;

    bool Accepts(LogLevel level) const { return level >= level_.load(); }
    void SetLevel(LogLevel level) { level_.store(level); }

private:
    std::atomic<LogLevel> level_;
};

/// Writes "[LEVEL] [category] message" lines to stderr
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Warn) : ILogSink(level) {}

    void Write(const LogEntry& entry) override;

    static std::string Format(const LogEntry& entry);

private:
    std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Only entries of this category pass; an empty filter passes all
    void SetCategoryFilter(const std::string& category);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message);

#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    void LogF(LogLevel level, const std::string& category, const char* format, ...);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Warn};
    std::string categoryFilter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Collects one stream-style message and hands it to the logger when destroyed
class LogLine {
public:
    LogLine(LogLevel level, const char* category) : level_(level), category_(category) {}
    ~LogLine() { Logger::Instance().Log(level_, category_, stream_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* category_;
    std::ostringstream stream_;
};

// ============================================================================
// Macros
// ============================================================================

#define CASHSEED_LOG(level, category) \
    if (!::cashseed::util::Logger::Instance().WillLog( \
            ::cashseed::util::LogLevel::level, category)) {} \
    else ::cashseed::util::LogLine(::cashseed::util::LogLevel::level, category)

#define LOG_DEBUG(category)   CASHSEED_LOG(Debug, category)
#define LOG_INFO(category)    CASHSEED_LOG(Info, category)
#define LOG_ERROR(category)   CASHSEED_LOG(Error, category)

#define LogDebugF(category, ...) \
    do { \
        auto& cashseed_logger_ = ::cashseed::util::Logger::Instance(); \
        if (cashseed_logger_.WillLog(::cashseed::util::LogLevel::Debug, category)) { \
            cashseed_logger_.LogF(::cashseed::util::LogLevel::Debug, category, __VA_ARGS__); \
        } \
    } while (0)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "<operation> took <n>ms" at Debug when it goes out of scope
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, const char* operation)
        : category_(category), operation_(operation),
          start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

private:
    const char* category_;
    const char* operation_;
    std::chrono::steady_clock::time_point start_;
};

#define CASHSEED_LOG_TIMER_CAT(a, b) a##b
#define CASHSEED_LOG_TIMER_NAME(line) CASHSEED_LOG_TIMER_CAT(cashseed_timer_, line)

#define CASHSEED_LOG_TIMER(category, operation) \
    ::cashseed::util::ScopedLogTimer CASHSEED_LOG_TIMER_NAME(__LINE__)(category, operation)

} // namespace util
} // namespace cashseed

#endif // CASHSEED_UTIL_LOGGING_H
