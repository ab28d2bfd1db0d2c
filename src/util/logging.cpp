// CASHSEED - Logging Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <iomanip>

namespace cashseed {
namespace util {

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string lower(str.size(), '\0');
    std::transform(str.begin(), str.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const struct {
        const char* name;
        LogLevel level;
    } kNames[] = {
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"off", LogLevel::Off},
        {"none", LogLevel::Off},
    };
    for (const auto& entry : kNames) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// ConsoleSink
// ============================================================================

std::string ConsoleSink::Format(const LogEntry& entry) {
    std::ostringstream oss;
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty()) {
        oss << '[' << entry.category << "] ";
    }
    oss << entry.message;
    return oss.str();
}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = Format(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", line.c_str());
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::SetCategoryFilter(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    categoryFilter_ = category;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    LogLevel threshold = level_.load();
    if (threshold == LogLevel::Off || level < threshold) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return categoryFilter_.empty() || categoryFilter_ == category;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::LogF(LogLevel level, const std::string& category, const char* format, ...) {
    char buffer[512];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    Log(level, category, buffer);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::~ScopedLogTimer() {
    auto& logger = Logger::Instance();
    if (!logger.WillLog(LogLevel::Debug, category_)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    std::ostringstream oss;
    oss << operation_ << " took " << elapsed.count() << "ms";
    logger.Log(LogLevel::Debug, category_, oss.str());
}

} // namespace util
} // namespace cashseed
