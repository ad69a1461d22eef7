#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>

namespace sandpool::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    if (value == "debug" || value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "info" || value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "WARN" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error" || value == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void SetLogConfig(const LogConfig& config) {
    MinLogLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLogLevel().load());
}

// Buffers one line and writes it to stderr as "[tag] LEVEL message" on
// destruction, so concurrent writers do not interleave inside a line.
class LogLine {
public:
    LogLine(LogLevel level, const char* tag)
        : level_(level), enabled_(ShouldLog(level)) {
        if (enabled_) {
            stream_ << "[" << tag << "] ";
            if (level_ != LogLevel::kInfo) {
                stream_ << ToString(level_) << " ";
            }
        }
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    ~LogLine() {
        if (enabled_) {
            stream_ << '\n';
            std::cerr << stream_.str() << std::flush;
        }
    }

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream stream_;
};

inline LogLine LogDebug(const char* tag) { return LogLine(LogLevel::kDebug, tag); }
inline LogLine LogInfo(const char* tag) { return LogLine(LogLevel::kInfo, tag); }
inline LogLine LogWarn(const char* tag) { return LogLine(LogLevel::kWarn, tag); }
inline LogLine LogError(const char* tag) { return LogLine(LogLevel::kError, tag); }

}  // namespace sandpool::utils
