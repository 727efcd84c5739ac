#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace codebox::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr.
void Log(const std::string& tag, const LogMessage& message);

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                std::unordered_map<std::string, std::string> fields = {}) {
    Log(tag, LogMessage{level, message, std::move(fields)});
}

}  // namespace codebox::utils
