#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace codebox::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config;
    return config;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

void Log(const std::string& tag, const LogMessage& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    std::cerr << "[" << tag << "] " << ToString(message.level) << " " << message.message;
    // sorted so repeated runs produce identical lines
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace codebox::utils
