#pragma once

#include <string>
#include <unordered_map>

namespace filecron::utils {

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

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);

// Writes "[tag] LEVEL message key=value..." to stderr when level passes the filter.
void Log(const LogMessage& message);

void LogDebug(const std::string& tag, const std::string& message);
void LogInfo(const std::string& tag, const std::string& message);
void LogWarn(const std::string& tag, const std::string& message);
void LogError(const std::string& tag, const std::string& message);

}  // namespace filecron::utils
