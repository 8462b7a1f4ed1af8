#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace filecron::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_config{};

}  // namespace

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback) {
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
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_config = config;
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(message.level) < static_cast<int>(g_config.min_level)) {
        return;
    }
    std::cerr << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    if (!message.fields.empty()) {
        // sorted by key
        const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
        for (const auto& [key, value] : sorted) {
            std::cerr << " " << key << "=" << value;
        }
    }
    std::cerr << std::endl;
}

void LogDebug(const std::string& tag, const std::string& message) {
    Log({LogLevel::kDebug, tag, message, {}});
}

void LogInfo(const std::string& tag, const std::string& message) {
    Log({LogLevel::kInfo, tag, message, {}});
}

void LogWarn(const std::string& tag, const std::string& message) {
    Log({LogLevel::kWarn, tag, message, {}});
}

void LogError(const std::string& tag, const std::string& message) {
    Log({LogLevel::kError, tag, message, {}});
}

}  // namespace filecron::utils
