#pragma once

#include <chrono>
#include <string>

#include "nlohmann/json.hpp"

namespace filecron::bus {

constexpr const char* kTaskLogType = "task_log";
constexpr const char* kExecutorSource = "task_scheduler_executor";
constexpr const char* kExecutorErrorSource = "task_scheduler_executor_error";

enum class EventStatus {
    kSuccess,
    kError
};

inline const char* ToString(EventStatus status) {
    return status == EventStatus::kSuccess ? "success" : "error";
}

struct ExecutionEvent {
    std::string type = kTaskLogType;
    std::string task_id;
    std::string tool_name;
    EventStatus status = EventStatus::kSuccess;
    std::string content;
    std::string details;
    std::string source = kExecutorSource;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    nlohmann::json ToJson() const;
};

}  // namespace filecron::bus
