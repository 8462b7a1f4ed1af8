#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace filecron::tasks {

struct ToolCall {
    std::string tool_name;
    nlohmann::json arguments;
};

struct TaskRecord {
    std::string task_id;
    std::string scheduled_local_time;
    std::optional<long long> interval_s;
    ToolCall tool_call;
    // Whole document as read, so a renewal rewrite keeps fields it does not know about.
    nlohmann::json document = nlohmann::json::object();

    bool IsRecurring() const { return interval_s.has_value() && interval_s.value() > 0; }
};

enum class LoadStatus {
    kOk,
    kMissing,
    kInvalid
};

struct LoadResult {
    LoadStatus status = LoadStatus::kInvalid;
    TaskRecord record;
    std::string error;
    // Set when the record has identity and a due time but no usable tool_call;
    // such records are reported on the notification channel, not only logged.
    bool reportable = false;
};

}  // namespace filecron::tasks
