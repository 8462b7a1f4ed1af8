#pragma once

#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "tasks/task_types.hpp"

namespace filecron::tasks {

class InvalidRecordError : public std::runtime_error {
public:
    InvalidRecordError(const std::string& message, bool has_identity)
        : std::runtime_error(message), has_identity_(has_identity) {}

    // True when taskId and scheduledLocalTime were usable and only tool_call was broken.
    bool HasIdentity() const { return has_identity_; }

private:
    bool has_identity_ = false;
};

// Throws InvalidRecordError for anything that must not be scheduled.
TaskRecord ParseTaskRecord(const nlohmann::json& data);

// The record's document with scheduledLocalTime replaced.
nlohmann::json WithScheduledTime(const TaskRecord& record, const std::string& scheduled_local_time);

// Serialized content used to tell an edited record from a repeated notification.
std::string RecordRevision(const TaskRecord& record);

}  // namespace filecron::tasks
