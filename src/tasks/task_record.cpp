#include "tasks/task_record.hpp"

#include "tasks/timestamp.hpp"

namespace filecron::tasks {

TaskRecord ParseTaskRecord(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw InvalidRecordError("record is not a JSON object", false);
    }
    TaskRecord record;
    record.document = data;

    if (!data.contains("taskId") || !data["taskId"].is_string() ||
        data["taskId"].get<std::string>().empty()) {
        throw InvalidRecordError("missing taskId", false);
    }
    record.task_id = data["taskId"].get<std::string>();

    if (!data.contains("scheduledLocalTime") || !data["scheduledLocalTime"].is_string()) {
        throw InvalidRecordError("missing scheduledLocalTime", false);
    }
    record.scheduled_local_time = data["scheduledLocalTime"].get<std::string>();
    if (!ParseTimestamp(record.scheduled_local_time).has_value()) {
        throw InvalidRecordError("unparseable scheduledLocalTime '" + record.scheduled_local_time + "'",
                                 false);
    }

    if (data.contains("interval") && data["interval"].is_number_integer()) {
        record.interval_s = data["interval"].get<long long>();
    }

    if (!data.contains("tool_call") || !data["tool_call"].is_object()) {
        throw InvalidRecordError("missing tool_call object", true);
    }
    const auto& tool_call = data["tool_call"];
    if (!tool_call.contains("tool_name") || !tool_call["tool_name"].is_string() ||
        tool_call["tool_name"].get<std::string>().empty()) {
        throw InvalidRecordError("missing tool_call.tool_name", true);
    }
    if (!tool_call.contains("arguments") || tool_call["arguments"].is_null()) {
        throw InvalidRecordError("missing tool_call.arguments", true);
    }
    record.tool_call.tool_name = tool_call["tool_name"].get<std::string>();
    record.tool_call.arguments = tool_call["arguments"];
    return record;
}

nlohmann::json WithScheduledTime(const TaskRecord& record, const std::string& scheduled_local_time) {
    nlohmann::json document = record.document;
    document["scheduledLocalTime"] = scheduled_local_time;
    return document;
}

std::string RecordRevision(const TaskRecord& record) {
    return record.document.dump();
}

}  // namespace filecron::tasks
