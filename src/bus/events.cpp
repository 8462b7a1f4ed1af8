#include "bus/events.hpp"

namespace filecron::bus {

nlohmann::json ExecutionEvent::ToJson() const {
    nlohmann::json data = {
        {"tool_name", tool_name},
        {"task_id", task_id},
        {"status", ToString(status)},
        {"content", content},
        {"source", source}
    };
    if (!details.empty()) {
        data["details"] = details;
    }
    return {
        {"type", type},
        {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch()).count()},
        {"data", data}
    };
}

}  // namespace filecron::bus
