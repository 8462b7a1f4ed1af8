#include "scheduler/task_executor.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <system_error>
#include <utility>

#include "tasks/task_record.hpp"
#include "tasks/timestamp.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace filecron::scheduler {
namespace {

constexpr const char* kTag = "executor";
constexpr const char* kNoResponse = "[no explicit response from tool]";

std::string TimedName(const std::string& tool_name) {
    return (tool_name.empty() ? std::string("UnknownPlugin") : tool_name) + " (Timed)";
}

}  // namespace

TaskExecutor::TaskExecutor(Dispatcher& dispatcher,
                           tasks::TaskStore& store,
                           ScheduleRegistry& registry,
                           tools::ToolInvoker& invoker,
                           bus::MessageBus& bus,
                           ExecutorOptions options)
    : dispatcher_(dispatcher)
    , store_(store)
    , registry_(registry)
    , invoker_(invoker)
    , bus_(bus)
    , options_(std::move(options)) {}

void TaskExecutor::SetSettledHandler(SettledHandler handler) {
    on_settled_ = std::move(handler);
}

void TaskExecutor::Execute(const tasks::TaskRecord& record, const std::filesystem::path& path) {
    registry_.MarkFiring(record.task_id);
    utils::LogInfo(kTag, "executing task " + record.task_id + ": invoking '" +
                             record.tool_call.tool_name + "'");

    auto outcome = std::make_shared<Outcome>();
    auto arguments = PrepareArguments(record);
    dispatcher_.Offload(
        [this, outcome, tool_name = record.tool_call.tool_name, arguments = std::move(arguments)]() {
            try {
                outcome->result = invoker_.Invoke(tool_name, arguments);
                outcome->ok = true;
            } catch (const std::exception& ex) {
                outcome->ok = false;
                outcome->error = ex.what();
            }
        },
        [this, outcome, record, path]() {
            Complete(record, path, *outcome);
        });
}

nlohmann::json TaskExecutor::PrepareArguments(const tasks::TaskRecord& record) const {
    nlohmann::json arguments = record.tool_call.arguments;
    const auto& prefixed = options_.prompt_prefix_tools;
    if (std::find(prefixed.begin(), prefixed.end(), record.tool_call.tool_name) == prefixed.end()) {
        return arguments;
    }
    if (!arguments.is_object() || !arguments.contains("prompt") || !arguments["prompt"].is_string()) {
        return arguments;
    }
    const auto timestamp = tasks::ParseTimestamp(record.scheduled_local_time);
    if (!timestamp.has_value()) {
        return arguments;
    }
    arguments["prompt"] = "[Scheduled contact: " + tasks::FormatLocal(*timestamp) + "] " +
                          arguments["prompt"].get<std::string>();
    return arguments;
}

std::string TaskExecutor::Summarize(const nlohmann::json& result) const {
    std::string summary;
    if (result.is_null()) {
        summary = kNoResponse;
    } else if (result.is_string()) {
        summary = result.get<std::string>();
    } else {
        summary = result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return utils::TruncateUtf8(summary, options_.summary_limit);
}

void TaskExecutor::ReportRejected(const tasks::LoadResult& loaded, const std::filesystem::path& path) {
    std::string tool_name;
    const auto& document = loaded.record.document;
    if (document.is_object() && document.contains("tool_call") && document["tool_call"].is_object()) {
        const auto& tool_call = document["tool_call"];
        if (tool_call.contains("tool_name") && tool_call["tool_name"].is_string()) {
            tool_name = tool_call["tool_name"].get<std::string>();
        }
    }
    bus::ExecutionEvent event{};
    event.task_id = loaded.record.task_id;
    event.tool_name = TimedName(tool_name);
    event.status = bus::EventStatus::kError;
    event.content = "Timed task " + loaded.record.task_id + " rejected: invalid task format (" +
                    loaded.error + ").";
    event.details = path.filename().string();
    event.source = bus::kExecutorErrorSource;
    bus_.Publish(event);
}

void TaskExecutor::Complete(const tasks::TaskRecord& record,
                            const std::filesystem::path& path,
                            const Outcome& outcome) {
    Report(record, outcome);
    RenewOrDelete(record, path);
    registry_.ClearFiring(record.task_id);
    if (on_settled_) {
        on_settled_(path);
    }
}

void TaskExecutor::Report(const tasks::TaskRecord& record, const Outcome& outcome) {
    bus::ExecutionEvent event{};
    event.task_id = record.task_id;
    event.tool_name = TimedName(record.tool_call.tool_name);
    if (outcome.ok) {
        utils::LogInfo(kTag, "task " + record.task_id + " (" + record.tool_call.tool_name + ") processed");
        event.status = bus::EventStatus::kSuccess;
        event.content = "Timed task " + record.task_id + " executed successfully.\nTool response: " +
                        Summarize(outcome.result);
        event.source = bus::kExecutorSource;
    } else {
        utils::LogError(kTag, "task " + record.task_id + " failed: " + outcome.error);
        event.status = bus::EventStatus::kError;
        event.content = "Timed task " + record.task_id + " failed: " +
                        (outcome.error.empty() ? std::string("unknown error") : outcome.error);
        event.details = outcome.error;
        event.source = bus::kExecutorErrorSource;
    }
    bus_.Publish(event);
}

void TaskExecutor::RenewOrDelete(const tasks::TaskRecord& record, const std::filesystem::path& path) {
    if (record.IsRecurring()) {
        Renew(record, path);
    } else {
        Delete(record, path);
    }
}

void TaskExecutor::Renew(const tasks::TaskRecord& record, const std::filesystem::path& path) {
    // The file is about to change; no entry for this task may outlive the rewrite.
    if (auto stale = registry_.Remove(record.task_id)) {
        dispatcher_.Cancel(stale->timer);
    }

    // Edits made while the tool ran win over the copy that fired.
    const auto current = store_.Load(path);
    if (current.status == tasks::LoadStatus::kMissing) {
        utils::LogInfo(kTag, "recurring task " + record.task_id + " was deleted while firing; not renewing");
        return;
    }
    if (current.status == tasks::LoadStatus::kOk &&
        current.record.scheduled_local_time != record.scheduled_local_time) {
        utils::LogInfo(kTag, "recurring task " + record.task_id +
                                 " was rescheduled while firing; keeping the edit");
        return;
    }
    const tasks::TaskRecord& base =
        current.status == tasks::LoadStatus::kOk ? current.record : record;
    if (!base.IsRecurring()) {
        utils::LogInfo(kTag, "task " + record.task_id + " stopped recurring while firing; deleting it");
        Delete(base, path);
        return;
    }

    const auto next = tasks::AdvanceTimestamp(base.scheduled_local_time, base.interval_s.value());
    if (!next.has_value()) {
        utils::LogError(kTag, "cannot advance recurring task " + record.task_id + "; deleting it");
        Delete(base, path);
        return;
    }

    try {
        store_.Write(path, tasks::WithScheduledTime(base, next.value()));
        utils::LogInfo(kTag, "recurring task " + record.task_id + " renewed, next trigger: " + next.value());
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "renewing recurring task " + record.task_id + " failed: " + ex.what() +
                                  "; deleting it");
        Delete(base, path);
    }
}

void TaskExecutor::Delete(const tasks::TaskRecord& record, const std::filesystem::path& path) {
    std::error_code ec;
    if (store_.Remove(path, ec)) {
        utils::LogInfo(kTag, "deleted task file " + path.filename().string());
        return;
    }
    if (ec) {
        utils::LogError(kTag, "deleting task file " + path.filename().string() + " for " +
                                  record.task_id + " failed: " + ec.message());
    }
}

}  // namespace filecron::scheduler
