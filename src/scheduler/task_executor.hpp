#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "bus/message_bus.hpp"
#include "nlohmann/json.hpp"
#include "scheduler/dispatcher.hpp"
#include "scheduler/schedule_registry.hpp"
#include "tasks/task_store.hpp"
#include "tasks/task_types.hpp"
#include "tools/tool.hpp"

namespace filecron::scheduler {

struct ExecutorOptions {
    std::size_t summary_limit = 500;
    std::vector<std::string> prompt_prefix_tools = {"AgentAssistant"};
};

class TaskExecutor {
public:
    using SettledHandler = std::function<void(const std::filesystem::path&)>;

    TaskExecutor(Dispatcher& dispatcher,
                 tasks::TaskStore& store,
                 ScheduleRegistry& registry,
                 tools::ToolInvoker& invoker,
                 bus::MessageBus& bus,
                 ExecutorOptions options = {});

    // Called on the loop once cleanup for a path is done.
    void SetSettledHandler(SettledHandler handler);

    // Fires one task. The invocation runs off the loop; reporting and the
    // renew-or-delete cleanup run back on the loop whatever the outcome.
    void Execute(const tasks::TaskRecord& record, const std::filesystem::path& path);

    void ReportRejected(const tasks::LoadResult& loaded, const std::filesystem::path& path);

    nlohmann::json PrepareArguments(const tasks::TaskRecord& record) const;
    std::string Summarize(const nlohmann::json& result) const;

private:
    struct Outcome {
        bool ok = false;
        nlohmann::json result;
        std::string error;
    };

    void Complete(const tasks::TaskRecord& record, const std::filesystem::path& path, const Outcome& outcome);
    void Report(const tasks::TaskRecord& record, const Outcome& outcome);
    void RenewOrDelete(const tasks::TaskRecord& record, const std::filesystem::path& path);
    void Renew(const tasks::TaskRecord& record, const std::filesystem::path& path);
    void Delete(const tasks::TaskRecord& record, const std::filesystem::path& path);

    Dispatcher& dispatcher_;
    tasks::TaskStore& store_;
    ScheduleRegistry& registry_;
    tools::ToolInvoker& invoker_;
    bus::MessageBus& bus_;
    ExecutorOptions options_;
    SettledHandler on_settled_;
};

}  // namespace filecron::scheduler
