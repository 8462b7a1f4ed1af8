#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "bus/message_bus.hpp"
#include "scheduler/dispatcher.hpp"
#include "scheduler/schedule_registry.hpp"
#include "scheduler/task_executor.hpp"
#include "tasks/task_store.hpp"
#include "tasks/task_types.hpp"
#include "tools/tool.hpp"

namespace filecron::scheduler {

struct SchedulerOptions {
    // Full reconcile period; zero disables the periodic pass.
    std::chrono::seconds rescan_interval{60};
    ExecutorOptions executor;
};

// Composition root for the scheduling core: owns the registry and executor,
// and turns startup scans, watcher notifications and periodic rescans into
// registry admissions and cancellations. Everything except Registry() reads
// must be called on the dispatcher's loop.
class SchedulerService {
public:
    SchedulerService(Dispatcher& dispatcher,
                     tasks::TaskStore& store,
                     tools::ToolInvoker& invoker,
                     bus::MessageBus& bus,
                     SchedulerOptions options = {});

    SchedulerService(const SchedulerService&) = delete;
    SchedulerService& operator=(const SchedulerService&) = delete;

    // Creates the store directory, admits every record in it, arms the rescan.
    void Start();
    // Cancels every pending entry. Later notifications are ignored.
    void Stop();

    void OnFileChanged(const std::string& filename);
    void OnPathChanged(const std::filesystem::path& path);
    void Discover(const std::filesystem::path& path);
    // Discovers every record and cancels entries whose files are gone.
    void ReconcileAll();

    const ScheduleRegistry& Registry() const { return registry_; }
    ScheduleRegistry& Registry() { return registry_; }
    bool IsStopped() const { return stopped_; }

private:
    void Admit(const tasks::TaskRecord& record, const std::filesystem::path& path);
    void OnTimer(const tasks::TaskRecord& record, const std::filesystem::path& path);
    void Reject(const tasks::LoadResult& loaded, const std::filesystem::path& path);
    void CancelEntry(const std::string& task_id, const std::string& reason);
    void ArmRescan();

    Dispatcher& dispatcher_;
    tasks::TaskStore& store_;
    SchedulerOptions options_;
    ScheduleRegistry registry_;
    TaskExecutor executor_;
    // path -> last rejection, so a broken file is reported once per content.
    std::unordered_map<std::string, std::string> rejected_;
    TimerId rescan_timer_ = 0;
    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace filecron::scheduler
