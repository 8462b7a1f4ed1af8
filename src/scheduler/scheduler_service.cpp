#include "scheduler/scheduler_service.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "scheduler/reconcile.hpp"
#include "tasks/task_record.hpp"
#include "tasks/timestamp.hpp"
#include "utils/logging.hpp"

namespace filecron::scheduler {
namespace {

constexpr const char* kTag = "scheduler";

}  // namespace

SchedulerService::SchedulerService(Dispatcher& dispatcher,
                                   tasks::TaskStore& store,
                                   tools::ToolInvoker& invoker,
                                   bus::MessageBus& bus,
                                   SchedulerOptions options)
    : dispatcher_(dispatcher)
    , store_(store)
    , options_(std::move(options))
    , executor_(dispatcher, store, registry_, invoker, bus, options_.executor) {
    executor_.SetSettledHandler([this](const std::filesystem::path& path) {
        OnPathChanged(path);
    });
}

void SchedulerService::Start() {
    if (started_) {
        return;
    }
    started_ = true;
    stopped_ = false;
    store_.EnsureDirectory();

    const auto files = store_.ListRecordFiles();
    if (files.empty()) {
        utils::LogInfo(kTag, "no pending tasks in " + store_.Directory().string() + "; standing by");
    } else {
        utils::LogInfo(kTag, "found " + std::to_string(files.size()) + " task file(s), scheduling");
    }
    ReconcileAll();
    ArmRescan();
}

void SchedulerService::Stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (rescan_timer_ != 0) {
        dispatcher_.Cancel(rescan_timer_);
        rescan_timer_ = 0;
    }
    auto entries = registry_.Drain();
    if (!entries.empty()) {
        utils::LogInfo(kTag, "cancelling " + std::to_string(entries.size()) + " scheduled task(s)");
    }
    for (const auto& entry : entries) {
        dispatcher_.Cancel(entry.timer);
        utils::LogInfo(kTag, "cancelled task " + entry.task_id);
    }
}

void SchedulerService::OnFileChanged(const std::string& filename) {
    if (!tasks::TaskStore::IsRecordFileName(filename)) {
        return;
    }
    OnPathChanged(store_.PathForFileName(filename));
}

void SchedulerService::OnPathChanged(const std::filesystem::path& path) {
    if (stopped_) {
        return;
    }
    const bool exists = store_.Exists(path);
    auto pending = registry_.FindByPath(path);
    if (!pending.has_value()) {
        pending = registry_.Find(tasks::TaskStore::TaskIdFromFileName(path.filename().string()));
    }

    switch (DecideChange(exists, pending.has_value())) {
        case ChangeAction::kDiscover:
            utils::LogDebug(kTag, "change on " + path.filename().string() + ", discovering");
            Discover(path);
            break;
        case ChangeAction::kCancel:
            rejected_.erase(path.string());
            CancelEntry(pending->task_id, "file " + path.filename().string() + " deleted");
            break;
        case ChangeAction::kIgnore:
            rejected_.erase(path.string());
            break;
    }
}

void SchedulerService::Discover(const std::filesystem::path& path) {
    if (stopped_) {
        return;
    }
    auto loaded = store_.Load(path);
    switch (loaded.status) {
        case tasks::LoadStatus::kMissing:
            rejected_.erase(path.string());
            return;
        case tasks::LoadStatus::kInvalid:
            Reject(loaded, path);
            return;
        case tasks::LoadStatus::kOk:
            rejected_.erase(path.string());
            Admit(loaded.record, path);
            return;
    }
}

void SchedulerService::ReconcileAll() {
    if (stopped_) {
        return;
    }
    try {
        store_.EnsureDirectory();
    } catch (const std::filesystem::filesystem_error& ex) {
        utils::LogError(kTag, std::string("cannot create task directory: ") + ex.what());
    }
    for (const auto& path : store_.ListRecordFiles()) {
        Discover(path);
    }
    for (const auto& entry : registry_.Snapshot()) {
        if (!store_.Exists(entry.path)) {
            CancelEntry(entry.task_id, "file " + entry.path.filename().string() + " disappeared");
        }
    }
}

void SchedulerService::Admit(const tasks::TaskRecord& record, const std::filesystem::path& path) {
    const auto timestamp = tasks::ParseTimestamp(record.scheduled_local_time);
    if (!timestamp.has_value()) {
        utils::LogWarn(kTag, "skipping " + path.filename().string() + ": unparseable scheduledLocalTime");
        return;
    }
    const auto revision = tasks::RecordRevision(record);
    const auto existing = registry_.Find(record.task_id);
    const auto decision = DecideAdmission(existing.has_value() ? &existing.value() : nullptr,
                                          registry_.IsFiring(record.task_id),
                                          revision,
                                          timestamp->instant,
                                          dispatcher_.Now());
    if (decision.cancel_existing) {
        CancelEntry(record.task_id, "record changed");
    }

    switch (decision.action) {
        case AdmissionAction::kSkip:
            utils::LogDebug(kTag, "task " + record.task_id + " already scheduled or firing, skipping");
            return;
        case AdmissionAction::kFireNow:
            utils::LogWarn(kTag, "task " + record.task_id + " (" + path.filename().string() +
                                     ") is past due, executing now");
            executor_.Execute(record, path);
            return;
        case AdmissionAction::kSchedule: {
            ScheduledEntry entry{};
            entry.task_id = record.task_id;
            entry.path = path;
            entry.due = timestamp->instant;
            entry.scheduled_local_time = record.scheduled_local_time;
            entry.tool_name = record.tool_call.tool_name;
            entry.recurring = record.IsRecurring();
            entry.revision = revision;
            entry.timer = dispatcher_.ScheduleAt(timestamp->instant, [this, record, path]() {
                OnTimer(record, path);
            });
            registry_.Insert(std::move(entry));
            utils::LogInfo(kTag, "scheduled task " + record.task_id + " at " + record.scheduled_local_time);
            return;
        }
    }
}

void SchedulerService::OnTimer(const tasks::TaskRecord& record, const std::filesystem::path& path) {
    registry_.Remove(record.task_id);
    if (!store_.Exists(path)) {
        utils::LogInfo(kTag, "task " + record.task_id + " file vanished before firing, dropping");
        return;
    }
    utils::LogInfo(kTag, "firing scheduled task " + record.task_id);
    executor_.Execute(record, path);
}

void SchedulerService::Reject(const tasks::LoadResult& loaded, const std::filesystem::path& path) {
    const auto key = loaded.error + "\n" + loaded.record.document.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto it = rejected_.find(path.string());
    if (it != rejected_.end() && it->second == key) {
        utils::LogDebug(kTag, "still skipping " + path.filename().string() + ": " + loaded.error);
        return;
    }
    rejected_[path.string()] = key;
    utils::LogError(kTag, "task file " + path.filename().string() + " is invalid (" + loaded.error +
                              "), skipping");
    if (loaded.reportable) {
        executor_.ReportRejected(loaded, path);
    }
}

void SchedulerService::CancelEntry(const std::string& task_id, const std::string& reason) {
    auto entry = registry_.Remove(task_id);
    if (!entry.has_value()) {
        return;
    }
    dispatcher_.Cancel(entry->timer);
    utils::LogInfo(kTag, "cancelled task " + task_id + ": " + reason);
}

void SchedulerService::ArmRescan() {
    if (options_.rescan_interval.count() <= 0 || stopped_) {
        return;
    }
    rescan_timer_ = dispatcher_.ScheduleAt(dispatcher_.Now() + options_.rescan_interval, [this]() {
        rescan_timer_ = 0;
        utils::LogDebug(kTag, "periodic rescan");
        ReconcileAll();
        ArmRescan();
    });
}

}  // namespace filecron::scheduler
