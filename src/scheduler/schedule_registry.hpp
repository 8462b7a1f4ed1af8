#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "scheduler/dispatcher.hpp"

namespace filecron::scheduler {

struct ScheduledEntry {
    std::string task_id;
    std::filesystem::path path;
    Clock::time_point due;
    std::string scheduled_local_time;
    std::string tool_name;
    bool recurring = false;
    std::string revision;
    TimerId timer = 0;
};

// taskId -> pending timer. Owns no timers itself: callers cancel through the
// Dispatcher with the TimerId an entry hands back on removal.
//
// Tasks currently executing are tracked separately as "firing"; they are not
// pending, but discovery must not admit them a second time.
//
// Mutations happen on the loop thread; the mutex lets the status server read
// snapshots from its own thread.
class ScheduleRegistry {
public:
    bool Contains(const std::string& task_id) const;
    std::optional<ScheduledEntry> Find(const std::string& task_id) const;
    std::optional<ScheduledEntry> FindByPath(const std::filesystem::path& path) const;

    // False if task_id already has an entry; the registry is left unchanged.
    bool Insert(ScheduledEntry entry);
    std::optional<ScheduledEntry> Remove(const std::string& task_id);
    std::vector<ScheduledEntry> Drain();

    void MarkFiring(const std::string& task_id);
    void ClearFiring(const std::string& task_id);
    bool IsFiring(const std::string& task_id) const;
    std::size_t FiringCount() const;

    std::vector<ScheduledEntry> Snapshot() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ScheduledEntry> entries_;
    std::unordered_set<std::string> firing_;
};

}  // namespace filecron::scheduler
