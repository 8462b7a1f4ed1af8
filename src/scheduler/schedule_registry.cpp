#include "scheduler/schedule_registry.hpp"

#include <algorithm>
#include <utility>

namespace filecron::scheduler {

bool ScheduleRegistry::Contains(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(task_id) != entries_.end();
}

std::optional<ScheduledEntry> ScheduleRegistry::Find(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ScheduledEntry> ScheduleRegistry::FindByPath(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (entry.path == path) {
            return entry;
        }
    }
    return std::nullopt;
}

bool ScheduleRegistry::Insert(ScheduledEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = entry.task_id;
    return entries_.emplace(std::move(key), std::move(entry)).second;
}

std::optional<ScheduledEntry> ScheduleRegistry::Remove(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto entry = std::move(it->second);
    entries_.erase(it);
    return entry;
}

std::vector<ScheduledEntry> ScheduleRegistry::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScheduledEntry> drained;
    drained.reserve(entries_.size());
    for (auto& [id, entry] : entries_) {
        drained.push_back(std::move(entry));
    }
    entries_.clear();
    return drained;
}

void ScheduleRegistry::MarkFiring(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    firing_.insert(task_id);
}

void ScheduleRegistry::ClearFiring(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    firing_.erase(task_id);
}

bool ScheduleRegistry::IsFiring(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return firing_.find(task_id) != firing_.end();
}

std::size_t ScheduleRegistry::FiringCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return firing_.size();
}

std::vector<ScheduledEntry> ScheduleRegistry::Snapshot() const {
    std::vector<ScheduledEntry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            entries.push_back(entry);
        }
    }
    std::sort(entries.begin(), entries.end(), [](const ScheduledEntry& a, const ScheduledEntry& b) {
        return a.due < b.due || (a.due == b.due && a.task_id < b.task_id);
    });
    return entries;
}

std::size_t ScheduleRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace filecron::scheduler
