#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "nlohmann/json.hpp"
#include "tasks/task_types.hpp"

namespace filecron::tasks {

// One JSON file per task in a flat directory. By convention the file stem is
// the taskId, but the taskId inside the file is authoritative.
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path directory);

    const std::filesystem::path& Directory() const { return directory_; }

    // Creates the directory if absent. Throws std::filesystem::filesystem_error.
    void EnsureDirectory() const;

    // Record files sorted by name; empty if the directory does not exist.
    std::vector<std::filesystem::path> ListRecordFiles() const;

    std::filesystem::path PathFor(const std::string& task_id) const;
    std::filesystem::path PathForFileName(const std::string& filename) const;

    static bool IsRecordFileName(const std::string& filename);
    static std::string TaskIdFromFileName(const std::string& filename);

    bool Exists(const std::filesystem::path& path) const;
    LoadResult Load(const std::filesystem::path& path) const;

    // Write-then-rename through a hidden temp file in the same directory.
    // Throws std::filesystem::filesystem_error or std::runtime_error.
    void Write(const std::filesystem::path& path, const nlohmann::json& document) const;

    bool Remove(const std::filesystem::path& path, std::error_code& ec) const;

private:
    std::filesystem::path directory_;
};

}  // namespace filecron::tasks
