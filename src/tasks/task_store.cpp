#include "tasks/task_store.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <unistd.h>

#include "tasks/task_record.hpp"

namespace filecron::tasks {
namespace {

constexpr const char* kRecordExtension = ".json";

std::string TempSuffix() {
    static std::atomic<unsigned long> counter{0};
    return "." + std::to_string(::getpid()) + "." + std::to_string(counter.fetch_add(1)) + ".tmp";
}

}  // namespace

TaskStore::TaskStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

void TaskStore::EnsureDirectory() const {
    std::filesystem::create_directories(directory_);
}

std::vector<std::filesystem::path> TaskStore::ListRecordFiles() const {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return files;
    }
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code status_ec;
        if (!entry.is_regular_file(status_ec)) {
            continue;
        }
        if (IsRecordFileName(entry.path().filename().string())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::filesystem::path TaskStore::PathFor(const std::string& task_id) const {
    return directory_ / (task_id + kRecordExtension);
}

std::filesystem::path TaskStore::PathForFileName(const std::string& filename) const {
    return directory_ / filename;
}

bool TaskStore::IsRecordFileName(const std::string& filename) {
    const std::string extension = kRecordExtension;
    if (filename.empty() || filename[0] == '.') {
        return false;
    }
    if (filename.size() <= extension.size()) {
        return false;
    }
    if (filename.find('/') != std::string::npos) {
        return false;
    }
    return filename.compare(filename.size() - extension.size(), extension.size(), extension) == 0;
}

std::string TaskStore::TaskIdFromFileName(const std::string& filename) {
    const std::string extension = kRecordExtension;
    if (!IsRecordFileName(filename)) {
        return {};
    }
    return filename.substr(0, filename.size() - extension.size());
}

bool TaskStore::Exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

LoadResult TaskStore::Load(const std::filesystem::path& path) const {
    LoadResult result{};
    std::ifstream input(path);
    if (!input.is_open()) {
        result.status = Exists(path) ? LoadStatus::kInvalid : LoadStatus::kMissing;
        result.error = result.status == LoadStatus::kMissing ? "file not found" : "cannot open file";
        return result;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& ex) {
        result.status = LoadStatus::kInvalid;
        result.error = std::string("invalid JSON: ") + ex.what();
        return result;
    }

    try {
        result.record = ParseTaskRecord(data);
        result.status = LoadStatus::kOk;
    } catch (const InvalidRecordError& ex) {
        result.status = LoadStatus::kInvalid;
        result.error = ex.what();
        result.reportable = ex.HasIdentity();
        if (ex.HasIdentity()) {
            result.record.task_id = data["taskId"].get<std::string>();
            result.record.scheduled_local_time = data["scheduledLocalTime"].get<std::string>();
            result.record.document = data;
        }
    }
    return result;
}

void TaskStore::Write(const std::filesystem::path& path, const nlohmann::json& document) const {
    const auto temp_path = path.parent_path() / ("." + path.filename().string() + TempSuffix());
    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("cannot open " + temp_path.string() + " for writing");
        }
        output << document.dump(2);
        output.flush();
        if (!output) {
            output.close();
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw std::runtime_error("write to " + temp_path.string() + " failed");
        }
    }
    try {
        std::filesystem::rename(temp_path, path);
    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw;
    }
}

bool TaskStore::Remove(const std::filesystem::path& path, std::error_code& ec) const {
    return std::filesystem::remove(path, ec);
}

}  // namespace filecron::tasks
