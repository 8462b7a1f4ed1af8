#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace filecron::scheduler {

// inotify watch on one directory. Every event that names a file is forwarded
// as "look at this name again"; event kinds are not interpreted. Callbacks run
// on the watcher thread, so callers post them onto their loop.
// on_rescan runs whenever events may have been lost: after a queue overflow,
// and after the watch is re-established on a directory that went away.
class ChangeWatcher {
public:
    using ChangeHandler = std::function<void(const std::string& filename)>;
    using RescanHandler = std::function<void()>;

    ChangeWatcher(std::filesystem::path directory, ChangeHandler on_change, RescanHandler on_rescan = {});
    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    // Returns false (and logs) if the watch could not be established.
    bool Start();
    void Stop();
    bool IsRunning() const { return running_; }

private:
    void RunLoop();
    // Re-adds the watch once the directory exists again.
    void TryRearm();
    void CloseDescriptors();

    std::filesystem::path directory_;
    ChangeHandler on_change_;
    RescanHandler on_rescan_;
    int inotify_fd_ = -1;
    int watch_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace filecron::scheduler
