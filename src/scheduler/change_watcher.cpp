#include "scheduler/change_watcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <utility>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace filecron::scheduler {
namespace {

constexpr const char* kTag = "watcher";
constexpr std::uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_MODIFY | IN_DELETE |
                                     IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF;

}  // namespace

ChangeWatcher::ChangeWatcher(std::filesystem::path directory, ChangeHandler on_change, RescanHandler on_rescan)
    : directory_(std::move(directory))
    , on_change_(std::move(on_change))
    , on_rescan_(std::move(on_rescan)) {}

ChangeWatcher::~ChangeWatcher() {
    Stop();
}

bool ChangeWatcher::Start() {
    if (running_) {
        return true;
    }
    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        utils::LogError(kTag, std::string("inotify_init1 failed: ") + std::strerror(errno));
        return false;
    }
    watch_fd_ = ::inotify_add_watch(inotify_fd_, directory_.c_str(), kWatchMask);
    if (watch_fd_ < 0) {
        utils::LogError(kTag, "cannot watch " + directory_.string() + ": " + std::strerror(errno));
        CloseDescriptors();
        return false;
    }
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        utils::LogError(kTag, std::string("eventfd failed: ") + std::strerror(errno));
        CloseDescriptors();
        return false;
    }
    running_ = true;
    worker_ = std::thread([this]() { RunLoop(); });
    utils::LogInfo(kTag, "watching " + directory_.string());
    return true;
}

void ChangeWatcher::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    const std::uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0) {
        utils::LogWarn(kTag, std::string("wake write failed: ") + std::strerror(errno));
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    CloseDescriptors();
}

void ChangeWatcher::RunLoop() {
    alignas(struct inotify_event) char buffer[16 * 1024];
    while (running_) {
        pollfd fds[2] = {{inotify_fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
        const int ready = ::poll(fds, 2, 1000);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            utils::LogError(kTag, std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        if ((fds[1].revents & POLLIN) != 0) {
            continue;
        }
        if (watch_fd_ < 0) {
            TryRearm();
        }
        if (ready == 0) {
            continue;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        const auto length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length <= 0) {
            if (length < 0 && errno != EAGAIN && errno != EINTR) {
                utils::LogError(kTag, std::string("read failed: ") + std::strerror(errno));
            }
            continue;
        }
        for (char* ptr = buffer; ptr < buffer + length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if ((event->mask & IN_Q_OVERFLOW) != 0) {
                utils::LogWarn(kTag, "event queue overflowed, requesting full rescan");
                if (on_rescan_) {
                    on_rescan_();
                }
                continue;
            }
            if ((event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) != 0) {
                // Events for a watch already replaced or dropped carry a stale wd.
                if (event->wd == watch_fd_) {
                    if ((event->mask & IN_MOVE_SELF) != 0 && ::inotify_rm_watch(inotify_fd_, watch_fd_) < 0) {
                        utils::LogWarn(kTag, std::string("inotify_rm_watch failed: ") + std::strerror(errno));
                    }
                    watch_fd_ = -1;
                    utils::LogError(kTag, "task directory " + directory_.string() +
                                              " went away; waiting for it to come back");
                    if (on_rescan_) {
                        on_rescan_();
                    }
                }
                continue;
            }
            if (event->len == 0 || (event->mask & IN_ISDIR) != 0) {
                continue;
            }
            if (on_change_) {
                on_change_(std::string(event->name));
            }
        }
    }
}

void ChangeWatcher::TryRearm() {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return;
    }
    const int wd = ::inotify_add_watch(inotify_fd_, directory_.c_str(), kWatchMask);
    if (wd < 0) {
        utils::LogWarn(kTag, "re-watching " + directory_.string() + " failed: " + std::strerror(errno));
        return;
    }
    watch_fd_ = wd;
    utils::LogInfo(kTag, "watching " + directory_.string() + " again, requesting full rescan");
    if (on_rescan_) {
        on_rescan_();
    }
}

void ChangeWatcher::CloseDescriptors() {
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    watch_fd_ = -1;
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

}  // namespace filecron::scheduler
