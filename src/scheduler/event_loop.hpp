#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include "scheduler/dispatcher.hpp"

namespace filecron::scheduler {

class EventLoop : public Dispatcher {
public:
    EventLoop() = default;
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Start();
    // Joins the loop and every offloaded worker, then runs the completions they
    // posted so in-flight cleanup finishes. Pending timers are dropped.
    void Stop();
    bool IsRunning() const { return running_; }

    Clock::time_point Now() const override;
    void Post(Task task) override;
    TimerId ScheduleAt(Clock::time_point due, Task task) override;
    bool Cancel(TimerId id) override;
    void Offload(Task work, Task then) override;

    std::size_t PendingTimers() const;

private:
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    void RunLoop();
    void RunTask(const Task& task);
    void ReapWorker(std::uint64_t worker_id);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> posted_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_index_;
    std::unordered_map<std::uint64_t, std::thread> workers_;
    TimerId next_timer_id_ = 1;
    std::uint64_t next_worker_id_ = 1;
    std::atomic<bool> running_{false};
    bool stopping_ = false;
    std::thread thread_;
};

}  // namespace filecron::scheduler
