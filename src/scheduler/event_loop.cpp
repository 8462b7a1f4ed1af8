#include "scheduler/event_loop.hpp"

#include <exception>
#include <vector>

#include "utils/logging.hpp"

namespace filecron::scheduler {

EventLoop::~EventLoop() {
    Stop();
}

void EventLoop::Start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    thread_ = std::thread([this]() { RunLoop(); });
}

void EventLoop::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::unordered_map<std::uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& [id, worker] : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::deque<Task> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftovers.swap(posted_);
        timers_.clear();
        timer_index_.clear();
    }
    for (const auto& task : leftovers) {
        RunTask(task);
    }
}

Clock::time_point EventLoop::Now() const {
    return Clock::now();
}

void EventLoop::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(task));
    }
    cv_.notify_one();
}

TimerId EventLoop::ScheduleAt(Clock::time_point due, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_.emplace(TimerKey{due, id}, std::move(task));
        timer_index_.emplace(id, due);
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_index_.find(id);
    if (it == timer_index_.end()) {
        return false;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_index_.erase(it);
    return true;
}

void EventLoop::Offload(Task work, Task then) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto worker_id = next_worker_id_++;
    // mutex_ is held until the thread is stored, so its Post cannot overtake the emplace.
    workers_.emplace(worker_id, std::thread([this, worker_id, work = std::move(work), then = std::move(then)]() {
        RunTask(work);
        Post([this, worker_id, then]() {
            ReapWorker(worker_id);
            RunTask(then);
        });
    }));
}

std::size_t EventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::RunLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!posted_.empty()) {
            auto task = std::move(posted_.front());
            posted_.pop_front();
            lock.unlock();
            RunTask(task);
            lock.lock();
            continue;
        }
        if (!timers_.empty()) {
            const auto due = timers_.begin()->first.first;
            if (Clock::now() >= due) {
                auto node = timers_.extract(timers_.begin());
                timer_index_.erase(node.key().second);
                lock.unlock();
                RunTask(node.mapped());
                lock.lock();
                continue;
            }
            cv_.wait_until(lock, due);
            continue;
        }
        cv_.wait(lock);
    }
    // Drain what was already posted so a Post-then-Stop sequence is not lost.
    while (!posted_.empty()) {
        auto task = std::move(posted_.front());
        posted_.pop_front();
        lock.unlock();
        RunTask(task);
        lock.lock();
    }
}

void EventLoop::RunTask(const Task& task) {
    if (!task) {
        return;
    }
    try {
        task();
    } catch (const std::exception& ex) {
        utils::LogError("loop", std::string("task threw: ") + ex.what());
    }
}

void EventLoop::ReapWorker(std::uint64_t worker_id) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(worker_id);
        if (it == workers_.end()) {
            return;
        }
        worker = std::move(it->second);
        workers_.erase(it);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

}  // namespace filecron::scheduler
