#include "bus/message_bus.hpp"

#include <exception>
#include <string>

#include "utils/logging.hpp"

namespace filecron::bus {

void MessageBus::Publish(const ExecutionEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push(event);
    }
    cv_.notify_one();
}

bool MessageBus::TryConsume(ExecutionEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return false;
    }
    event = events_.front();
    events_.pop();
    return true;
}

std::size_t MessageBus::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void MessageBus::Subscribe(Subscriber callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

void MessageBus::Start() {
    running_ = true;
}

void MessageBus::DispatchEvents() {
    while (running_) {
        ExecutionEvent event{};
        if (!TryConsume(event, std::chrono::milliseconds(1000))) {
            continue;
        }
        Deliver(event);
    }
    DrainPending();
}

std::size_t MessageBus::DrainPending() {
    std::size_t delivered = 0;
    ExecutionEvent event{};
    while (TryConsume(event, std::chrono::milliseconds(0))) {
        Deliver(event);
        ++delivered;
    }
    return delivered;
}

void MessageBus::Stop() {
    running_ = false;
    cv_.notify_all();
}

void MessageBus::Deliver(const ExecutionEvent& event) {
    std::vector<Subscriber> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = subscribers_;
    }
    for (const auto& cb : callbacks) {
        if (!cb) {
            continue;
        }
        try {
            cb(event);
        } catch (const std::exception& ex) {
            utils::LogWarn("bus", std::string("subscriber failed: ") + ex.what());
        }
    }
}

}  // namespace filecron::bus
