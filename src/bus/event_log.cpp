#include "bus/event_log.hpp"

namespace filecron::bus {

EventLog::EventLog(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void EventLog::Append(const ExecutionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<ExecutionEvent> EventLog::Recent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ExecutionEvent>(events_.begin(), events_.end());
}

}  // namespace filecron::bus
