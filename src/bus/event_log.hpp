#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "bus/events.hpp"

namespace filecron::bus {

// Last N execution events, for the status endpoint.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 100);

    void Append(const ExecutionEvent& event);
    std::vector<ExecutionEvent> Recent() const;

private:
    std::size_t capacity_;
    std::deque<ExecutionEvent> events_;
    mutable std::mutex mutex_;
};

}  // namespace filecron::bus
