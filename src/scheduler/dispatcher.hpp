#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace filecron::scheduler {

using TimerId = std::uint64_t;
using Clock = std::chrono::system_clock;

// The one loop every scheduler callback runs on. Timers, watcher notifications
// and completions of off-loop work are all serialized through it.
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;

    virtual Clock::time_point Now() const = 0;

    virtual void Post(Task task) = 0;

    // The task runs on the loop once Now() >= due. Never returns 0.
    virtual TimerId ScheduleAt(Clock::time_point due, Task task) = 0;

    // Returns false when the timer already ran or was never scheduled.
    virtual bool Cancel(TimerId id) = 0;

    // Runs work off the loop, then posts then back onto it.
    virtual void Offload(Task work, Task then) = 0;
};

}  // namespace filecron::scheduler
