#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

#include "bus/events.hpp"

namespace filecron::bus {

// Fire-and-forget fan-out of execution events. Publish never blocks on a
// subscriber; DispatchEvents delivers on its own thread.
class MessageBus {
public:
    using Subscriber = std::function<void(const ExecutionEvent&)>;

    void Publish(const ExecutionEvent& event);
    bool TryConsume(ExecutionEvent& event, std::chrono::milliseconds timeout);
    std::size_t Size() const;

    void Subscribe(Subscriber callback);
    // Call before spawning the dispatch thread so an early Stop() sticks.
    void Start();
    // Blocks until Stop(); delivers queued events to every subscriber.
    // Returns after a final drain if Stop() already ran or Start() never did.
    void DispatchEvents();
    // Delivers whatever is queued right now on the calling thread.
    std::size_t DrainPending();
    void Stop();

private:
    void Deliver(const ExecutionEvent& event);

    std::queue<ExecutionEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Subscriber> subscribers_;
    std::atomic<bool> running_{false};
};

}  // namespace filecron::bus
