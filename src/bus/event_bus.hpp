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

namespace sandbar::bus {

class EventBus {
public:
    using Callback = std::function<void(const ExecutionEvent&)>;

    void Publish(const ExecutionEvent& event);
    ExecutionEvent Consume();
    bool TryConsume(ExecutionEvent& event, std::chrono::milliseconds timeout);
    std::size_t Size() const;
    void Subscribe(Callback callback);
    // Delivers queued events to subscribers until Stop(); a stopped bus stays stopped.
    void Dispatch();
    void Stop();

private:
    std::queue<ExecutionEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Callback> subscribers_;
    std::atomic<bool> stopped_{false};
};

}  // namespace sandbar::bus
