#include "bus/event_bus.hpp"

namespace sandbar::bus {

void EventBus::Publish(const ExecutionEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push(event);
    }
    cv_.notify_one();
}

ExecutionEvent EventBus::Consume() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty(); });
    auto event = events_.front();
    events_.pop();
    return event;
}

bool EventBus::TryConsume(ExecutionEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return false;
    }
    event = events_.front();
    events_.pop();
    return true;
}

std::size_t EventBus::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventBus::Subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

void EventBus::Dispatch() {
    while (!stopped_) {
        ExecutionEvent event{};
        if (!TryConsume(event, std::chrono::milliseconds(200))) {
            continue;
        }
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks = subscribers_;
        }
        for (const auto& cb : callbacks) {
            if (cb) {
                cb(event);
            }
        }
    }
}

void EventBus::Stop() {
    stopped_ = true;
    cv_.notify_all();
}

}  // namespace sandbar::bus
