#pragma once

#include "hotkey/hotkey_event.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

struct QueuedEvent {
    uint64_t seq = 0;
    HotkeyEvent event;
};

// Multi-producer single-consumer queue of hotkey events.
// Only the most recent press matters: pushing while events are still pending
// drops the older ones.
class HotkeyQueue {
public:
    // Returns the pending events that were superseded.
    std::vector<QueuedEvent> push(QueuedEvent event) {
        std::vector<QueuedEvent> dropped;
        {
            std::lock_guard lock(mutex_);
            dropped.assign(std::make_move_iterator(events_.begin()),
                           std::make_move_iterator(events_.end()));
            events_.clear();
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
        return dropped;
    }

    // Consumer: blocks until an event is available or stop is requested.
    // `on_pop` runs under the queue lock, so a drain() that misses the event
    // always observes whatever `on_pop` published.
    template <typename OnPop>
    std::optional<QueuedEvent> wait_pop(std::stop_token stop, OnPop&& on_pop) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, stop, [this] { return !events_.empty(); })) {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        on_pop(event);
        return event;
    }

    std::vector<QueuedEvent> drain() {
        std::lock_guard lock(mutex_);
        std::vector<QueuedEvent> out(std::make_move_iterator(events_.begin()),
                                     std::make_move_iterator(events_.end()));
        events_.clear();
        return out;
    }

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<QueuedEvent> events_;
};
