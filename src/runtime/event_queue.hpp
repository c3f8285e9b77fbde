#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace toolpilot::runtime {

// Multi-producer / single-consumer FIFO. Events from one producer keep their
// push order; across producers the order is arrival order.
template <typename T>
class EventQueue {
public:
    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_front_locked();
    }

    std::optional<T> wait_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !events_.empty(); });
        return pop_front_locked();
    }

    // Empty optional when the deadline passes with nothing queued. Returns an
    // event whenever one is queued, even past the deadline.
    template <typename Clock, typename Duration>
    std::optional<T> wait_pop_until(
        const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_until(lock, deadline, [this] { return !events_.empty(); })) {
            return std::nullopt;
        }
        return pop_front_locked();
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(events_.size());
        while (!events_.empty()) {
            out.push_back(std::move(events_.front()));
            events_.pop_front();
        }
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    std::optional<T> pop_front_locked() {
        if (events_.empty()) {
            return std::nullopt;
        }
        T event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> events_;
};

}  // namespace toolpilot::runtime
