#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Multi-producer single-consumer queue of progress events.
// Producer calls push() then close(); consumer calls pop() until it returns nullopt.
template <typename T>
class ProgressChannel {
public:
    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Blocks until an event arrives or the channel is closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return take_front();
    }

private:
    std::optional<T> take_front() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};
