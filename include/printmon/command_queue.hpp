#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace printmon {

// Thread-safe FIFO consumed by a single worker. pop() blocks until an item
// arrives or the queue is stopped.
template <typename T>
class CommandQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (stopped_) return;
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        if (stopped_) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Sleeps up to `d`; returns false early if the queue was stopped.
    template <typename Rep, typename Period>
    bool sleep_for(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock<std::mutex> lock(mu_);
        return !cv_.wait_for(lock, d, [&] { return stopped_; });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
            queue_.clear();
        }
        cv_.notify_all();
    }

private:
    std::deque<T> queue_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stopped_{false};
};

}  // namespace printmon
