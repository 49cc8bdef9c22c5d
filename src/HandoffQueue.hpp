#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Carries results from worker threads back to the context that owns the
// state they apply to. Producers push from anywhere; only the owner pops.
template <typename T>
class HandoffQueue {
public:
    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        cv_.notify_all();
    }

    std::optional<T> tryPop() {
        std::lock_guard lock(mutex_);
        return popLocked();
    }

    // Waits up to 'timeout' for an item.
    template <typename Rep, typename Period>
    std::optional<T> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty(); });
        return popLocked();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    void clear() {
        std::lock_guard lock(mutex_);
        items_.clear();
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};
