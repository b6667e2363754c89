#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// BoundedQueue<T>: multi-producer, single-consumer FIFO with a fixed
// capacity. Push never blocks: when full, the oldest item is dropped.
// After Close(), pushes are ignored and Pop drains what is left.
// ---------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Returns false if the queue is closed. Sets dropped_oldest when an
    /// item had to be evicted to make room.
    bool Push(T item, bool* dropped_oldest = nullptr) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_total_;
                dropped = true;
            }
            items_.push_back(std::move(item));
        }
        if (dropped_oldest != nullptr) {
            *dropped_oldest = dropped;
        }
        cv_.notify_one();
        return true;
    }

    /// Wait up to timeout for an item. nullopt on timeout or when closed
    /// and empty.
    template <typename Rep, typename Period>
    std::optional<T> Pop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> TryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /// Wake all waiters; further pushes are rejected.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Drop everything queued so far.
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    [[nodiscard]] bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

    [[nodiscard]] size_t DroppedTotal() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_total_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    size_t dropped_total_ = 0;
    bool closed_ = false;
};

} // namespace mcp_fleet
