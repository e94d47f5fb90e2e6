#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace warden {
namespace engine {

/**
 * @brief Thread-safe FIFO handing items from producers to consumer threads.
 *
 * Used by the outbound writer and the outcome observer (one consumer each)
 * and by each session's call workers (several consumers).
 * After shutdown() pushes are refused, while pops drain what is left and then
 * return nullopt.
 */
template<typename T>
class WorkQueue {
public:
    /**
     * @param max_size Maximum queue size (0 = unlimited)
     */
    explicit WorkQueue(size_t max_size = 0)
        : max_size_(max_size)
        , shutdown_(false)
    {}

    /**
     * @brief Enqueue an item (non-blocking)
     *
     * @return true if enqueued, false if the queue is full or shut down
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        if (max_size_ > 0 && queue_.size() >= max_size_) {
            return false;
        }
        queue_.push(std::move(item));
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Blocks until an item is available or the queue is shut down and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return !queue_.empty() || shutdown_;
        });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    /**
     * @brief Refuse further pushes and wake blocked consumers.
     *
     * Items already queued are still returned by pop().
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t max_size_;
    bool shutdown_;
};

} // namespace engine
} // namespace warden
