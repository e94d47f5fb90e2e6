#pragma once

#include "../types.hpp"
#include "cancellation.hpp"
#include <condition_variable>
#include <mutex>

namespace warden {
namespace engine {

enum class AcquireStatus {
    Acquired,
    TimedOut,
    Cancelled,
    Shutdown
};

/**
 * @brief Counting semaphore bounding concurrent tool calls.
 *
 * One instance per process, shared by every session. A capacity of 0 means
 * unlimited. Waiters are woken by release(), by shutdown() and by
 * cancellation of the token they wait with.
 *
 * @threadsafety All methods are thread-safe
 */
class ConcurrencyLimiter {
public:
    /**
     * @brief RAII permit; releases on destruction.
     */
    class Permit {
    public:
        Permit() = default;

        ~Permit() {
            release();
        }

        Permit(Permit&& other) noexcept
            : limiter_(other.limiter_)
        {
            other.limiter_ = nullptr;
        }

        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                limiter_ = other.limiter_;
                other.limiter_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool held() const { return limiter_ != nullptr; }

        void release() {
            if (limiter_) {
                limiter_->release();
                limiter_ = nullptr;
            }
        }

    private:
        friend class ConcurrencyLimiter;
        explicit Permit(ConcurrencyLimiter* limiter) : limiter_(limiter) {}

        ConcurrencyLimiter* limiter_ = nullptr;
    };

    explicit ConcurrencyLimiter(size_t capacity = 0)
        : capacity_(capacity)
    {}

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @brief Wait for a free slot until `until` or until `cancel` fires.
     */
    AcquireStatus acquire_until(Clock::time_point until, const CancellationToken& cancel) {
        auto wake_id = cancel.on_cancel([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });

        AcquireStatus status;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++waiting_;
            cv_.wait_until(lock, until, [&] {
                return shutdown_ || cancel.is_cancelled() || has_capacity();
            });
            --waiting_;

            if (shutdown_) {
                status = AcquireStatus::Shutdown;
            } else if (cancel.is_cancelled()) {
                status = AcquireStatus::Cancelled;
            } else if (has_capacity()) {
                ++in_use_;
                status = AcquireStatus::Acquired;
            } else {
                status = AcquireStatus::TimedOut;
            }
        }

        cancel.remove_callback(wake_id);
        return status;
    }

    /**
     * @brief Acquire into a Permit; the permit is empty unless Acquired.
     */
    AcquireStatus acquire(Permit& permit, Clock::time_point until, const CancellationToken& cancel) {
        auto status = acquire_until(until, cancel);
        if (status == AcquireStatus::Acquired) {
            permit = Permit(this);
        }
        return status;
    }

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ || !has_capacity()) {
            return false;
        }
        ++in_use_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_use_ > 0) {
                --in_use_;
            }
        }
        cv_.notify_all();
    }

    size_t in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

    size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

    size_t capacity() const { return capacity_; }

    /** @brief Fail current and future waits with Shutdown. */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        cv_.notify_all();
    }

private:
    bool has_capacity() const {
        return capacity_ == 0 || in_use_ < capacity_;
    }

    const size_t capacity_;
    size_t in_use_ = 0;
    size_t waiting_ = 0;
    bool shutdown_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace engine
} // namespace warden
