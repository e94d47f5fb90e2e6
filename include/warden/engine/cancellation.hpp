#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace warden {
namespace engine {

/**
 * @brief Shared, observable cancellation signal.
 *
 * Copies share one underlying state. Tokens form a tree through child():
 * cancelling a parent cancels every live child, never the other way round.
 * Callbacks registered with on_cancel() run exactly once, on the thread that
 * calls cancel() (or immediately if the token is already cancelled).
 *
 * @threadsafety All methods are thread-safe
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using CallbackId = uint64_t;

    CancellationToken()
        : state_(std::make_shared<State>())
    {}

    /**
     * @brief Signal cancellation. Idempotent; the first reason wins.
     */
    void cancel(const std::string& reason = "cancelled") const {
        trigger(state_, reason);
    }

    bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->reason;
    }

    /**
     * @brief Register a callback invoked on cancellation.
     *
     * @return Id for remove_callback(), or 0 if the callback already ran
     */
    CallbackId on_cancel(Callback callback) const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled.load(std::memory_order_relaxed)) {
                CallbackId id = ++state_->next_callback_id;
                state_->callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove_callback(CallbackId id) const {
        if (id == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id);
    }

    /**
     * @brief Block until cancelled or the time point passes.
     *
     * @return true if the token was cancelled
     */
    template<typename ClockT, typename Duration>
    bool wait_until(const std::chrono::time_point<ClockT, Duration>& until) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_until(lock, until, [this] {
            return state_->cancelled.load(std::memory_order_relaxed);
        });
    }

    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        return wait_until(std::chrono::steady_clock::now() + timeout);
    }

    /**
     * @brief Create a token that is cancelled whenever this one is.
     *
     * The link is removed when the last copy of the child goes away.
     */
    CancellationToken child() const {
        CancellationToken result;
        std::weak_ptr<State> weak_child = result.state_;
        auto id = on_cancel([weak_child, parent = std::weak_ptr<State>(state_)]() {
            if (auto child_state = weak_child.lock()) {
                std::string reason = "cancelled";
                if (auto parent_state = parent.lock()) {
                    std::lock_guard<std::mutex> lock(parent_state->mutex);
                    reason = parent_state->reason;
                }
                trigger(child_state, reason);
            }
        });
        if (id != 0) {
            result.state_->parent = state_;
            result.state_->parent_callback = id;
        }
        return result;
    }

    bool operator==(const CancellationToken& other) const {
        return state_ == other.state_;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::string reason;
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::map<CallbackId, Callback> callbacks;
        CallbackId next_callback_id = 0;
        std::weak_ptr<State> parent;
        CallbackId parent_callback = 0;

        ~State() {
            if (auto p = parent.lock()) {
                std::lock_guard<std::mutex> lock(p->mutex);
                p->callbacks.erase(parent_callback);
            }
        }
    };

    static void trigger(const std::shared_ptr<State>& state, const std::string& reason) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->cancelled.load(std::memory_order_relaxed)) {
                return;
            }
            state->reason = reason;
            state->cancelled.store(true, std::memory_order_release);
            callbacks.reserve(state->callbacks.size());
            for (auto& [id, callback] : state->callbacks) {
                callbacks.push_back(std::move(callback));
            }
            state->callbacks.clear();
        }
        state->cv.notify_all();

        // Run outside the lock; callbacks may cancel other tokens.
        for (auto& callback : callbacks) {
            callback();
        }
    }

    std::shared_ptr<State> state_;
};

} // namespace engine
} // namespace warden
