#pragma once

#include "cancellation.hpp"
#include "timeout_budget.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace warden {
namespace engine {

enum class RunStatus {
    Completed,          ///< Work finished before the deadline
    DeadlineExceeded,   ///< Deadline fired first; the work was cancelled
    Cancelled,          ///< The parent token fired first
    WorkerUnavailable   ///< No thread could be started for the work
};

template<typename T>
struct RunResult {
    RunStatus status = RunStatus::WorkerUnavailable;
    std::optional<T> value;                         ///< Set only when Completed
    std::chrono::milliseconds elapsed{0};
    std::string detail;                             ///< Cancellation reason or spawn error
};

/**
 * @brief Periodic callback while waiting on work (interval 0 = disabled).
 */
struct Heartbeat {
    std::chrono::milliseconds interval{0};
    std::function<void(std::chrono::milliseconds elapsed)> callback;
};

/**
 * @brief Runs work on a worker thread bounded by a Deadline.
 *
 * The caller regains control at or before the deadline regardless of what
 * the work does. On expiry (or parent cancellation) the work's token is
 * cancelled and the worker is retained until it exits; finished workers are
 * reaped on later runs and the destructor cancels and joins everything left,
 * so no thread outlives the runner.
 *
 * The work function must not throw.
 *
 * @threadsafety run() may be called concurrently from multiple threads
 */
class DeadlineRunner {
public:
    DeadlineRunner() = default;

    ~DeadlineRunner() {
        shutdown();
    }

    DeadlineRunner(const DeadlineRunner&) = delete;
    DeadlineRunner& operator=(const DeadlineRunner&) = delete;

    template<typename T>
    RunResult<T> run(std::function<T(const CancellationToken&)> work,
                     const Deadline& deadline,
                     const CancellationToken& parent,
                     const Heartbeat& heartbeat = {}) {
        const auto started = Clock::now();
        reap_finished();

        RunResult<T> result;
        if (parent.is_cancelled()) {
            result.status = RunStatus::Cancelled;
            result.detail = parent.reason();
            return result;
        }
        if (deadline.expired()) {
            result.status = RunStatus::DeadlineExceeded;
            return result;
        }

        auto token = parent.child();
        auto slot = std::make_shared<Slot<T>>();
        auto finished = std::make_shared<std::atomic<bool>>(false);

        auto wake_id = token.on_cancel([slot]() {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->cv.notify_all();
        });

        std::thread thread;
        try {
            thread = std::thread([work = std::move(work), token, slot, finished]() {
                T value = work(token);
                {
                    std::lock_guard<std::mutex> lock(slot->mutex);
                    slot->value = std::move(value);
                    slot->done = true;
                }
                slot->cv.notify_all();
                finished->store(true);
            });
        } catch (const std::system_error& e) {
            token.remove_callback(wake_id);
            result.status = RunStatus::WorkerUnavailable;
            result.detail = e.what();
            return result;
        }

        auto next_beat = started + heartbeat.interval;
        const bool beating = heartbeat.interval.count() > 0 && heartbeat.callback;

        std::unique_lock<std::mutex> lock(slot->mutex);
        while (true) {
            auto wake_at = beating ? std::min(deadline.at, next_beat) : deadline.at;
            slot->cv.wait_until(lock, wake_at, [&] {
                return slot->done || token.is_cancelled();
            });

            if (slot->done) {
                result.status = RunStatus::Completed;
                result.value = std::move(slot->value);
                break;
            }
            if (token.is_cancelled()) {
                result.status = RunStatus::Cancelled;
                result.detail = token.reason();
                break;
            }
            auto now = Clock::now();
            if (now >= deadline.at) {
                result.status = RunStatus::DeadlineExceeded;
                break;
            }
            if (beating && now >= next_beat) {
                lock.unlock();
                heartbeat.callback(std::chrono::duration_cast<std::chrono::milliseconds>(now - started));
                lock.lock();
                next_beat += heartbeat.interval;
            }
        }
        lock.unlock();
        token.remove_callback(wake_id);

        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

        if (result.status == RunStatus::Completed) {
            thread.join();
        } else {
            if (result.status == RunStatus::DeadlineExceeded) {
                token.cancel(std::string("deadline exceeded (") + timeout_layer_to_string(deadline.layer) + ")");
            }
            std::lock_guard<std::mutex> workers_lock(workers_mutex_);
            workers_.push_back(Worker{std::move(thread), token, finished});
        }
        return result;
    }

    /** @brief Number of abandoned workers that have not exited yet. */
    size_t outstanding() {
        reap_finished();
        std::lock_guard<std::mutex> lock(workers_mutex_);
        return workers_.size();
    }

    /**
     * @brief Cancel and join every abandoned worker.
     *
     * Blocks until each worker observes its cancellation and returns.
     */
    void shutdown() {
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            worker.token.cancel("runner shutdown");
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }

private:
    template<typename T>
    struct Slot {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<T> value;
        bool done = false;
    };

    struct Worker {
        std::thread thread;
        CancellationToken token;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void reap_finished() {
        std::list<Worker> done;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            for (auto it = workers_.begin(); it != workers_.end();) {
                if (it->finished->load()) {
                    done.splice(done.end(), workers_, it++);
                } else {
                    ++it;
                }
            }
        }
        for (auto& worker : done) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace engine
} // namespace warden
