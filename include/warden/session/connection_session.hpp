#pragma once

#include "../engine/cancellation.hpp"
#include "../engine/concurrency_limiter.hpp"
#include "../engine/dispatcher.hpp"
#include "../engine/outcome_observer.hpp"
#include "../engine/work_queue.hpp"
#include "../log.hpp"
#include "../types.hpp"
#include "outbound_writer.hpp"
#include "protocol/wire_codec.hpp"
#include "transport/ichannel.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace warden {
namespace session {

/**
 * @brief Lifecycle of one connection.
 *
 *   Open -> Disconnected (peer went away) -> Closed
 *   Open -> Closed (local close)
 */
enum class SessionState {
    Open,
    Disconnected,
    Closed
};

[[nodiscard]] inline const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Open: return "open";
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

/**
 * @brief Serves the wire protocol on one channel.
 *
 * Accepted calls wait in a bounded queue drained by max_in_flight worker
 * threads, so a slow call never blocks reading and the thread count stays
 * fixed however many calls a client sends. A call arriving with the queue
 * full, or still queued after queue_timeout, fails with Overloaded.
 *
 * Every accepted call yields exactly one terminal Outcome: whichever of
 * {worker, cancel_call, teardown} first removes the call from the in-flight
 * table delivers and observes it, the others are discarded. On disconnect
 * in-flight calls are cancelled and recorded as Cancelled without anything
 * being sent.
 *
 * Threading model:
 * - inbound messages are handled on the channel's read thread
 * - outbound messages go through one OutboundWriter
 * - once the state leaves Open no call is queued, so close() can join every worker
 * - close() must not be called from the channel's read thread
 */
class ConnectionSession {
public:
    struct Options {
        std::string server_name = "warden";
        std::string version;
        size_t max_in_flight = 4;                           ///< Worker threads per channel (at least 1)
        size_t max_queued = 64;                             ///< Calls waiting for a worker (at least 1)
        std::chrono::milliseconds queue_timeout{10000};     ///< Max wait for a worker and a process permit
        nlohmann::json limits = nlohmann::json::object();   ///< Reported in hello_ack
    };

    ConnectionSession(std::string id,
                      std::shared_ptr<transport::IChannel> channel,
                      std::shared_ptr<engine::RequestDispatcher> dispatcher,
                      std::shared_ptr<engine::ConcurrencyLimiter> process_limiter,
                      std::shared_ptr<engine::OutcomeObserver> observer,
                      Options options)
        : id_(std::move(id))
        , channel_(std::move(channel))
        , dispatcher_(std::move(dispatcher))
        , process_limiter_(std::move(process_limiter))
        , observer_(std::move(observer))
        , options_(std::move(options))
        , pending_(std::max<size_t>(options_.max_queued, 1))
        , writer_(std::make_unique<OutboundWriter>(channel_))
    {}

    ~ConnectionSession() {
        close();
    }

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    /**
     * @brief Start the call workers, install channel callbacks and open the channel.
     */
    Expected<void> start() {
        const size_t worker_count = std::max<size_t>(options_.max_in_flight, 1);
        try {
            for (size_t i = workers_.size(); i < worker_count; ++i) {
                workers_.emplace_back([this]() { worker_loop(); });
            }
        } catch (const std::system_error& e) {
            stop_workers();
            return tl::unexpected(Error{ErrorCode::Overloaded, "Could not start session workers", e.what()});
        }

        channel_->set_receive_callback([this](const std::string& line) {
            handle_message(line);
        });
        channel_->set_close_callback([this](const std::string& reason) {
            abort_in_flight("Channel closed: " + (reason.empty() ? std::string("peer disconnected") : reason));
        });
        if (channel_->is_open()) {
            return {};
        }
        return channel_->open();
    }

    /**
     * @brief Handle one inbound line. Called by the channel's read thread.
     */
    void handle_message(const std::string& line) {
        if (state() != SessionState::Open) {
            return;
        }

        auto decoded = protocol::WireCodec::decode(line);
        if (decoded.is_error()) {
            log_info("Session " + id_ + ": rejected message: " + *decoded.error_message);
            send(protocol::WireCodec::encode_error(*decoded.error_message, decoded.call_id));
            return;
        }

        auto& msg = *decoded.message;
        switch (msg.op) {
            case protocol::InboundOp::Hello:
                send(protocol::WireCodec::encode_hello_ack(id_, options_.server_name, options_.version,
                                                           options_.limits));
                break;
            case protocol::InboundOp::ListTools:
                send(protocol::WireCodec::encode_list_tools(dispatcher_->registry().describe_all()));
                break;
            case protocol::InboundOp::CallTool:
                accept_call(std::move(msg));
                break;
            case protocol::InboundOp::CancelCall:
                cancel_call(msg.call_id);
                break;
        }
    }

    /**
     * @brief Cancel one in-flight call; its outcome is delivered as Cancelled.
     *
     * A call still waiting for a worker is answered immediately.
     *
     * @return false if no such call is in flight
     */
    bool cancel_call(const std::string& call_id) {
        const std::string reason = "Cancelled by client";
        InFlight entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(call_id);
            if (it == in_flight_.end()) {
                return false;
            }
            entry = it->second;
        }
        entry.cancel.cancel(reason);
        if (!entry.started) {
            finish(entry.call, entry.seq, Outcome::cancelled(reason, entry.call.elapsed()));
        }
        return true;
    }

    /**
     * @brief Cancel and record every in-flight call.
     *
     * Used on disconnect: each call gets a synthesized Cancelled outcome for
     * the audit trail and nothing more is sent for it. Idempotent.
     */
    void abort_in_flight(const std::string& reason) {
        std::unordered_map<std::string, InFlight> aborted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == SessionState::Open) {
                state_ = SessionState::Disconnected;
            }
            aborted.swap(in_flight_);
        }

        if (!aborted.empty()) {
            log_info("Session " + id_ + ": aborting " + std::to_string(aborted.size()) +
                     " in-flight call(s): " + reason);
        }
        for (auto& [call_id, entry] : aborted) {
            entry.cancel.cancel(reason);
            if (observer_) {
                observer_->observe(entry.call, Outcome::cancelled(reason, entry.call.elapsed()));
            }
        }
    }

    /**
     * @brief Tear the session down: abort calls, join workers, flush the writer, close the channel.
     */
    void close() {
        std::lock_guard<std::mutex> close_lock(close_mutex_);
        if (state() == SessionState::Closed) {
            return;
        }

        abort_in_flight("Session closed");
        root_.cancel("Session closed");
        stop_workers();

        writer_->stop();
        channel_->close();

        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Closed;
    }

    const std::string& id() const { return id_; }

    SessionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_.size();
    }

    uint64_t calls_accepted() const { return calls_accepted_.load(); }

    size_t worker_count() const { return workers_.size(); }

private:
    struct InFlight {
        ToolCall call;
        engine::CancellationToken cancel;
        uint64_t seq = 0;               ///< Distinguishes reuses of one call_id
        bool started = false;           ///< A worker has picked the call up
    };

    struct QueuedCall {
        ToolCall call;
        engine::CancellationToken cancel;
        uint64_t seq = 0;
    };

    void send(std::string message) {
        if (!writer_->enqueue(std::move(message))) {
            log_debug("Session " + id_ + ": writer stopped, message dropped");
        }
    }

    void accept_call(protocol::InboundMessage msg) {
        ToolCall call;
        call.call_id = msg.call_id.empty()
            ? id_ + "-" + std::to_string(next_call_.fetch_add(1) + 1)
            : std::move(msg.call_id);
        call.session_id = id_;
        call.tool_name = std::move(msg.tool_name);
        call.parameters = std::move(msg.parameters);
        call.effort = std::move(msg.effort);
        call.received_at = Clock::now();

        const uint64_t seq = next_seq_.fetch_add(1) + 1;
        engine::CancellationToken token = root_.child();
        bool queued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::Open) {
                return;
            }
            if (in_flight_.count(call.call_id) != 0) {
                log_info("Session " + id_ + ": duplicate call_id " + call.call_id);
                send(protocol::WireCodec::encode_error(
                    std::string("Duplicate call_id (") + error_code_to_string(ErrorCode::DuplicateCallId) +
                        "): a call with this id is already in flight",
                    call.call_id));
                return;
            }
            in_flight_.emplace(call.call_id, InFlight{call, token, seq, false});
            queued = pending_.push(QueuedCall{call, token, seq});
        }
        calls_accepted_.fetch_add(1);

        if (!queued) {
            log_warn("Session " + id_ + ": call " + call.call_id + " rejected, " +
                     std::to_string(pending_.size()) + " calls already waiting");
            finish(call, seq, Outcome::failure(ErrorCode::Overloaded,
                                               "Too many queued calls; retry later", call.elapsed()));
        }
    }

    void worker_loop() {
        while (auto queued = pending_.pop()) {
            run_call(*queued);
        }
    }

    void stop_workers() {
        pending_.shutdown();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    /**
     * @brief Mark a queued call as running.
     *
     * @return false if it was already answered (cancelled or aborted)
     */
    bool mark_started(const std::string& call_id, uint64_t seq) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(call_id);
        if (it == in_flight_.end() || it->second.seq != seq) {
            return false;
        }
        it->second.started = true;
        return true;
    }

    void run_call(const QueuedCall& queued) {
        const ToolCall& call = queued.call;
        const auto& token = queued.cancel;
        if (!mark_started(call.call_id, queued.seq)) {
            return;
        }
        if (token.is_cancelled()) {
            finish(call, queued.seq, Outcome::cancelled(token.reason(), call.elapsed()));
            return;
        }

        const auto session_deadline = dispatcher_->session_deadline(call);
        const auto queue_deadline = std::min(call.received_at + options_.queue_timeout, session_deadline.at);

        auto status = Clock::now() >= queue_deadline ? engine::AcquireStatus::TimedOut
                                                     : engine::AcquireStatus::Acquired;
        engine::ConcurrencyLimiter::Permit process_permit;
        if (status == engine::AcquireStatus::Acquired && process_limiter_) {
            status = process_limiter_->acquire(process_permit, queue_deadline, token);
        }

        switch (status) {
            case engine::AcquireStatus::Acquired:
                break;
            case engine::AcquireStatus::TimedOut:
                log_warn("Session " + id_ + ": call " + call.call_id + " rejected, no capacity within " +
                         std::to_string(options_.queue_timeout.count()) + "ms");
                finish(call, queued.seq, Outcome::failure(ErrorCode::Overloaded,
                                                          "Too many concurrent calls; retry later",
                                                          call.elapsed()));
                return;
            case engine::AcquireStatus::Cancelled:
                finish(call, queued.seq, Outcome::cancelled(token.reason(), call.elapsed()));
                return;
            case engine::AcquireStatus::Shutdown:
                finish(call, queued.seq, Outcome::cancelled("Server shutting down", call.elapsed()));
                return;
        }

        const std::string call_id = call.call_id;
        const uint64_t seq = queued.seq;
        auto progress = [this, call_id, seq](const ProgressUpdate& update) {
            if (is_in_flight(call_id, seq)) {
                send(protocol::WireCodec::encode_progress(update));
            }
        };

        auto outcome = dispatcher_->dispatch(call, session_deadline, token, progress);
        finish(call, seq, std::move(outcome));
    }

    bool is_in_flight(const std::string& call_id, uint64_t seq) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(call_id);
        return it != in_flight_.end() && it->second.seq == seq;
    }

    /**
     * @brief Deliver and observe an outcome unless another path already did.
     */
    void finish(const ToolCall& call, uint64_t seq, Outcome outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(call.call_id);
            if (it == in_flight_.end() || it->second.seq != seq) {
                log_debug("Session " + id_ + ": discarding late outcome for " + call.call_id);
                return;
            }
            in_flight_.erase(it);
            send(protocol::WireCodec::encode_outcome(call.call_id, outcome));
        }
        if (observer_) {
            observer_->observe(call, std::move(outcome));
        }
    }

    const std::string id_;
    std::shared_ptr<transport::IChannel> channel_;
    std::shared_ptr<engine::RequestDispatcher> dispatcher_;
    std::shared_ptr<engine::ConcurrencyLimiter> process_limiter_;
    std::shared_ptr<engine::OutcomeObserver> observer_;
    Options options_;

    engine::CancellationToken root_;
    engine::WorkQueue<QueuedCall> pending_;
    std::vector<std::thread> workers_;
    std::unique_ptr<OutboundWriter> writer_;

    mutable std::mutex mutex_;                              ///< Guards state_ and in_flight_
    SessionState state_ = SessionState::Open;
    std::unordered_map<std::string, InFlight> in_flight_;

    std::mutex close_mutex_;

    std::atomic<uint64_t> next_call_{0};
    std::atomic<uint64_t> next_seq_{0};
    std::atomic<uint64_t> calls_accepted_{0};
};

} // namespace session
} // namespace warden
