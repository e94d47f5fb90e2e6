#pragma once

#include "../engine/concurrency_limiter.hpp"
#include "../engine/dispatcher.hpp"
#include "../engine/outcome_observer.hpp"
#include "../log.hpp"
#include "../types.hpp"
#include "connection_session.hpp"
#include "transport/ichannel.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace warden {
namespace session {

/**
 * @brief Owns every live ConnectionSession and the process-wide call limit.
 *
 * Sessions whose peer disconnected are closed and dropped lazily on the next
 * attach(), find(), session_count() or shutdown(), always from the caller's
 * thread and never from a channel's read thread.
 *
 * @threadsafety All public methods are thread-safe
 */
class SessionManager {
public:
    SessionManager(std::shared_ptr<engine::RequestDispatcher> dispatcher,
                   std::shared_ptr<engine::OutcomeObserver> observer,
                   size_t max_in_flight_total,
                   ConnectionSession::Options session_options)
        : dispatcher_(std::move(dispatcher))
        , observer_(std::move(observer))
        , process_limiter_(std::make_shared<engine::ConcurrencyLimiter>(max_in_flight_total))
        , session_options_(std::move(session_options))
    {}

    ~SessionManager() {
        shutdown();
    }

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Start serving a channel.
     *
     * @return Expected<std::string> The new session id ("session-<n>")
     */
    Expected<std::string> attach(std::shared_ptr<transport::IChannel> channel) {
        if (!channel) {
            return tl::unexpected(Error{ErrorCode::ChannelFailed, "Cannot attach a null channel"});
        }
        reap_disconnected();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) {
                return tl::unexpected(Error{ErrorCode::ServerNotRunning, "Session manager is shut down"});
            }
        }

        std::string id = "session-" + std::to_string(next_id_.fetch_add(1) + 1);
        auto session = std::make_shared<ConnectionSession>(id, std::move(channel), dispatcher_,
                                                           process_limiter_, observer_, session_options_);
        auto started = session->start();
        if (!started) {
            return tl::unexpected(started.error());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.emplace(id, std::move(session));
        log_info("Attached " + id);
        return id;
    }

    /**
     * @brief Close a session; its in-flight calls are recorded as Cancelled.
     *
     * @return false if the id is unknown
     */
    bool detach(const std::string& id) {
        std::shared_ptr<ConnectionSession> session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) {
                return false;
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }
        session->close();
        log_info("Detached " + id);
        return true;
    }

    std::shared_ptr<ConnectionSession> find(const std::string& id) {
        reap_disconnected();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    size_t session_count() {
        reap_disconnected();
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    /** @brief Close every session and refuse new ones. Idempotent. */
    void shutdown() {
        std::map<std::string, std::shared_ptr<ConnectionSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shut_down_ = true;
            sessions.swap(sessions_);
        }
        process_limiter_->shutdown();
        for (auto& [id, session] : sessions) {
            session->close();
        }
    }

    const engine::ConcurrencyLimiter& process_limiter() const { return *process_limiter_; }

private:
    void reap_disconnected() {
        std::vector<std::shared_ptr<ConnectionSession>> closed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = sessions_.begin(); it != sessions_.end();) {
                if (it->second->state() != SessionState::Open) {
                    closed.push_back(std::move(it->second));
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& session : closed) {
            log_info("Reaping disconnected " + session->id());
            session->close();
        }
    }

    std::shared_ptr<engine::RequestDispatcher> dispatcher_;
    std::shared_ptr<engine::OutcomeObserver> observer_;
    std::shared_ptr<engine::ConcurrencyLimiter> process_limiter_;
    ConnectionSession::Options session_options_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ConnectionSession>> sessions_;
    std::atomic<uint64_t> next_id_{0};
    bool shut_down_ = false;
};

} // namespace session
} // namespace warden
