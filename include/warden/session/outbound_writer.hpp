#pragma once

#include "../engine/work_queue.hpp"
#include "../log.hpp"
#include "transport/ichannel.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace warden {
namespace session {

/**
 * @brief Single writer thread owning all sends on one channel.
 *
 * Messages are written in the order enqueued. A failed send is logged and
 * the message dropped; the channel's close callback handles teardown.
 */
class OutboundWriter {
public:
    explicit OutboundWriter(std::shared_ptr<transport::IChannel> channel)
        : channel_(std::move(channel))
    {
        thread_ = std::thread([this]() { run(); });
    }

    ~OutboundWriter() {
        stop();
    }

    OutboundWriter(const OutboundWriter&) = delete;
    OutboundWriter& operator=(const OutboundWriter&) = delete;

    /** @return false once the writer has been stopped */
    bool enqueue(std::string message) {
        return queue_.push(std::move(message));
    }

    /** @brief Write what is already queued, then stop. Idempotent. */
    void stop() {
        queue_.shutdown();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    size_t pending() const { return queue_.size(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void run() {
        while (auto message = queue_.pop()) {
            if (!channel_->is_open()) {
                dropped_.fetch_add(1);
                continue;
            }
            auto sent = channel_->send(*message);
            if (!sent) {
                dropped_.fetch_add(1);
                log_warn("Outbound message dropped: " + sent.error().to_string());
            }
        }
    }

    std::shared_ptr<transport::IChannel> channel_;
    engine::WorkQueue<std::string> queue_;
    std::atomic<uint64_t> dropped_{0};
    std::thread thread_;
};

} // namespace session
} // namespace warden
