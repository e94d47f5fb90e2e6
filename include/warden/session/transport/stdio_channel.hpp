#pragma once

#include "ichannel.hpp"
#include "../../types.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <poll.h>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace warden {
namespace session {
namespace transport {

/**
 * @brief Channel over a pair of file descriptors (stdin/stdout by default).
 *
 * A background read thread polls the read descriptor, splits the stream into
 * lines and invokes the receive callback once per non-empty line. Writes are
 * serialized by a mutex.
 *
 * Threading model:
 * - send() is thread-safe
 * - close() may be called from any thread, including from a callback
 */
class StdioChannel : public IChannel {
public:
    struct Config {
        int read_fd = STDIN_FILENO;
        int write_fd = STDOUT_FILENO;
        bool close_fds = false;                                   ///< Close both descriptors in close()
        std::chrono::milliseconds poll_interval{100};             ///< Granularity of shutdown checks
    };

    StdioChannel()
        : StdioChannel(Config{}) {}

    explicit StdioChannel(Config config)
        : config_(config) {}

    ~StdioChannel() override {
        close();
    }

    StdioChannel(const StdioChannel&) = delete;
    StdioChannel& operator=(const StdioChannel&) = delete;
    StdioChannel(StdioChannel&&) = delete;
    StdioChannel& operator=(StdioChannel&&) = delete;

    Expected<void> open() override {
        if (open_.load()) {
            return tl::unexpected(Error{ErrorCode::ChannelFailed, "Channel already open"});
        }
        if (config_.read_fd < 0 || config_.write_fd < 0) {
            return tl::unexpected(Error{ErrorCode::ChannelFailed, "Invalid file descriptor"});
        }

        open_.store(true);
        running_.store(true);
        try {
            read_thread_ = std::thread([this]() {
                read_loop();
            });
        } catch (const std::system_error& e) {
            open_.store(false);
            running_.store(false);
            return tl::unexpected(Error{
                ErrorCode::ChannelFailed,
                std::string("Failed to start read thread: ") + e.what()
            });
        }
        return {};
    }

    void close() override {
        open_.store(false);
        running_.store(false);

        if (read_thread_.joinable()) {
            if (read_thread_.get_id() == std::this_thread::get_id()) {
                read_thread_.detach();
            } else {
                read_thread_.join();
            }
        }

        std::lock_guard<std::mutex> lock(io_mutex_);
        if (config_.close_fds && !fds_closed_) {
            ::close(config_.read_fd);
            if (config_.write_fd != config_.read_fd) {
                ::close(config_.write_fd);
            }
            fds_closed_ = true;
        }
    }

    bool is_open() const override {
        return open_.load();
    }

    Expected<void> send(const std::string& message) override {
        if (!open_.load()) {
            return tl::unexpected(Error{ErrorCode::ChannelClosed, "Channel is closed"});
        }

        std::string line = message + "\n";

        std::lock_guard<std::mutex> lock(io_mutex_);
        if (fds_closed_) {
            return tl::unexpected(Error{ErrorCode::ChannelClosed, "Channel is closed"});
        }

        size_t offset = 0;
        while (offset < line.size()) {
            ssize_t written = ::write(config_.write_fd, line.data() + offset, line.size() - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return tl::unexpected(Error{
                    ErrorCode::ChannelFailed,
                    "Failed to write to channel",
                    std::strerror(errno)
                });
            }
            offset += static_cast<size_t>(written);
        }
        return {};
    }

    void set_receive_callback(ReceiveCallback callback) override {
        receive_callback_ = std::move(callback);
    }

    void set_close_callback(CloseCallback callback) override {
        close_callback_ = std::move(callback);
    }

private:
    void read_loop() {
        std::string buffer;
        char chunk[4096];
        std::string close_reason;

        while (running_.load()) {
            pollfd pfd{};
            pfd.fd = config_.read_fd;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, static_cast<int>(config_.poll_interval.count()));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                close_reason = std::string("poll failed: ") + std::strerror(errno);
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t bytes_read = ::read(config_.read_fd, chunk, sizeof(chunk));
            if (bytes_read < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                close_reason = std::string("read failed: ") + std::strerror(errno);
                break;
            }
            if (bytes_read == 0) {
                close_reason = "peer closed the channel";
                break;
            }

            buffer.append(chunk, static_cast<size_t>(bytes_read));

            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);

                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (line.empty()) {
                    continue;
                }
                if (receive_callback_) {
                    receive_callback_(line);
                }
            }
        }

        // Exited while still open: the peer went away
        if (running_.exchange(false)) {
            open_.store(false);
            if (close_callback_) {
                close_callback_(close_reason);
            }
        }
    }

    Config config_;
    std::atomic<bool> open_{false};
    std::atomic<bool> running_{false};
    std::thread read_thread_;
    std::mutex io_mutex_;         ///< Serializes writes and descriptor teardown
    bool fds_closed_ = false;
    ReceiveCallback receive_callback_;
    CloseCallback close_callback_;
};

} // namespace transport
} // namespace session
} // namespace warden
