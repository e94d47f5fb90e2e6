#pragma once

#include "../../types.hpp"
#include <functional>
#include <string>

namespace warden {
namespace session {
namespace transport {

/**
 * @brief Abstract duplex channel carrying newline-delimited JSON messages.
 *
 * Threading model:
 * - open()/close() called from the owning thread
 * - send() may be called from any thread (must be thread-safe)
 * - receive and close callbacks are invoked from the channel's read thread
 *
 * The close callback fires once when the peer goes away (EOF or read
 * error), not when close() is called locally.
 */
class IChannel {
public:
    using ReceiveCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void(const std::string& reason)>;

    virtual ~IChannel() = default;

    virtual Expected<void> open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /** @brief Send one message; the channel appends the line terminator. */
    virtual Expected<void> send(const std::string& message) = 0;

    virtual void set_receive_callback(ReceiveCallback callback) = 0;
    virtual void set_close_callback(CloseCallback callback) = 0;
};

} // namespace transport
} // namespace session
} // namespace warden
