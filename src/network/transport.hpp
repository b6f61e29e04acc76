#pragma once

#include "network/url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tether::network {

/// One inbound WebSocket message
struct Frame {
    std::string payload;
    bool binary{false};
};

/// Close frame details received from the remote end
struct CloseInfo {
    std::uint16_t code{0};
    std::string reason;
};

/// Low-level duplex message channel used by the connection manager
///
/// Implementations run entirely on the io_context they were created with;
/// every method must be called from a thread running that context and every
/// handler is invoked there. At most one read and one write (data frame) may
/// be outstanding at a time. Handlers for operations still pending when the
/// transport is closed complete with an error.
class Transport {
public:
    using OpenHandler = std::function<void(boost::system::error_code)>;
    using ReadHandler = std::function<void(boost::system::error_code, Frame)>;
    using WriteHandler = std::function<void(boost::system::error_code)>;
    using PongHandler = std::function<void()>;

    virtual ~Transport() = default;

    /// Resolve, connect and complete the WebSocket handshake within timeout
    virtual void async_open(
        const Endpoint& endpoint,
        std::chrono::milliseconds timeout,
        OpenHandler handler
    ) = 0;

    /// Read the next data frame
    /// A close frame from the remote end completes with websocket::error::closed.
    virtual void async_read(ReadHandler handler) = 0;

    /// Send one text frame
    virtual void async_write(std::string payload, WriteHandler handler) = 0;

    /// Send a ping control frame
    virtual void async_ping(WriteHandler handler) = 0;

    /// Called for every pong received while a read is outstanding
    virtual void set_pong_handler(PongHandler handler) = 0;

    /// Start a graceful close and abandon any pending operation
    /// Safe to call more than once and on a transport that never opened.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /// Close frame received from the remote end, if any
    [[nodiscard]] virtual CloseInfo close_info() const = 0;
};

/// Creates a fresh transport for each connection attempt
using TransportFactory = std::function<std::shared_ptr<Transport>(boost::asio::io_context&)>;

}  // namespace tether::network
