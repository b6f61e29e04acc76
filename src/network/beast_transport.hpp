#pragma once

#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace tether::network {

/// Boost.Beast WebSocket transport for ws:// and wss:// endpoints
class BeastTransport : public Transport, public std::enable_shared_from_this<BeastTransport> {
public:
    using tcp = boost::asio::ip::tcp;
    using tcp_stream = boost::beast::tcp_stream;
    using ssl_stream = boost::asio::ssl::stream<tcp_stream>;
    using plain_ws_stream = boost::beast::websocket::stream<tcp_stream>;
    using tls_ws_stream = boost::beast::websocket::stream<ssl_stream>;

    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared TLS context, used only for wss:// endpoints
    BeastTransport(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx
    );

    ~BeastTransport() override;

    // Non-copyable, non-movable
    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    void async_open(const Endpoint& endpoint, std::chrono::milliseconds timeout, OpenHandler handler) override;
    void async_read(ReadHandler handler) override;
    void async_write(std::string payload, WriteHandler handler) override;
    void async_ping(WriteHandler handler) override;
    void set_pong_handler(PongHandler handler) override;
    void close() override;

    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] CloseInfo close_info() const override;

private:
    /// Invoke f with whichever stream this connection uses
    template <typename F>
    void with_stream(F&& f) {
        if (wss_) {
            f(*wss_);
        } else if (ws_) {
            f(*ws_);
        }
    }

    [[nodiscard]] bool has_stream() const noexcept { return ws_ || wss_; }

    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void do_ssl_handshake();
    void on_ssl_handshake(boost::system::error_code ec);
    void do_ws_handshake();
    void on_ws_handshake(boost::system::error_code ec);
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void fail(boost::system::error_code ec, const char* what);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<plain_ws_stream> ws_;
    std::unique_ptr<tls_ws_stream> wss_;
    boost::beast::flat_buffer buffer_;

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_{30000};
    bool open_{false};
    bool closing_{false};
    CloseInfo close_info_;

    OpenHandler open_handler_;
    ReadHandler read_handler_;
    PongHandler pong_handler_;
};

/// Factory producing BeastTransports that share one TLS context
/// @param ssl_ctx TLS context, or nullptr to create a verifying one
[[nodiscard]] TransportFactory make_beast_transport_factory(
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx = nullptr
);

}  // namespace tether::network
