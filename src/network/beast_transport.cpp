#include "network/beast_transport.hpp"
#include "network/tls_context.hpp"
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace tether::network {

namespace websocket = boost::beast::websocket;

BeastTransport::BeastTransport(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(ioc)
{}

BeastTransport::~BeastTransport() {
    // Pending handlers hold shared_from_this, so only the raw socket is left to release
    with_stream([](auto& s) {
        boost::system::error_code ec;
        boost::beast::get_lowest_layer(s).socket().close(ec);
    });
}

void BeastTransport::async_open(
    const Endpoint& endpoint,
    std::chrono::milliseconds timeout,
    OpenHandler handler
) {
    endpoint_ = endpoint;
    timeout_ = timeout;
    open_handler_ = std::move(handler);

    spdlog::debug("Resolving {}:{}", endpoint_.host, endpoint_.port);

    resolver_.async_resolve(
        endpoint_.host,
        endpoint_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void BeastTransport::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (closing_) {
        return fail(boost::asio::error::operation_aborted, "resolve");
    }
    if (ec) {
        return fail(ec, "resolve");
    }

    spdlog::debug("Resolved {} endpoints for {}", results.size(), endpoint_.host);

    if (endpoint_.use_tls) {
        if (!ssl_ctx_) {
            ssl_ctx_ = create_tls_context();
        }
        wss_ = std::make_unique<tls_ws_stream>(ioc_, *ssl_ctx_);

        // Set SNI hostname for SSL
        if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), endpoint_.host.c_str())) {
            boost::system::error_code ssl_ec{
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category()
            };
            return fail(ssl_ec, "ssl_sni");
        }
    } else {
        ws_ = std::make_unique<plain_ws_stream>(ioc_);
    }

    with_stream([&](auto& s) {
        auto& layer = boost::beast::get_lowest_layer(s);
        layer.expires_after(timeout_);
        layer.async_connect(
            results,
            [self = shared_from_this()](auto ec, auto) {
                self->on_connect(ec);
            }
        );
    });
}

void BeastTransport::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "connect");
    }

    spdlog::debug("TCP connected to {}:{}", endpoint_.host, endpoint_.port);

    if (wss_) {
        do_ssl_handshake();
    } else {
        do_ws_handshake();
    }
}

void BeastTransport::do_ssl_handshake() {
    boost::beast::get_lowest_layer(*wss_).expires_after(timeout_);

    wss_->next_layer().async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void BeastTransport::on_ssl_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "ssl_handshake");
    }

    spdlog::debug("SSL handshake complete");
    do_ws_handshake();
}

void BeastTransport::do_ws_handshake() {
    with_stream([&](auto& s) {
        // The websocket layer takes over timeouts from here
        boost::beast::get_lowest_layer(s).expires_never();

        // Keepalive is driven by the connection manager, not by Beast
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = timeout_;
        opt.idle_timeout = websocket::stream_base::none();
        opt.keep_alive_pings = false;
        s.set_option(opt);

        s.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(boost::beast::http::field::user_agent, "tether/1.0");
            }
        ));

        s.control_callback(
            [this](websocket::frame_type kind, boost::beast::string_view) {
                if (kind == websocket::frame_type::pong && pong_handler_) {
                    pong_handler_();
                }
            }
        );

        s.async_handshake(
            endpoint_.host_header(),
            endpoint_.target,
            [self = shared_from_this()](auto ec) {
                self->on_ws_handshake(ec);
            }
        );
    });
}

void BeastTransport::on_ws_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "ws_handshake");
    }

    spdlog::debug("WebSocket handshake complete for {}{}", endpoint_.host_header(), endpoint_.target);

    open_ = true;
    auto handler = std::move(open_handler_);
    open_handler_ = nullptr;
    if (handler) {
        handler({});
    }
}

void BeastTransport::async_read(ReadHandler handler) {
    if (!open_) {
        boost::asio::post(ioc_, [handler = std::move(handler)]() {
            handler(boost::asio::error::not_connected, Frame{});
        });
        return;
    }

    read_handler_ = std::move(handler);
    with_stream([&](auto& s) {
        s.async_read(
            buffer_,
            [self = shared_from_this()](auto ec, auto bytes) {
                self->on_read(ec, bytes);
            }
        );
    });
}

void BeastTransport::on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
    auto handler = std::move(read_handler_);
    read_handler_ = nullptr;

    if (ec) {
        if (ec == websocket::error::closed) {
            with_stream([&](auto& s) {
                const auto& reason = s.reason();
                close_info_.code = static_cast<std::uint16_t>(reason.code);
                close_info_.reason.assign(reason.reason.data(), reason.reason.size());
            });
        }
        open_ = false;
        if (handler) {
            handler(ec, Frame{});
        }
        return;
    }

    Frame frame;
    frame.payload = boost::beast::buffers_to_string(buffer_.data());
    with_stream([&](auto& s) {
        frame.binary = s.got_binary();
    });
    buffer_.consume(bytes_transferred);

    if (handler) {
        handler({}, std::move(frame));
    }
}

void BeastTransport::async_write(std::string payload, WriteHandler handler) {
    if (!open_) {
        boost::asio::post(ioc_, [handler = std::move(handler)]() {
            handler(boost::asio::error::not_connected);
        });
        return;
    }

    // The buffer must outlive the operation
    auto data = std::make_shared<std::string>(std::move(payload));
    with_stream([&](auto& s) {
        s.text(true);
        s.async_write(
            boost::asio::buffer(*data),
            [self = shared_from_this(), data, handler = std::move(handler)](auto ec, auto) {
                handler(ec);
            }
        );
    });
}

void BeastTransport::async_ping(WriteHandler handler) {
    if (!open_) {
        boost::asio::post(ioc_, [handler = std::move(handler)]() {
            handler(boost::asio::error::not_connected);
        });
        return;
    }

    with_stream([&](auto& s) {
        s.async_ping(
            {},
            [self = shared_from_this(), handler = std::move(handler)](auto ec) {
                handler(ec);
            }
        );
    });
}

void BeastTransport::set_pong_handler(PongHandler handler) {
    pong_handler_ = std::move(handler);
}

void BeastTransport::close() {
    if (closing_) {
        return;
    }
    closing_ = true;
    pong_handler_ = nullptr;
    resolver_.cancel();

    if (!open_) {
        // Abort a connect or handshake still in progress
        with_stream([](auto& s) {
            boost::system::error_code ec;
            boost::beast::get_lowest_layer(s).socket().close(ec);
        });
        return;
    }

    open_ = false;
    with_stream([&](auto& s) {
        s.async_close(
            websocket::close_code::normal,
            [self = shared_from_this()](auto ec) {
                if (ec) {
                    spdlog::debug("WebSocket close error: {}", ec.message());
                }
            }
        );
    });
}

bool BeastTransport::is_open() const {
    if (!open_) {
        return false;
    }
    if (wss_) {
        return wss_->is_open();
    }
    return ws_ && ws_->is_open();
}

CloseInfo BeastTransport::close_info() const {
    return close_info_;
}

void BeastTransport::fail(boost::system::error_code ec, const char* what) {
    if (ec != boost::asio::error::operation_aborted) {
        spdlog::warn("WebSocket {} error for {}: {}", what, endpoint_.host, ec.message());
    }

    open_ = false;
    auto handler = std::move(open_handler_);
    open_handler_ = nullptr;
    if (handler) {
        handler(ec);
    }
}

TransportFactory make_beast_transport_factory(std::shared_ptr<boost::asio::ssl::context> ssl_ctx) {
    if (!ssl_ctx) {
        ssl_ctx = create_tls_context();
    }
    return [ssl_ctx](boost::asio::io_context& ioc) -> std::shared_ptr<Transport> {
        return std::make_shared<BeastTransport>(ioc, ssl_ctx);
    };
}

}  // namespace tether::network
