#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tether {

/// Base class for all errors raised by the WebSocket manager API
class WebSocketError : public std::runtime_error {
public:
    explicit WebSocketError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Connection could not be established (bad URL, scoped open timed out)
class WebSocketConnectionError : public WebSocketError {
public:
    explicit WebSocketConnectionError(
        const std::string& message,
        std::string url = {},
        std::size_t attempts = 0
    )
        : WebSocketError(message)
        , url_(std::move(url))
        , attempts_(attempts)
    {}

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }

private:
    std::string url_;
    std::size_t attempts_;
};

/// Operation attempted while the connection is not open
class WebSocketClosedError : public WebSocketError {
public:
    /// 1006 is the RFC 6455 code for an abnormal closure
    static constexpr std::uint16_t kAbnormalClosure = 1006;

    explicit WebSocketClosedError(
        const std::string& message,
        std::uint16_t code = kAbnormalClosure,
        std::string reason = {}
    )
        : WebSocketError(message)
        , code_(code)
        , reason_(std::move(reason))
    {}

    [[nodiscard]] std::uint16_t code() const noexcept { return code_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::uint16_t code_;
    std::string reason_;
};

/// A bounded wait expired
class WebSocketTimeoutError : public WebSocketError {
public:
    explicit WebSocketTimeoutError(
        const std::string& message,
        std::string operation = {},
        std::chrono::milliseconds timeout = std::chrono::milliseconds{0}
    )
        : WebSocketError(message)
        , operation_(std::move(operation))
        , timeout_(timeout)
    {}

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::string operation_;
    std::chrono::milliseconds timeout_;
};

}  // namespace tether
