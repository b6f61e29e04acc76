#pragma once

#include "core/status.hpp"
#include <string>
#include <string_view>

namespace tether::network {

/// Parsed ws:// or wss:// endpoint
struct Endpoint {
    std::string scheme;     // "ws" or "wss"
    std::string host;
    std::string port;       // Defaults to 80 / 443
    std::string target;     // Path with query, at least "/"
    bool use_tls{false};

    /// Host header value: host, plus ":port" when not the scheme default
    [[nodiscard]] std::string host_header() const;
};

/// Parse a WebSocket URL
/// @return Endpoint on success, error message for unsupported schemes or a missing host
[[nodiscard]] Result<Endpoint, std::string> parse_url(std::string_view url);

}  // namespace tether::network
