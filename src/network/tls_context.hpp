#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace tether::network {

/// Create a TLS client context for wss:// connections
/// @param verify_peer Verify the server certificate against the system store
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_tls_context(bool verify_peer = true);

}  // namespace tether::network
