#pragma once

#include "core/errors.hpp"
#include "websocket/websocket_manager.hpp"
#include <memory>
#include <string>

namespace tether::websocket {

/// RAII connection: connects on construction, force-closes on destruction
class ScopedConnection {
public:
    /// Connect and wait up to the manager's connection timeout
    /// @throws WebSocketConnectionError if the connection is not established in time
    explicit ScopedConnection(Options options)
        : manager_(std::make_unique<WebSocketManager>(std::move(options)))
    {
        open();
    }

    explicit ScopedConnection(std::string url)
        : ScopedConnection(Options{.url = std::move(url)})
    {}

    ~ScopedConnection() {
        manager_->force_close();
    }

    // Non-copyable, non-movable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    [[nodiscard]] WebSocketManager& manager() noexcept { return *manager_; }
    WebSocketManager* operator->() noexcept { return manager_.get(); }
    WebSocketManager& operator*() noexcept { return *manager_; }

private:
    void open() {
        const auto timeout = manager_->settings().connection_timeout;
        manager_->connect();
        if (!manager_->wait_connected(timeout)) {
            manager_->force_close();
            throw WebSocketConnectionError(
                "Failed to connect to " + manager_->url() + " within " +
                    std::to_string(timeout.count()) + "ms",
                manager_->url()
            );
        }
    }

    std::unique_ptr<WebSocketManager> manager_;
};

}  // namespace tether::websocket
