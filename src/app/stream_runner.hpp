#pragma once

#include "core/config.hpp"
#include "network/transport.hpp"
#include "output/console_reporter.hpp"
#include "websocket/settings.hpp"
#include "websocket/websocket_manager.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tether::app {

/// Streams one URL to the console and keeps a manager alive
///
/// A consumer thread drains the current manager's stream while the calling
/// thread supervises: a manager that ends up dead (retries exhausted or
/// killed) without being shut down is replaced by a fresh one.
class StreamRunner {
public:
    /// @param config Application configuration
    /// @param transport_factory Transport source for every manager (empty = Boost.Beast)
    explicit StreamRunner(const Config& config, network::TransportFactory transport_factory = {});

    ~StreamRunner();

    // Non-copyable, non-movable
    StreamRunner(const StreamRunner&) = delete;
    StreamRunner& operator=(const StreamRunner&) = delete;

    /// Start streaming (blocks until shutdown)
    void run();

    /// Request graceful shutdown (thread-safe, async-signal-safe)
    void request_shutdown() noexcept;

    /// Check if shutdown was requested
    [[nodiscard]] bool shutdown_requested() const noexcept;

    /// Number of times a dead manager was replaced
    [[nodiscard]] std::size_t rebuild_count() const noexcept;

    /// Current manager, nullptr before run()
    [[nodiscard]] std::shared_ptr<websocket::WebSocketManager> manager() const;

    /// Manager options derived from the configuration
    [[nodiscard]] websocket::Options make_options();

    /// Install the async console logger used by the binary
    static void setup_logging(const std::string& level);

private:
    std::shared_ptr<websocket::WebSocketManager> build_manager();
    void rebuild_manager();
    void consumer_thread_func();
    void supervise();

    const Config& config_;
    network::TransportFactory transport_factory_;
    output::ConsoleReporter reporter_;

    mutable std::mutex manager_mutex_;
    std::shared_ptr<websocket::WebSocketManager> manager_;

    std::thread consumer_thread_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<std::size_t> rebuilds_{0};
};

}  // namespace tether::app
