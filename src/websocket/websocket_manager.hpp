#pragma once

#include "codec/message.hpp"
#include "core/limits.hpp"
#include "network/connection_state.hpp"
#include "network/transport.hpp"
#include "network/url.hpp"
#include "queue/bounded_queue.hpp"
#include "websocket/backoff_policy.hpp"
#include "websocket/connection_stats.hpp"
#include "websocket/event.hpp"
#include "websocket/settings.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace tether::websocket {

class WebSocketManager;

/// Lazy, single-pass view over the manager's inbound queue
///
/// Iteration blocks while the queue is empty (including while the
/// connection is down) and ends once the manager is closed.
class MessageStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Message;
        using difference_type = std::ptrdiff_t;
        using pointer = const Message*;
        using reference = const Message&;

        iterator() = default;

        reference operator*() const { return *stream_->current_; }
        pointer operator->() const { return &*stream_->current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.stream_ == b.stream_;
        }

    private:
        friend class MessageStream;

        explicit iterator(MessageStream* stream) : stream_(stream) { advance(); }

        void advance() {
            if (stream_ != nullptr && !stream_->next()) {
                stream_ = nullptr;
            }
        }

        MessageStream* stream_{nullptr};
    };

    [[nodiscard]] iterator begin() { return iterator(this); }
    [[nodiscard]] iterator end() { return iterator(); }

private:
    friend class WebSocketManager;

    explicit MessageStream(WebSocketManager& manager) : manager_(&manager) {}

    /// Block for the next message, false once the manager is closed
    bool next();

    WebSocketManager* manager_;
    std::optional<Message> current_;
};

/// Resilient client-side WebSocket connection
///
/// Owns one logical connection at a time and keeps it alive: a read loop
/// feeds a bounded inbound queue, a keepalive loop pings the server, and a
/// reconnect loop retries failed or dropped connections with backoff.
///
/// Threading: the manager runs its own io_context on a dedicated network
/// thread and all state changes happen there. Public methods may be called
/// from any thread, including from hooks. The manager must not be
/// destroyed from inside a hook.
class WebSocketManager {
public:
    using Clock = std::chrono::steady_clock;

    /// @throws WebSocketConnectionError if the URL is not a valid ws:// or wss:// URL
    explicit WebSocketManager(Options options);

    /// Manager with default settings for url
    explicit WebSocketManager(std::string url);

    ~WebSocketManager();

    // Non-copyable, non-movable
    WebSocketManager(const WebSocketManager&) = delete;
    WebSocketManager& operator=(const WebSocketManager&) = delete;

    /// Start connecting
    /// Returns once the attempt is underway; use wait_connected() to block.
    /// No effect when closed, connected or already connecting.
    void connect();

    /// Alias for force_close()
    void close();

    /// Close permanently without marking the manager as shut down
    void force_close();

    /// Forced disconnect that leaves the manager reusable and does not reconnect
    void kill();

    /// Close permanently and mark the manager as shut down (idempotent)
    void shutdown();

    /// Proactively drop the live connection and go through the reconnect loop
    void trigger_reconnect();

    /// Drop the live connection with reason, recorded as proactive or reactive by reason
    ///
    /// Without reconnect_after the usual reconnect rules apply. With it, the
    /// next attempt waits exactly reconnect_after instead of the backoff
    /// delay and happens even when auto-reconnect is off. Reasons that never
    /// reconnect (KILLED, SHUTDOWN, NORMAL_CLOSE) ignore reconnect_after.
    /// No effect unless connected.
    void request_disconnect(
        network::DisconnectReason reason = network::DisconnectReason::UserRequested,
        std::optional<std::chrono::milliseconds> reconnect_after = std::nullopt
    );

    /// Connect again after delay
    /// Moves a disconnected or reconnecting manager to RECONNECTING and opens
    /// the transport once delay has passed. No effect when connected,
    /// connecting or closed.
    void schedule_reconnect(std::chrono::milliseconds delay);

    /// Poll a reconnect predicate every reconnect_check_interval until it holds
    ///
    /// Uses predicate when given, otherwise the should_reconnect hook. The
    /// predicate runs on the network thread. Must not be called from a hook.
    /// @return true once the predicate holds, false on timeout or without a predicate
    [[nodiscard]] bool wait_for_reconnect_window(
        std::chrono::milliseconds timeout,
        std::function<bool()> predicate = nullptr
    );

    /// Add channels to the subscription set, sending requests when connected
    void subscribe(const std::vector<std::string>& channels);

    /// Remove channels; absent channels are ignored
    void unsubscribe(const std::vector<std::string>& channels);

    /// Send a structured message as canonical JSON (JSON strings go out as-is)
    /// @throws WebSocketClosedError unless connected
    void send(const nlohmann::json& message);

    /// Send text unchanged
    /// @throws WebSocketClosedError unless connected
    void send(const std::string& text);
    void send(const char* text);

    /// Pop the next inbound message
    /// @throws WebSocketTimeoutError if nothing arrives within timeout
    /// @throws WebSocketClosedError if the manager is closed
    [[nodiscard]] Message receive(std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});

    /// Continuous view over inbound messages, ending once closed
    [[nodiscard]] MessageStream stream();

    /// @return true if connected within timeout
    [[nodiscard]] bool wait_connected(std::chrono::milliseconds timeout);

    /// @return true if not connected within timeout (immediately true before the first connect)
    [[nodiscard]] bool wait_disconnected(std::chrono::milliseconds timeout);

    [[nodiscard]] network::ConnectionState state() const noexcept;
    [[nodiscard]] bool is_connected() const noexcept;

    /// Disconnected or closed: nothing is running and a supervisor should act
    [[nodiscard]] bool is_dead() const noexcept;
    [[nodiscard]] bool is_shutdown() const noexcept;

    [[nodiscard]] std::set<std::string> subscriptions() const;

    /// Time since the last successful connect, zero when not connected
    [[nodiscard]] Seconds connection_duration() const;

    [[nodiscard]] ConnectionStats stats() const;
    void reset_stats();

    [[nodiscard]] const std::string& url() const noexcept { return settings_.url; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    /// Number of messages waiting in the inbound queue
    [[nodiscard]] std::size_t queued_messages() const;

private:
    friend class MessageStream;

    /// Run f on the network thread and wait for its result
    /// Runs inline when already on the network thread.
    template <typename F>
    auto run_on_io(F&& f) -> std::invoke_result_t<F&> {
        using R = std::invoke_result_t<F&>;
        if (ioc_.stopped() || ioc_.get_executor().running_in_this_thread()) {
            return f();
        }
        std::packaged_task<R()> task(std::forward<F>(f));
        auto result = task.get_future();
        boost::asio::post(ioc_, [&task]() { task(); });
        return result.get();
    }

    template <typename Hook, typename... Args>
    void invoke_hook(const char* name, const Hook& hook, Args&&... args);
    bool poll_hook(const char* name, const std::function<bool()>& hook, bool fallback);

    // Everything below runs on the network thread
    void do_connect();
    void open_transport();
    void on_open(std::uint64_t generation, boost::system::error_code ec);
    void on_open_failed(const std::string& what);

    void start_read(std::uint64_t generation);
    void on_read(std::uint64_t generation, boost::system::error_code ec, network::Frame frame);
    bool push_inbound(Message& message);
    void deliver(Message message);
    void resume_reading();

    void start_keepalive(std::uint64_t generation);
    void on_keepalive_tick(std::uint64_t generation);
    void on_pong(std::uint64_t generation);

    void start_age_check(std::uint64_t generation);
    void on_age_check(std::uint64_t generation);

    void send_payload(std::string payload);
    void send_subscription(std::string_view method, const std::string& channel);
    void replay_subscriptions();
    void enqueue_write(std::string payload);
    void do_write(std::uint64_t generation);
    void on_write(std::uint64_t generation, boost::system::error_code ec);

    void handle_disconnect(network::DisconnectReason reason);
    void arm_reconnect();
    void start_reconnect_timer(std::chrono::milliseconds delay);
    void retire(network::DisconnectReason reason);
    void teardown_connection();
    void set_state(network::ConnectionState new_state);

    const Settings settings_;
    Hooks hooks_;
    network::TransportFactory transport_factory_;
    network::Endpoint endpoint_;

    // Network thread and its timers
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::steady_timer open_timer_;
    boost::asio::steady_timer ping_timer_;
    boost::asio::steady_timer pong_timer_;
    boost::asio::steady_timer reconnect_timer_;
    boost::asio::steady_timer age_timer_;

    // Connection (network thread only)
    std::shared_ptr<network::Transport> transport_;
    std::uint64_t generation_{0};
    BackoffPolicy backoff_;
    std::size_t reconnect_attempts_{0};
    std::optional<std::chrono::milliseconds> scheduled_delay_;
    bool awaiting_pong_{false};
    std::deque<std::string> write_queue_;
    bool writing_{false};
    std::optional<Message> parked_;
    std::uint64_t next_request_id_{1};

    // Published to other threads
    std::atomic<network::ConnectionState> state_{network::ConnectionState::Disconnected};
    std::atomic<bool> auto_reconnect_;
    std::atomic<bool> is_shutdown_{false};
    std::atomic<bool> read_paused_{false};
    Event connected_;
    Event disconnected_{true};
    BoundedQueue<Message> queue_;

    mutable std::mutex mutex_;  // Guards stats_, subscriptions_, connected_at_
    ConnectionStats stats_;
    std::set<std::string> subscriptions_;
    std::optional<Clock::time_point> connected_at_;

    std::thread io_thread_;
};

}  // namespace tether::websocket
