#include "websocket/websocket_manager.hpp"
#include "codec/message_codec.hpp"
#include "core/errors.hpp"
#include "network/beast_transport.hpp"
#include <boost/asio/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <utility>

namespace tether::websocket {

using network::ConnectionState;
using network::DisconnectReason;

namespace {

// Poll granularity for stream(), so a close is noticed while the queue is idle
constexpr std::chrono::milliseconds kStreamPollInterval{100};

network::Endpoint parse_endpoint(const std::string& url) {
    auto result = network::parse_url(url);
    if (result.is_err()) {
        throw WebSocketConnectionError("Invalid WebSocket URL: " + result.error(), url);
    }
    return std::move(result).value();
}

/// Peer broke the WebSocket framing rules, as opposed to the socket failing
bool is_protocol_error(const boost::system::error_code& ec) {
    return ec == boost::beast::websocket::condition::protocol_violation;
}

}  // namespace

// ============================================================================
// MessageStream
// ============================================================================

bool MessageStream::next() {
    while (manager_->state() != ConnectionState::Closed) {
        if (auto msg = manager_->queue_.pop_for(kStreamPollInterval)) {
            current_ = std::move(msg);
            return true;
        }
    }
    current_.reset();
    return false;
}

// ============================================================================
// WebSocketManager
// ============================================================================

WebSocketManager::WebSocketManager(Options options)
    : settings_(resolve_settings(options))
    , hooks_(std::move(options.hooks))
    , transport_factory_(std::move(options.transport_factory))
    , endpoint_(parse_endpoint(settings_.url))
    , work_guard_(boost::asio::make_work_guard(ioc_))
    , open_timer_(ioc_)
    , ping_timer_(ioc_)
    , pong_timer_(ioc_)
    , reconnect_timer_(ioc_)
    , age_timer_(ioc_)
    , backoff_(settings_.reconnect_strategy, settings_.reconnect_delay,
               settings_.max_reconnect_delay, settings_.reconnect_jitter)
    , auto_reconnect_(settings_.auto_reconnect)
    , queue_(settings_.queue_size)
{
    if (!transport_factory_) {
        transport_factory_ = network::make_beast_transport_factory();
    }

    // A consumer freeing a slot resumes a read loop paused by backpressure
    queue_.set_pop_listener([this]() {
        if (read_paused_.load(std::memory_order_acquire)) {
            boost::asio::post(ioc_, [this]() { resume_reading(); });
        }
    });

    io_thread_ = std::thread([this]() {
        for (;;) {
            try {
                ioc_.run();
                break;
            } catch (const std::exception& e) {
                spdlog::error("[{}] Network thread error: {}", settings_.url, e.what());
            }
        }
    });

    spdlog::debug("[{}] Manager created (ping {}ms/{}ms, strategy {}, queue {})",
                  settings_.url, settings_.ping_interval.count(), settings_.ping_timeout.count(),
                  network::to_string(settings_.reconnect_strategy), settings_.queue_size);
}

WebSocketManager::WebSocketManager(std::string url)
    : WebSocketManager(Options{.url = std::move(url)})
{}

WebSocketManager::~WebSocketManager() {
    queue_.set_pop_listener(nullptr);
    force_close();

    work_guard_.reset();
    ioc_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

// ----------------------------------------------------------------------------
// Hooks
// ----------------------------------------------------------------------------

template <typename Hook, typename... Args>
void WebSocketManager::invoke_hook(const char* name, const Hook& hook, Args&&... args) {
    if (!hook) {
        return;
    }
    try {
        hook(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        spdlog::error("[{}] {} hook threw: {}", settings_.url, name, e.what());
    }
}

bool WebSocketManager::poll_hook(const char* name, const std::function<bool()>& hook, bool fallback) {
    if (!hook) {
        return fallback;
    }
    try {
        return hook();
    } catch (const std::exception& e) {
        spdlog::error("[{}] {} hook threw: {}", settings_.url, name, e.what());
        return fallback;
    }
}

// ----------------------------------------------------------------------------
// Public API
// ----------------------------------------------------------------------------

void WebSocketManager::connect() {
    run_on_io([this]() { do_connect(); });
}

void WebSocketManager::close() {
    force_close();
}

void WebSocketManager::force_close() {
    run_on_io([this]() { retire(DisconnectReason::NormalClose); });
}

void WebSocketManager::shutdown() {
    run_on_io([this]() {
        is_shutdown_.store(true, std::memory_order_release);
        retire(DisconnectReason::Shutdown);
    });
}

void WebSocketManager::kill() {
    run_on_io([this]() {
        const auto current = state();
        if (current == ConnectionState::Closed) {
            spdlog::warn("[{}] kill() ignored: manager is closed", settings_.url);
            return;
        }
        if (current == ConnectionState::Disconnected) {
            spdlog::debug("[{}] kill() ignored: already disconnected", settings_.url);
            return;
        }

        const bool was_connected = current == ConnectionState::Connected;
        teardown_connection();
        set_state(ConnectionState::Disconnected);
        spdlog::warn("[{}] Connection killed", settings_.url);

        if (was_connected) {
            {
                std::lock_guard lock(mutex_);
                stats_.record_disconnect(false);
            }
            invoke_hook("on_disconnect", hooks_.on_disconnect, DisconnectReason::Killed);
        }
    });
}

void WebSocketManager::trigger_reconnect() {
    run_on_io([this]() {
        const auto current = state();
        if (current != ConnectionState::Connected) {
            spdlog::warn("[{}] trigger_reconnect() ignored in state {}",
                         settings_.url, network::to_string(current));
            return;
        }
        spdlog::info("[{}] Proactive reconnect requested", settings_.url);
        handle_disconnect(DisconnectReason::ProactiveReconnect);
    });
}

void WebSocketManager::request_disconnect(DisconnectReason reason,
                                          std::optional<std::chrono::milliseconds> reconnect_after) {
    run_on_io([this, reason, reconnect_after]() {
        const auto current = state();
        if (current != ConnectionState::Connected) {
            spdlog::debug("[{}] request_disconnect() ignored in state {}",
                          settings_.url, network::to_string(current));
            return;
        }
        spdlog::info("[{}] Disconnect requested ({})", settings_.url, network::to_string(reason));
        scheduled_delay_ = reconnect_after;
        handle_disconnect(reason);
    });
}

void WebSocketManager::schedule_reconnect(std::chrono::milliseconds delay) {
    run_on_io([this, delay]() {
        const auto current = state();
        if (current == ConnectionState::Closed ||
            current == ConnectionState::Connected ||
            current == ConnectionState::Connecting) {
            spdlog::debug("[{}] schedule_reconnect() ignored in state {}",
                          settings_.url, network::to_string(current));
            return;
        }
        spdlog::info("[{}] Reconnect scheduled in {}ms", settings_.url, delay.count());
        set_state(ConnectionState::Reconnecting);
        start_reconnect_timer(delay);
    });
}

bool WebSocketManager::wait_for_reconnect_window(std::chrono::milliseconds timeout,
                                                 std::function<bool()> predicate) {
    if (!predicate) {
        predicate = hooks_.should_reconnect;
    }
    if (!predicate) {
        return false;
    }

    const auto deadline = Clock::now() + timeout;
    for (;;) {
        if (run_on_io([this, &predicate]() { return poll_hook("should_reconnect", predicate, false); })) {
            return true;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(
            std::min<Clock::duration>(settings_.reconnect_check_interval, deadline - now));
    }
}

void WebSocketManager::subscribe(const std::vector<std::string>& channels) {
    run_on_io([this, &channels]() {
        for (const auto& channel : channels) {
            bool added = false;
            {
                std::lock_guard lock(mutex_);
                added = subscriptions_.insert(channel).second;
            }
            if (added && state() == ConnectionState::Connected) {
                send_subscription("SUBSCRIBE", channel);
            }
        }
    });
}

void WebSocketManager::unsubscribe(const std::vector<std::string>& channels) {
    run_on_io([this, &channels]() {
        for (const auto& channel : channels) {
            bool removed = false;
            {
                std::lock_guard lock(mutex_);
                removed = subscriptions_.erase(channel) > 0;
            }
            if (removed && state() == ConnectionState::Connected) {
                send_subscription("UNSUBSCRIBE", channel);
            }
        }
    });
}

void WebSocketManager::send(const nlohmann::json& message) {
    if (message.is_string()) {
        send(message.get_ref<const std::string&>());
        return;
    }
    auto payload = codec::MessageCodec::encode(message);
    run_on_io([this, &payload]() { send_payload(std::move(payload)); });
}

void WebSocketManager::send(const std::string& text) {
    run_on_io([this, &text]() { send_payload(text); });
}

void WebSocketManager::send(const char* text) {
    send(std::string(text));
}

Message WebSocketManager::receive(std::chrono::milliseconds timeout) {
    if (state() == ConnectionState::Closed) {
        throw WebSocketClosedError("Cannot receive: connection is closed");
    }

    auto msg = queue_.pop_for(timeout);
    if (!msg) {
        if (state() == ConnectionState::Closed) {
            throw WebSocketClosedError("Cannot receive: connection is closed");
        }
        throw WebSocketTimeoutError(
            "No message received within " + std::to_string(timeout.count()) + "ms",
            "receive",
            timeout
        );
    }
    return std::move(*msg);
}

MessageStream WebSocketManager::stream() {
    return MessageStream(*this);
}

bool WebSocketManager::wait_connected(std::chrono::milliseconds timeout) {
    return connected_.wait_for(timeout);
}

bool WebSocketManager::wait_disconnected(std::chrono::milliseconds timeout) {
    return disconnected_.wait_for(timeout);
}

ConnectionState WebSocketManager::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool WebSocketManager::is_connected() const noexcept {
    return state() == ConnectionState::Connected;
}

bool WebSocketManager::is_dead() const noexcept {
    const auto current = state();
    return current == ConnectionState::Disconnected || current == ConnectionState::Closed;
}

bool WebSocketManager::is_shutdown() const noexcept {
    return is_shutdown_.load(std::memory_order_acquire);
}

std::set<std::string> WebSocketManager::subscriptions() const {
    std::lock_guard lock(mutex_);
    return subscriptions_;
}

Seconds WebSocketManager::connection_duration() const {
    std::lock_guard lock(mutex_);
    if (!connected_at_ || state() != ConnectionState::Connected) {
        return Seconds{0.0};
    }
    return std::chrono::duration_cast<Seconds>(Clock::now() - *connected_at_);
}

ConnectionStats WebSocketManager::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

void WebSocketManager::reset_stats() {
    std::lock_guard lock(mutex_);
    stats_.reset();
}

std::size_t WebSocketManager::queued_messages() const {
    return queue_.size();
}

// ----------------------------------------------------------------------------
// Connection lifecycle (network thread)
// ----------------------------------------------------------------------------

void WebSocketManager::do_connect() {
    const auto current = state();
    if (!network::can_connect(current)) {
        spdlog::warn("[{}] Cannot connect from state {}", settings_.url, network::to_string(current));
        return;
    }
    if (current == ConnectionState::Connected || current == ConnectionState::Connecting) {
        spdlog::debug("[{}] connect() ignored: already {}", settings_.url, network::to_string(current));
        return;
    }

    // An explicit connect while waiting to retry starts the attempt now
    reconnect_timer_.cancel();
    scheduled_delay_.reset();
    open_transport();
}

void WebSocketManager::open_transport() {
    set_state(ConnectionState::Connecting);

    const auto generation = ++generation_;
    transport_ = transport_factory_(ioc_);

    spdlog::info("[{}] Connecting", settings_.url);

    open_timer_.expires_after(settings_.connection_timeout);
    open_timer_.async_wait([this, generation](boost::system::error_code ec) {
        if (ec || generation != generation_ || state() != ConnectionState::Connecting) {
            return;
        }
        on_open_failed("timed out after " + std::to_string(settings_.connection_timeout.count()) + "ms");
    });

    transport_->async_open(
        endpoint_,
        settings_.connection_timeout,
        [this, generation](boost::system::error_code ec) {
            on_open(generation, ec);
        }
    );
}

void WebSocketManager::on_open(std::uint64_t generation, boost::system::error_code ec) {
    if (generation != generation_ || state() != ConnectionState::Connecting) {
        return;
    }
    open_timer_.cancel();

    if (ec) {
        return on_open_failed(ec.message());
    }

    reconnect_attempts_ = 0;
    backoff_.reset();
    {
        std::lock_guard lock(mutex_);
        stats_.record_connect();
        connected_at_ = Clock::now();
    }

    transport_->set_pong_handler([this, generation]() { on_pong(generation); });
    set_state(ConnectionState::Connected);
    spdlog::info("[{}] Connected", settings_.url);

    if (!read_paused_.load(std::memory_order_acquire)) {
        start_read(generation);
    }
    start_keepalive(generation);
    start_age_check(generation);

    // Read completions are posted, so replayed requests are written before
    // anything is read from the new connection
    replay_subscriptions();
    if (generation != generation_) {
        return;
    }

    invoke_hook("on_connect", hooks_.on_connect);

    if (state() == ConnectionState::Connected) {
        connected_.set();
    }
}

void WebSocketManager::on_open_failed(const std::string& what) {
    spdlog::warn("[{}] Connection attempt failed: {}", settings_.url, what);
    teardown_connection();

    if (auto_reconnect_.load(std::memory_order_acquire)) {
        set_state(ConnectionState::Reconnecting);
        arm_reconnect();
    } else {
        set_state(ConnectionState::Disconnected);
    }
}

void WebSocketManager::handle_disconnect(DisconnectReason reason) {
    const bool proactive = network::is_proactive(reason);

    teardown_connection();
    {
        std::lock_guard lock(mutex_);
        stats_.record_disconnect(proactive);
    }

    const bool reconnect = (auto_reconnect_.load(std::memory_order_acquire) || scheduled_delay_) &&
                           reason != DisconnectReason::Killed &&
                           reason != DisconnectReason::Shutdown &&
                           reason != DisconnectReason::NormalClose;

    if (!reconnect) {
        scheduled_delay_.reset();
    }
    set_state(reconnect ? ConnectionState::Reconnecting : ConnectionState::Disconnected);

    if (proactive) {
        spdlog::info("[{}] Disconnected ({})", settings_.url, network::to_string(reason));
    } else {
        spdlog::warn("[{}] Disconnected ({})", settings_.url, network::to_string(reason));
    }

    invoke_hook("on_disconnect", hooks_.on_disconnect, reason);

    // The hook may have closed or reconnected the manager
    if (reconnect) {
        arm_reconnect();
    }
}

void WebSocketManager::arm_reconnect() {
    if (state() != ConnectionState::Reconnecting) {
        return;
    }

    if (scheduled_delay_) {
        const auto delay = *std::exchange(scheduled_delay_, std::nullopt);
        spdlog::info("[{}] Reconnecting in {}ms (requested)", settings_.url, delay.count());
        return start_reconnect_timer(delay);
    }

    if (reconnect_attempts_ >= settings_.max_reconnect_attempts) {
        spdlog::error("[{}] Giving up after {} reconnect attempts", settings_.url, reconnect_attempts_);
        set_state(ConnectionState::Disconnected);
        return;
    }

    const bool callback_controlled =
        settings_.reconnect_strategy == network::ReconnectStrategy::CallbackControlled;

    if (!poll_hook("should_reconnect", hooks_.should_reconnect, true)) {
        if (callback_controlled) {
            spdlog::debug("[{}] Waiting for reconnect window", settings_.url);
            reconnect_timer_.expires_after(settings_.reconnect_check_interval);
            reconnect_timer_.async_wait([this](boost::system::error_code ec) {
                if (!ec) {
                    arm_reconnect();
                }
            });
            return;
        }
        spdlog::info("[{}] Reconnect declined by should_reconnect", settings_.url);
        set_state(ConnectionState::Disconnected);
        return;
    }

    ++reconnect_attempts_;
    const auto delay = backoff_.next_delay();
    spdlog::info("[{}] Reconnecting in {}ms (attempt {}/{})",
                 settings_.url, delay.count(), reconnect_attempts_, settings_.max_reconnect_attempts);
    start_reconnect_timer(delay);
}

void WebSocketManager::start_reconnect_timer(std::chrono::milliseconds delay) {
    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || state() != ConnectionState::Reconnecting) {
            return;
        }
        open_transport();
    });
}

void WebSocketManager::retire(DisconnectReason reason) {
    auto_reconnect_.store(false, std::memory_order_release);

    const auto current = state();
    if (current == ConnectionState::Closed) {
        return;
    }

    teardown_connection();
    set_state(ConnectionState::Closed);
    scheduled_delay_.reset();
    parked_.reset();
    read_paused_.store(false, std::memory_order_release);
    spdlog::info("[{}] Closed ({})", settings_.url, network::to_string(reason));

    if (current == ConnectionState::Connected) {
        {
            std::lock_guard lock(mutex_);
            stats_.record_disconnect(true);
        }
        invoke_hook("on_disconnect", hooks_.on_disconnect, reason);
    }
}

void WebSocketManager::teardown_connection() {
    // Handlers of the old connection compare against this and drop out
    ++generation_;

    open_timer_.cancel();
    ping_timer_.cancel();
    pong_timer_.cancel();
    reconnect_timer_.cancel();
    age_timer_.cancel();
    awaiting_pong_ = false;

    write_queue_.clear();
    writing_ = false;

    if (transport_) {
        transport_->set_pong_handler(nullptr);
        transport_->close();
        transport_.reset();
    }

    std::lock_guard lock(mutex_);
    connected_at_.reset();
}

void WebSocketManager::set_state(ConnectionState new_state) {
    const auto old_state = state();
    if (old_state == new_state || network::is_terminal(old_state)) {
        return;
    }

    state_.store(new_state, std::memory_order_release);
    spdlog::debug("[{}] State {} -> {}", settings_.url,
                  network::to_string(old_state), network::to_string(new_state));

    switch (new_state) {
        case ConnectionState::Connected:
            disconnected_.clear();
            break;
        case ConnectionState::Connecting:
            connected_.clear();
            break;
        case ConnectionState::Disconnected:
        case ConnectionState::Reconnecting:
            connected_.clear();
            disconnected_.set();
            break;
        case ConnectionState::Closed:
            connected_.clear();
            disconnected_.set();
            queue_.close();
            break;
    }
}

// ----------------------------------------------------------------------------
// Read loop and backpressure (network thread)
// ----------------------------------------------------------------------------

void WebSocketManager::start_read(std::uint64_t generation) {
    transport_->async_read(
        [this, generation](boost::system::error_code ec, network::Frame frame) {
            on_read(generation, ec, std::move(frame));
        }
    );
}

void WebSocketManager::on_read(std::uint64_t generation, boost::system::error_code ec, network::Frame frame) {
    if (generation != generation_ || state() != ConnectionState::Connected) {
        return;
    }

    if (ec) {
        if (ec == boost::beast::websocket::error::closed) {
            auto info = transport_->close_info();
            spdlog::info("[{}] Server closed connection (code {}{}{})", settings_.url, info.code,
                         info.reason.empty() ? "" : ": ", info.reason);
            return handle_disconnect(DisconnectReason::ServerClose);
        }
        spdlog::warn("[{}] Read error: {}", settings_.url, ec.message());
        return handle_disconnect(is_protocol_error(ec) ? DisconnectReason::ProtocolError
                                                       : DisconnectReason::NetworkError);
    }

    auto message = codec::MessageCodec::decode(std::move(frame.payload), frame.binary);
    invoke_hook("on_message", hooks_.on_message, message);
    deliver(std::move(message));

    // The hook may have torn the connection down
    if (generation == generation_ &&
        state() == ConnectionState::Connected &&
        !read_paused_.load(std::memory_order_acquire)) {
        start_read(generation);
    }
}

bool WebSocketManager::push_inbound(Message& message) {
    // Counted under the stats lock, so a consumer that pops a message and
    // then reads stats() always sees it counted
    std::lock_guard lock(mutex_);
    const auto size = message.size;
    if (!queue_.try_push(std::move(message))) {
        return false;
    }
    stats_.record_message_received(size);
    return true;
}

void WebSocketManager::deliver(Message message) {
    if (!push_inbound(message)) {
        if (queue_.is_closed()) {
            return;
        }

        // try_push leaves the message untouched when it fails
        spdlog::debug("[{}] Inbound queue full ({}), pausing reads", settings_.url, queue_.capacity());
        parked_.emplace(std::move(message));
        read_paused_.store(true, std::memory_order_release);

        // Pongs are only seen by an active read
        if (awaiting_pong_) {
            awaiting_pong_ = false;
            pong_timer_.cancel();
        }

        // A consumer may have popped before the flag was visible
        if (!queue_.is_full()) {
            boost::asio::post(ioc_, [this]() { resume_reading(); });
        }
    }
}

void WebSocketManager::resume_reading() {
    if (!read_paused_.load(std::memory_order_acquire) || !parked_) {
        return;
    }

    if (!push_inbound(*parked_)) {
        return;
    }
    parked_.reset();
    read_paused_.store(false, std::memory_order_release);

    spdlog::debug("[{}] Inbound queue drained, resuming reads", settings_.url);
    if (state() == ConnectionState::Connected && transport_) {
        start_read(generation_);
    }
}

// ----------------------------------------------------------------------------
// Keepalive (network thread)
// ----------------------------------------------------------------------------

void WebSocketManager::start_keepalive(std::uint64_t generation) {
    ping_timer_.expires_after(settings_.ping_interval);
    ping_timer_.async_wait([this, generation](boost::system::error_code ec) {
        if (ec || generation != generation_) {
            return;
        }
        on_keepalive_tick(generation);
    });
}

void WebSocketManager::on_keepalive_tick(std::uint64_t generation) {
    if (state() != ConnectionState::Connected) {
        return;
    }

    if (poll_hook("should_disconnect", hooks_.should_disconnect, false)) {
        spdlog::info("[{}] should_disconnect requested a reconnect", settings_.url);
        return handle_disconnect(DisconnectReason::ProactiveReconnect);
    }

    if (!read_paused_.load(std::memory_order_acquire) && !awaiting_pong_) {
        awaiting_pong_ = true;
        transport_->async_ping([this, generation](boost::system::error_code ec) {
            if (ec && generation == generation_) {
                spdlog::debug("[{}] Ping failed: {}", settings_.url, ec.message());
            }
        });

        pong_timer_.expires_after(settings_.ping_timeout);
        pong_timer_.async_wait([this, generation](boost::system::error_code ec) {
            if (ec || generation != generation_ || !awaiting_pong_) {
                return;
            }
            spdlog::warn("[{}] No pong within {}ms", settings_.url, settings_.ping_timeout.count());
            handle_disconnect(DisconnectReason::PingTimeout);
        });
    }

    start_keepalive(generation);
}

void WebSocketManager::on_pong(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }
    awaiting_pong_ = false;
    pong_timer_.cancel();
}

// ----------------------------------------------------------------------------
// Connection age (network thread)
// ----------------------------------------------------------------------------

void WebSocketManager::start_age_check(std::uint64_t generation) {
    if (!settings_.max_connection_age) {
        return;
    }
    age_timer_.expires_after(settings_.disconnect_check_interval);
    age_timer_.async_wait([this, generation](boost::system::error_code ec) {
        if (ec || generation != generation_) {
            return;
        }
        on_age_check(generation);
    });
}

void WebSocketManager::on_age_check(std::uint64_t generation) {
    if (state() != ConnectionState::Connected) {
        return;
    }

    const auto limit = *settings_.max_connection_age - settings_.disconnect_margin;
    if (connection_duration() >= limit) {
        spdlog::info("[{}] Connection within {}ms of its {}ms lifetime, rotating", settings_.url,
                     settings_.disconnect_margin.count(), settings_.max_connection_age->count());
        return handle_disconnect(DisconnectReason::ConnectionLimit);
    }

    start_age_check(generation);
}

// ----------------------------------------------------------------------------
// Writes and subscriptions (network thread)
// ----------------------------------------------------------------------------

void WebSocketManager::send_payload(std::string payload) {
    const auto current = state();
    if (!network::can_send(current)) {
        throw WebSocketClosedError(
            "Cannot send: connection is " + std::string(network::to_string(current))
        );
    }

    {
        std::lock_guard lock(mutex_);
        stats_.record_message_sent(payload.size());
    }
    enqueue_write(std::move(payload));
}

void WebSocketManager::send_subscription(std::string_view method, const std::string& channel) {
    const auto request_id = next_request_id_++;
    std::string payload;
    try {
        nlohmann::json request = hooks_.subscribe_formatter
            ? hooks_.subscribe_formatter(method, channel, request_id)
            : codec::MessageCodec::format_subscription(method, channel, request_id);
        payload = request.is_string() ? request.get<std::string>() : codec::MessageCodec::encode(request);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Cannot build {} request for {}: {}", settings_.url, method, channel, e.what());
        return;
    }

    // The formatter may have torn the connection down
    if (state() != ConnectionState::Connected) {
        return;
    }
    spdlog::debug("[{}] {} {}", settings_.url, method, channel);
    send_payload(std::move(payload));
}

void WebSocketManager::replay_subscriptions() {
    std::set<std::string> channels;
    {
        std::lock_guard lock(mutex_);
        channels = subscriptions_;
    }
    if (channels.empty()) {
        return;
    }

    spdlog::info("[{}] Replaying {} subscriptions", settings_.url, channels.size());
    const auto generation = generation_;
    for (const auto& channel : channels) {
        if (generation != generation_) {
            return;
        }
        send_subscription("SUBSCRIBE", channel);
    }
}

void WebSocketManager::enqueue_write(std::string payload) {
    write_queue_.push_back(std::move(payload));
    if (!writing_) {
        do_write(generation_);
    }
}

void WebSocketManager::do_write(std::uint64_t generation) {
    if (write_queue_.empty() || !transport_) {
        writing_ = false;
        return;
    }

    writing_ = true;
    auto payload = std::move(write_queue_.front());
    write_queue_.pop_front();

    transport_->async_write(
        std::move(payload),
        [this, generation](boost::system::error_code ec) {
            on_write(generation, ec);
        }
    );
}

void WebSocketManager::on_write(std::uint64_t generation, boost::system::error_code ec) {
    if (generation != generation_) {
        return;
    }
    if (ec) {
        // The read loop reports the broken connection
        spdlog::debug("[{}] Write error: {}", settings_.url, ec.message());
        writing_ = false;
        return;
    }
    do_write(generation);
}

}  // namespace tether::websocket
