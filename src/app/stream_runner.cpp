#include "app/stream_runner.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <utility>

namespace tether::app {

namespace {

constexpr std::chrono::milliseconds kSupervisorTick{100};

}  // namespace

StreamRunner::StreamRunner(const Config& config, network::TransportFactory transport_factory)
    : config_(config)
    , transport_factory_(std::move(transport_factory))
    , reporter_(config.output.stats_interval)
{}

StreamRunner::~StreamRunner() {
    request_shutdown();

    if (auto manager = this->manager()) {
        manager->shutdown();
    }
    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }
}

void StreamRunner::setup_logging(const std::string& level) {
    // Initialize async logging to avoid blocking the network threads
    spdlog::init_thread_pool(8192, 1);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "tether",
        stdout_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

websocket::Options StreamRunner::make_options() {
    websocket::Options options;
    options.url = config_.stream.url;
    options.ping_interval = config_.stream.ping_interval;
    options.ping_timeout = config_.stream.ping_timeout;
    options.reconnect_delay = config_.stream.reconnect_delay;
    options.max_reconnect_attempts = config_.stream.max_reconnect_attempts;
    options.queue_size = config_.stream.queue_size;
    options.auto_reconnect = config_.stream.auto_reconnect;
    options.config = config_.mapping;
    options.transport_factory = transport_factory_;

    options.hooks.on_connect = [this]() {
        reporter_.log_connection_status(true, config_.stream.url);
    };
    options.hooks.on_disconnect = [this](network::DisconnectReason reason) {
        reporter_.log_disconnect(reason);
    };
    return options;
}

std::shared_ptr<websocket::WebSocketManager> StreamRunner::build_manager() {
    auto manager = std::make_shared<websocket::WebSocketManager>(make_options());
    if (!config_.stream.subscriptions.empty()) {
        manager->subscribe(config_.stream.subscriptions);
    }
    manager->connect();
    return manager;
}

void StreamRunner::rebuild_manager() {
    auto replacement = build_manager();

    std::shared_ptr<websocket::WebSocketManager> old;
    {
        std::lock_guard lock(manager_mutex_);
        old = std::exchange(manager_, replacement);
    }

    // Ends the consumer's stream over the old manager
    if (old) {
        old->force_close();
    }
    rebuilds_.fetch_add(1, std::memory_order_relaxed);
}

void StreamRunner::run() {
    spdlog::info("Starting tether stream");
    spdlog::info("URL: {}", config_.stream.url);

    {
        std::lock_guard lock(manager_mutex_);
        manager_ = build_manager();
    }

    consumer_thread_ = std::thread([this]() {
        consumer_thread_func();
    });

    supervise();

    if (auto manager = this->manager()) {
        manager->shutdown();
        reporter_.force_next();
        reporter_.log_stats(manager->stats(), manager->state(), manager->connection_duration());
    }

    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }

    spdlog::info("Stream shutdown complete");
}

void StreamRunner::supervise() {
    auto last_check = std::chrono::steady_clock::now();

    while (!shutdown_requested()) {
        std::this_thread::sleep_for(kSupervisorTick);

        auto manager = this->manager();
        reporter_.log_stats(manager->stats(), manager->state(), manager->connection_duration());

        auto now = std::chrono::steady_clock::now();
        if (now - last_check < config_.supervisor.check_interval) {
            continue;
        }
        last_check = now;

        if (!manager->is_dead() || manager->is_shutdown()) {
            continue;
        }

        const auto max_rebuilds = config_.supervisor.max_rebuilds;
        if (max_rebuilds != 0 && rebuild_count() >= max_rebuilds) {
            spdlog::error("Manager dead and rebuild limit ({}) reached, stopping", max_rebuilds);
            request_shutdown();
            break;
        }

        spdlog::warn("Manager dead in state {}, rebuilding (rebuild {})",
                     network::to_string(manager->state()), rebuild_count() + 1);
        rebuild_manager();
    }
}

void StreamRunner::consumer_thread_func() {
    spdlog::debug("Consumer thread started");

    while (!shutdown_requested()) {
        auto manager = this->manager();
        for (const auto& message : manager->stream()) {
            reporter_.log_message(message);
        }

        // The stream only ends once its manager is closed; wait for the replacement
        while (!shutdown_requested() && this->manager() == manager) {
            std::this_thread::sleep_for(kSupervisorTick);
        }
    }

    spdlog::debug("Consumer thread stopped");
}

void StreamRunner::request_shutdown() noexcept {
    shutdown_requested_.store(true, std::memory_order_release);
}

bool StreamRunner::shutdown_requested() const noexcept {
    return shutdown_requested_.load(std::memory_order_acquire);
}

std::size_t StreamRunner::rebuild_count() const noexcept {
    return rebuilds_.load(std::memory_order_relaxed);
}

std::shared_ptr<websocket::WebSocketManager> StreamRunner::manager() const {
    std::lock_guard lock(manager_mutex_);
    return manager_;
}

}  // namespace tether::app
