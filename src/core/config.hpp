#pragma once

#include "core/status.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tether {

/// Configuration for the tether streaming binary
struct Config {
    /// Stream target and explicit connection overrides
    struct Stream {
        std::string url = "wss://stream.binance.com:9443/ws";
        std::vector<std::string> subscriptions;
        bool auto_reconnect = true;

        // Explicit overrides; unset values defer to the "websocket" mapping
        std::optional<std::chrono::milliseconds> ping_interval;
        std::optional<std::chrono::milliseconds> ping_timeout;
        std::optional<std::chrono::milliseconds> reconnect_delay;
        std::optional<std::size_t> max_reconnect_attempts;
        std::optional<std::size_t> queue_size;
    };

    /// Supervisor that rebuilds dead managers
    struct Supervisor {
        std::chrono::milliseconds check_interval{5000};
        std::size_t max_rebuilds = 0;  // 0 = unlimited
    };

    /// Output configuration
    struct Output {
        std::chrono::milliseconds stats_interval{10000};
        std::string log_level = "info";
    };

    Stream stream;
    Supervisor supervisor;
    Output output;

    /// Raw nested mapping (the file's "websocket" key, kept under that key)
    nlohmann::json mapping = nlohmann::json::object();

    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from a JSON file
    /// Missing fields keep their defaults
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file and environment overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace tether
