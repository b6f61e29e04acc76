#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tether {

using json = nlohmann::json;

namespace {

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer within [min_val, max_val]
std::optional<long long> get_env_int(const char* name, long long min_val, long long max_val) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::logic_error&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Split a comma separated list, skipping empty entries
std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void apply_env_overrides(Config& config) {
    if (auto v = get_env("TETHER_URL")) {
        config.stream.url = *v;
    }
    if (auto v = get_env("TETHER_SUBSCRIPTIONS")) {
        config.stream.subscriptions = split_list(*v);
    }
    // Explicit overrides bypass the mapping's hard limits, so keep them sane here
    if (auto v = get_env_int("TETHER_PING_INTERVAL_MS", 100, 600000)) {
        config.stream.ping_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("TETHER_PING_TIMEOUT_MS", 100, 300000)) {
        config.stream.ping_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("TETHER_RECONNECT_DELAY_MS", 0, 300000)) {
        config.stream.reconnect_delay = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("TETHER_MAX_RECONNECT_ATTEMPTS", 0, 1000)) {
        config.stream.max_reconnect_attempts = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env_int("TETHER_QUEUE_SIZE", 0, 1000000)) {
        config.stream.queue_size = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env_int("TETHER_STATS_INTERVAL_MS", 100, 3600000)) {
        config.output.stats_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env("TETHER_LOG_LEVEL")) {
        config.output.log_level = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        return Result<Config, std::string>::Err("Config root must be a JSON object");
    }

    Config config = Config::defaults();

    try {
        if (j.contains("stream")) {
            const auto& stream = j["stream"];
            if (stream.contains("url")) {
                config.stream.url = stream["url"].get<std::string>();
            }
            if (stream.contains("subscriptions")) {
                config.stream.subscriptions =
                    stream["subscriptions"].get<std::vector<std::string>>();
            }
            if (stream.contains("auto_reconnect")) {
                config.stream.auto_reconnect = stream["auto_reconnect"].get<bool>();
            }
        }

        if (j.contains("supervisor")) {
            const auto& sup = j["supervisor"];
            if (sup.contains("check_interval_ms")) {
                config.supervisor.check_interval =
                    std::chrono::milliseconds(sup["check_interval_ms"].get<int>());
            }
            if (sup.contains("max_rebuilds")) {
                config.supervisor.max_rebuilds = sup["max_rebuilds"].get<std::size_t>();
            }
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            if (out.contains("stats_interval_ms")) {
                config.output.stats_interval =
                    std::chrono::milliseconds(out["stats_interval_ms"].get<int>());
            }
            if (out.contains("log_level")) {
                config.output.log_level = out["log_level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    // The websocket section is validated and clamped by get_websocket_limits()
    if (j.contains("websocket")) {
        config.mapping["websocket"] = j["websocket"];
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    apply_env_overrides(config);

    return config;
}

}  // namespace tether
