#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <variant>

namespace tether {

/// A decoded inbound frame
///
/// Text frames that parse as JSON carry the parsed value; anything else
/// (invalid JSON, binary frames) is kept as the raw bytes.
struct Message {
    using Payload = std::variant<nlohmann::json, std::string>;

    Payload payload;
    std::size_t size{0};          // Frame size on the wire in bytes
    bool binary{false};
    std::chrono::system_clock::time_point received_at{};

    [[nodiscard]] bool is_json() const noexcept {
        return std::holds_alternative<nlohmann::json>(payload);
    }

    /// @throws std::bad_variant_access if the payload is raw
    [[nodiscard]] const nlohmann::json& as_json() const {
        return std::get<nlohmann::json>(payload);
    }

    /// @throws std::bad_variant_access if the payload is structured
    [[nodiscard]] const std::string& as_text() const {
        return std::get<std::string>(payload);
    }
};

}  // namespace tether
