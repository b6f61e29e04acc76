#pragma once

#include "codec/message.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace tether::codec {

/// Frame decoding and wire encoding for the WebSocket manager
class MessageCodec {
public:
    /// Decode an inbound frame
    /// Text frames are parsed as JSON with a raw-text fallback, binary frames stay raw.
    [[nodiscard]] static Message decode(std::string payload, bool binary);

    /// Serialize to canonical JSON text
    ///
    /// Separators are ", " and ": " with no indentation, and non-ASCII
    /// characters are escaped, e.g. {"a": 1, "b": [1, 2]}. Invalid UTF-8 in
    /// strings or keys is replaced with U+FFFD instead of throwing.
    [[nodiscard]] static std::string encode(const nlohmann::json& value);

    /// Default subscription request: {"id": N, "method": M, "params": [channel]}
    [[nodiscard]] static nlohmann::json format_subscription(
        std::string_view method,
        const std::string& channel,
        std::uint64_t request_id
    );

    /// Get current ISO8601 timestamp string
    [[nodiscard]] static std::string iso_timestamp();

    /// Format a system-clock time point as ISO8601, "-" for the epoch
    [[nodiscard]] static std::string iso_timestamp(std::chrono::system_clock::time_point tp);
};

}  // namespace tether::codec
