#include "output/console_reporter.hpp"
#include "codec/message_codec.hpp"
#include <spdlog/spdlog.h>

namespace tether::output {

ConsoleReporter::ConsoleReporter(std::chrono::milliseconds interval, std::size_t preview_length)
    : interval_(interval)
    , preview_length_(preview_length)
    , last_output_(std::chrono::steady_clock::now())
{}

bool ConsoleReporter::log_stats(
    const websocket::ConnectionStats& stats,
    network::ConnectionState state,
    Seconds uptime
) {
    auto now = std::chrono::steady_clock::now();

    if (!force_next_ && (now - last_output_) < interval_) {
        return false;
    }

    force_next_ = false;
    last_output_ = now;

    // Format: STATE | UP: Xs | RX: n (bytes) | TX: n (bytes) | CONN: n | DISC: n (p/r) | LAST: ts
    spdlog::info(
        "{} | UP: {:.1f}s | RX: {} ({} B) | TX: {} ({} B) | CONN: {} | DISC: {} ({}p/{}r) | LAST: {}",
        network::to_string(state),
        uptime.count(),
        stats.messages_received, stats.bytes_received,
        stats.messages_sent, stats.bytes_sent,
        stats.connects,
        stats.disconnects, stats.proactive_disconnects, stats.reactive_disconnects,
        codec::MessageCodec::iso_timestamp(stats.last_message_time)
    );

    return true;
}

void ConsoleReporter::log_message(const Message& message) {
    spdlog::info("MSG ({} B{}): {}", message.size, message.binary ? ", binary" : "", preview(message));
}

void ConsoleReporter::log_connection_status(bool connected, const std::string& details) {
    if (connected) {
        spdlog::info("Connection established{}", details.empty() ? "" : ": " + details);
    } else {
        spdlog::warn("Connection lost{}", details.empty() ? "" : ": " + details);
    }
}

void ConsoleReporter::log_disconnect(network::DisconnectReason reason) {
    if (network::is_proactive(reason)) {
        spdlog::info("Disconnected: {}", network::to_string(reason));
    } else {
        log_connection_status(false, std::string(network::to_string(reason)));
    }
}

void ConsoleReporter::force_next() {
    force_next_ = true;
}

std::string ConsoleReporter::preview(const Message& message) const {
    std::string text;
    if (message.binary) {
        text = "<" + std::to_string(message.size) + " bytes>";
    } else if (message.is_json()) {
        text = codec::MessageCodec::encode(message.as_json());
    } else {
        text = message.as_text();
    }

    if (text.size() > preview_length_) {
        text.resize(preview_length_);
        text += "...";
    }
    return text;
}

}  // namespace tether::output
