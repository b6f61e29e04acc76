#include "websocket/connection_stats.hpp"

namespace tether::websocket {

void ConnectionStats::record_connect() {
    ++connects;
    last_connect_time = Clock::now();
}

void ConnectionStats::record_disconnect(bool proactive) {
    ++disconnects;
    if (proactive) {
        ++proactive_disconnects;
    } else {
        ++reactive_disconnects;
    }
    last_disconnect_time = Clock::now();
}

void ConnectionStats::record_message_received(std::size_t bytes) {
    ++messages_received;
    bytes_received += bytes;
    last_message_time = Clock::now();
}

void ConnectionStats::record_message_sent(std::size_t bytes) {
    ++messages_sent;
    bytes_sent += bytes;
}

void ConnectionStats::reset() noexcept {
    *this = ConnectionStats{};
}

}  // namespace tether::websocket
