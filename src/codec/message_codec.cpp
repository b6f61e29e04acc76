#include "codec/message_codec.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tether::codec {

namespace {

std::string dump_scalar(const nlohmann::json& value) {
    return value.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

void encode_into(const nlohmann::json& value, std::string& out) {
    if (value.is_object()) {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : value.items()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += dump_scalar(nlohmann::json(key));
            out += ": ";
            encode_into(item, out);
        }
        out += '}';
    } else if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : value) {
            if (!first) {
                out += ", ";
            }
            first = false;
            encode_into(item, out);
        }
        out += ']';
    } else {
        out += dump_scalar(value);
    }
}

}  // namespace

Message MessageCodec::decode(std::string payload, bool binary) {
    Message msg;
    msg.size = payload.size();
    msg.binary = binary;
    msg.received_at = std::chrono::system_clock::now();

    if (!binary) {
        // Non-throwing parse: discarded values come back as json::value_t::discarded
        auto parsed = nlohmann::json::parse(payload, nullptr, false);
        if (!parsed.is_discarded()) {
            msg.payload = std::move(parsed);
            return msg;
        }
    }

    msg.payload = std::move(payload);
    return msg;
}

std::string MessageCodec::encode(const nlohmann::json& value) {
    std::string out;
    encode_into(value, out);
    return out;
}

nlohmann::json MessageCodec::format_subscription(
    std::string_view method,
    const std::string& channel,
    std::uint64_t request_id
) {
    return nlohmann::json{
        {"id", request_id},
        {"method", std::string(method)},
        {"params", nlohmann::json::array({channel})}
    };
}

std::string MessageCodec::iso_timestamp() {
    return iso_timestamp(std::chrono::system_clock::now());
}

std::string MessageCodec::iso_timestamp(std::chrono::system_clock::time_point tp) {
    if (tp.time_since_epoch().count() == 0) {
        return "-";
    }

    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_tp, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace tether::codec
