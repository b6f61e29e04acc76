#include "network/url.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace tether::network {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_valid_port(std::string_view port) {
    if (port.empty() || port.size() > 5) {
        return false;
    }
    if (!std::all_of(port.begin(), port.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    auto value = std::stoul(std::string(port));
    return value > 0 && value <= 65535;
}

}  // namespace

std::string Endpoint::host_header() const {
    const char* default_port = use_tls ? "443" : "80";
    if (port == default_port) {
        return host;
    }
    return host + ":" + port;
}

Result<Endpoint, std::string> parse_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<Endpoint, std::string>::Err("Missing scheme in URL: " + std::string(url));
    }

    Endpoint ep;
    ep.scheme = to_lower(url.substr(0, scheme_end));
    if (ep.scheme == "wss") {
        ep.use_tls = true;
    } else if (ep.scheme != "ws") {
        return Result<Endpoint, std::string>::Err("Unsupported URL scheme: " + ep.scheme);
    }

    auto rest = url.substr(scheme_end + 3);
    auto target_start = rest.find_first_of("/?#");
    auto authority = rest.substr(0, target_start);

    // Strip credentials
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal: [::1]:8080
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return Result<Endpoint, std::string>::Err("Malformed IPv6 host in URL: " + std::string(url));
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Result<Endpoint, std::string>::Err("Malformed authority in URL: " + std::string(url));
            }
            port = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) {
        return Result<Endpoint, std::string>::Err("Missing host in URL: " + std::string(url));
    }
    ep.host = std::string(host);

    if (port.empty()) {
        ep.port = ep.use_tls ? "443" : "80";
    } else if (is_valid_port(port)) {
        ep.port = std::string(port);
    } else {
        return Result<Endpoint, std::string>::Err("Invalid port in URL: " + std::string(port));
    }

    if (target_start != std::string_view::npos) {
        ep.target = std::string(rest.substr(target_start));
    }

    // Fragments are never sent to the server
    if (auto hash = ep.target.find('#'); hash != std::string::npos) {
        ep.target.erase(hash);
    }

    if (ep.target.empty()) {
        ep.target = "/";
    } else if (ep.target.front() == '?') {
        ep.target.insert(ep.target.begin(), '/');
    }

    return Result<Endpoint, std::string>::Ok(std::move(ep));
}

}  // namespace tether::network
