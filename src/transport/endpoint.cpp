#include "rtchat/transport/endpoint.hpp"

#include <ada.h>

#include <charconv>
#include <format>

namespace rtchat {

namespace {

bool is_unreserved(unsigned char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '!':
        case '~': case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

constexpr std::uint16_t default_port(bool secure) {
    return secure ? 443 : 80;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SocketEndpoint
// ═══════════════════════════════════════════════════════════════════════════

std::string SocketEndpoint::host_header() const {
    const bool host_is_ipv6 = (host.find(':') != std::string::npos) && !host.starts_with('[');
    const std::string printable = host_is_ipv6 ? "[" + host + "]" : host;
    if (port == default_port(secure)) {
        return printable;
    }
    return std::format("{}:{}", printable, port);
}

std::string SocketEndpoint::url() const {
    return std::format("{}://{}{}", scheme(), host_header(), target);
}

std::string SocketEndpoint::redacted_url() const {
    return redact_token(url());
}

// ═══════════════════════════════════════════════════════════════════════════
// Building
// ═══════════════════════════════════════════════════════════════════════════

ConnectionResult<SocketEndpoint> build_socket_endpoint(
    std::string_view endpoint_base_url,
    std::string_view conversation_id,
    std::string_view auth_token
) {
    auto parsed = ada::parse<ada::url>(endpoint_base_url);
    if (!parsed) {
        return tl::unexpected(ConnectionError::invalid_endpoint(
            std::format("Invalid endpoint URL: {}", endpoint_base_url)));
    }
    const auto& base = parsed.value();

    const std::string protocol(base.get_protocol());
    SocketEndpoint endpoint;
    if (protocol == "https:" || protocol == "wss:") {
        endpoint.secure = true;
    } else if (protocol == "http:" || protocol == "ws:") {
        endpoint.secure = false;
    } else {
        return tl::unexpected(ConnectionError::invalid_endpoint(
            std::format("Unsupported endpoint scheme: {}", protocol)));
    }

    std::string hostname(base.get_hostname());
    if (hostname.empty()) {
        return tl::unexpected(ConnectionError::invalid_endpoint("Endpoint URL has no host"));
    }
    // ada keeps IPv6 literals bracketed; resolvers want them bare.
    if (hostname.size() > 2 && hostname.front() == '[' && hostname.back() == ']') {
        hostname = hostname.substr(1, hostname.size() - 2);
    }
    endpoint.host = std::move(hostname);

    const std::string_view port_str = base.get_port();
    if (port_str.empty()) {
        endpoint.port = default_port(endpoint.secure);
    } else {
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
        if (ec != std::errc{} || value == 0 || value > 65535) {
            return tl::unexpected(ConnectionError::invalid_endpoint(
                std::format("Invalid endpoint port: {}", port_str)));
        }
        endpoint.port = static_cast<std::uint16_t>(value);
    }

    endpoint.target = std::format("/ws/messages/{}/?token={}",
                                  percent_encode(conversation_id),
                                  percent_encode(auth_token));
    return endpoint;
}

std::string percent_encode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string redact_token(std::string_view url) {
    static constexpr std::string_view kKey = "token=";
    std::string out;
    out.reserve(url.size());

    std::size_t pos = 0;
    while (pos < url.size()) {
        const std::size_t found = url.find(kKey, pos);
        if (found == std::string_view::npos) {
            out.append(url.substr(pos));
            break;
        }
        // Only a real parameter name: preceded by '?' or '&'.
        const bool at_param_start = (found > 0) && (url[found - 1] == '?' || url[found - 1] == '&');
        out.append(url.substr(pos, found - pos + kKey.size()));
        pos = found + kKey.size();
        if (at_param_start == false) {
            continue;
        }
        std::size_t end = url.find_first_of("&#", pos);
        if (end == std::string_view::npos) {
            end = url.size();
        }
        if (end > pos) {
            out.append("***");
        }
        pos = end;
    }
    return out;
}

}  // namespace rtchat
