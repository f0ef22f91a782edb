#ifndef RTCHAT_TRANSPORT_ENDPOINT_HPP
#define RTCHAT_TRANSPORT_ENDPOINT_HPP

#include "rtchat/transport/connection_error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// SocketEndpoint
// ─────────────────────────────────────────────────────────────────────────────
// Decomposed socket URL:
//   {scheme}://{host}[:{port}]/ws/messages/{conversation}/?token={token}
// Only the host of the base URL is used; any path on it is discarded.

struct SocketEndpoint {
    bool secure = false;
    std::string host;         // Hostname without port
    std::uint16_t port = 0;   // Explicit or scheme default
    std::string target;       // Path and query, e.g. "/ws/messages/42/?token=..."

    [[nodiscard]] std::string scheme() const { return secure ? "wss" : "ws"; }

    /// Host header value; the port is omitted when it is the scheme default.
    [[nodiscard]] std::string host_header() const;

    /// Full URL. Contains the credential, never log it.
    [[nodiscard]] std::string url() const;

    /// Full URL with the token value replaced by "***".
    [[nodiscard]] std::string redacted_url() const;
};

/// Build the socket endpoint. The base URL may use http, https, ws or wss;
/// https and wss select the secure scheme.
[[nodiscard]] ConnectionResult<SocketEndpoint> build_socket_endpoint(
    std::string_view endpoint_base_url,
    std::string_view conversation_id,
    std::string_view auth_token
);

/// Percent-encode with the encodeURIComponent unreserved set
/// (A-Z a-z 0-9 - _ . ! ~ * ' ( )). Input is treated as UTF-8 bytes.
[[nodiscard]] std::string percent_encode(std::string_view text);

/// Replace the value of every token= query parameter with "***".
[[nodiscard]] std::string redact_token(std::string_view url);

}  // namespace rtchat

#endif  // RTCHAT_TRANSPORT_ENDPOINT_HPP
