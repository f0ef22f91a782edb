#pragma once

#include "rtchat/transport/connection_error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace rtchat {

// ═══════════════════════════════════════════════════════════════════════════
// SessionState
// ═══════════════════════════════════════════════════════════════════════════
//
//   Idle ──start──▶ Connecting(0) ──Opened──▶ Connected
//                        │                       │
//                        ▼ close≠1000 / error     ▼ close≠1000
//                 Disconnected(reason, n) ◀───────┘
//                        │ after delay(n)
//                        ▼
//                 Connecting(n+1)  or  ConnectionFailed(reason) when exhausted
//
// Connected ──close=1000──▶ Idle; any state ──stop──▶ Idle.

namespace state {

struct Idle {
    bool operator==(const Idle&) const = default;
};

struct Connecting {
    std::size_t attempt = 0;
    bool operator==(const Connecting&) const = default;
};

struct Connected {
    bool operator==(const Connected&) const = default;
};

struct Disconnected {
    std::string reason;
    std::size_t attempt = 0;
    bool operator==(const Disconnected&) const = default;
};

struct ConnectionFailed {
    std::string reason;
    // Set when the session never got as far as the network.
    std::optional<ConnectionError::Code> precondition;
    bool operator==(const ConnectionFailed&) const = default;
};

}  // namespace state

using SessionState = std::variant<
    state::Idle,
    state::Connecting,
    state::Connected,
    state::Disconnected,
    state::ConnectionFailed
>;

template <typename S>
[[nodiscard]] bool holds(const SessionState& s) noexcept {
    return std::holds_alternative<S>(s);
}

/// "Idle", "Connecting(2)", "Disconnected(timeout, 1)", ...
[[nodiscard]] std::string to_string(const SessionState& s);

/// Short user-facing connection status line.
[[nodiscard]] std::string status_text(const SessionState& s);

/// Idle or ConnectionFailed: nothing happens until the caller acts.
[[nodiscard]] bool is_terminal(const SessionState& s) noexcept;

/// True only for ConnectionFailed.
[[nodiscard]] bool is_failed(const SessionState& s) noexcept;

}  // namespace rtchat
