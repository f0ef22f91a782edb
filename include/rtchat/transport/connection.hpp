#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Handle
// ═══════════════════════════════════════════════════════════════════════════
// One IConnection is one physical connection attempt. An IConnector opens
// them. Lifecycle is reported through an event sink:
//
//   open() ──▶ [ErrorOccurred]* ──▶ Opened ──▶ FrameReceived* ──▶ Closed
//          └─▶ [ErrorOccurred]* ─────────────────────────────────▶ Closed
//
// ErrorOccurred never terminates by itself; Closed always follows it.
// Closed is delivered at most once per handle.

#include "rtchat/transport/connection_error.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// Close codes (RFC 6455 §7.4.1)
// ─────────────────────────────────────────────────────────────────────────────

namespace close_code {
inline constexpr std::uint16_t kNormal = 1000;        // Intentional, suppresses reconnect
inline constexpr std::uint16_t kGoingAway = 1001;
inline constexpr std::uint16_t kProtocolError = 1002;
inline constexpr std::uint16_t kNoStatus = 1005;      // Close frame without a code
inline constexpr std::uint16_t kAbnormal = 1006;      // No close frame (network drop)
inline constexpr std::uint16_t kInternalError = 1011;
}  // namespace close_code

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionTarget
// ─────────────────────────────────────────────────────────────────────────────

struct ConnectionTarget {
    std::optional<std::string> conversation_id;
    /// e.g. "https://campus.example.edu"; https/wss select the secure scheme.
    std::string endpoint_base_url;
    std::optional<std::string> auth_token;
};

// ─────────────────────────────────────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────────────────────────────────────

struct Opened {};

struct FrameReceived {
    std::string text;
};

struct ErrorOccurred {
    std::string message;
};

struct Closed {
    std::uint16_t code = close_code::kAbnormal;
    std::string reason;
};

using ConnectionEvent = std::variant<Opened, FrameReceived, ErrorOccurred, Closed>;

/// Receives events for one handle, on the connector's I/O context.
using ConnectionEventSink = std::function<void(ConnectionEvent)>;

// ─────────────────────────────────────────────────────────────────────────────
// IConnection
// ─────────────────────────────────────────────────────────────────────────────

class IConnection {
public:
    virtual ~IConnection() = default;

    /// Queue one text frame. Fails with NotOpen unless the handle has
    /// reported Opened and has not begun closing. Success means the transport
    /// accepted the frame, not that the peer received it.
    [[nodiscard]] virtual ConnectionResult<void> send(std::string text) = 0;

    /// Begin closing. Idempotent; a no-op on closed or never-opened handles.
    virtual void close(std::uint16_t code, std::string reason) = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// IConnector
// ─────────────────────────────────────────────────────────────────────────────
// Contract for implementations:
//   - open() validates preconditions synchronously and returns them as
//     errors with is_precondition() == true, without touching the network
//   - network work is asynchronous; the sink is never invoked from inside
//     open(), send() or close()
//   - once the handle is destroyed no new sink invocation starts; one
//     already running on the I/O thread may still complete

class IConnector {
public:
    virtual ~IConnector() = default;

    /// False when this runtime cannot open connections at all.
    [[nodiscard]] virtual bool available() const noexcept = 0;

    [[nodiscard]] virtual ConnectionResult<std::unique_ptr<IConnection>> open(
        const ConnectionTarget& target,
        ConnectionEventSink sink
    ) = 0;
};

/// Token checks shared by connectors: absent, blank, or the stringified
/// "undefined"/"null" leftovers of a broken credential store all count as
/// missing.
[[nodiscard]] bool is_usable_token(const std::optional<std::string>& token) noexcept;

/// Run the precondition checks every connector must perform.
[[nodiscard]] ConnectionResult<void> check_preconditions(const ConnectionTarget& target);

}  // namespace rtchat
