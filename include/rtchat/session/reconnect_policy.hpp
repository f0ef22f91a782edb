#ifndef RTCHAT_SESSION_RECONNECT_POLICY_HPP
#define RTCHAT_SESSION_RECONNECT_POLICY_HPP

#include "rtchat/transport/connection.hpp"

#include <cstddef>
#include <cstdint>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides *whether* the session reconnects; IBackoffPolicy decides how long
// it waits first.
//
// Defaults:
// - at most 5 connection attempts per start() (the first one included)
// - a close with code 1000 is intentional and never reconnects
// - an error reported before the socket opened counts as a failed attempt
// - precondition errors (credential, conversation, transport) are terminal
//
// Usage:
//   ReconnectPolicy policy;
//   policy.with_max_attempts(3);
//   if (policy.should_retry(attempt)) { schedule(backoff->next_delay(attempt)); }

class ReconnectPolicy {
public:
    ReconnectPolicy() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    /// Total attempts allowed, including the first.
    ReconnectPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = attempts;
        return *this;
    }

    /// When false, an error before Opened is only logged and the session
    /// waits for the transport's Closed event instead.
    ReconnectPolicy& with_disconnect_on_establishment_error(bool enable) {
        disconnect_on_establishment_error_ = enable;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return max_attempts_;
    }

    /// attempt: 0-indexed attempt that just failed.
    [[nodiscard]] bool should_retry(std::size_t attempt) const noexcept {
        return (attempt + 1) < max_attempts_;
    }

    [[nodiscard]] bool should_reconnect_after_close(std::uint16_t code) const noexcept {
        return code != close_code::kNormal;
    }

    [[nodiscard]] bool is_retryable(const ConnectionError& error) const noexcept {
        return error.is_precondition() == false;
    }

    /// Whether an ErrorOccurred event ends the current attempt.
    [[nodiscard]] bool error_ends_attempt(bool opened) const noexcept {
        return opened == false && disconnect_on_establishment_error_;
    }

private:
    std::size_t max_attempts_ = 5;
    bool disconnect_on_establishment_error_ = true;
};

}  // namespace rtchat

#endif  // RTCHAT_SESSION_RECONNECT_POLICY_HPP
