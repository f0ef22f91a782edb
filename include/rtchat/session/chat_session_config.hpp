#ifndef RTCHAT_SESSION_CHAT_SESSION_CONFIG_HPP
#define RTCHAT_SESSION_CHAT_SESSION_CONFIG_HPP

#include "rtchat/session/backoff_policy.hpp"
#include "rtchat/session/reconnect_policy.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// ChatSessionConfig
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   auto config = ChatSessionConfig{}
//       .with_endpoint("https://campus.example.edu")
//       .with_conversation("42")
//       .with_local_participant("7")
//       .with_max_attempts(3);

struct ChatSessionConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Target
    // ─────────────────────────────────────────────────────────────────────────

    std::string endpoint_base_url;
    std::optional<std::string> conversation_id;

    /// Used to drop echoes of our own typing signals and to stamp provisional
    /// messages.
    std::optional<std::string> local_participant_id;

    // ─────────────────────────────────────────────────────────────────────────
    // Typing presence
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds typing_debounce{300};
    std::chrono::milliseconds typing_stop_after{3'000};
    std::chrono::milliseconds remote_typing_expiry{3'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Reconnection
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds backoff_base{1'000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds backoff_max{10'000};
    double backoff_jitter = 0.0;

    /// Total connection attempts per start(), the first one included.
    std::size_t max_attempts = 5;

    /// Replaces the exponential parameters above when set.
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // Builders
    // ─────────────────────────────────────────────────────────────────────────

    ChatSessionConfig& with_endpoint(std::string url) {
        endpoint_base_url = std::move(url);
        return *this;
    }

    ChatSessionConfig& with_conversation(std::string id) {
        conversation_id = std::move(id);
        return *this;
    }

    ChatSessionConfig& with_local_participant(std::string id) {
        local_participant_id = std::move(id);
        return *this;
    }

    ChatSessionConfig& with_typing_timing(
        std::chrono::milliseconds debounce,
        std::chrono::milliseconds stop_after,
        std::chrono::milliseconds remote_expiry
    ) {
        typing_debounce = debounce;
        typing_stop_after = stop_after;
        remote_typing_expiry = remote_expiry;
        return *this;
    }

    ChatSessionConfig& with_backoff(
        std::chrono::milliseconds base,
        std::chrono::milliseconds max,
        double multiplier = 2.0,
        double jitter = 0.0
    ) {
        backoff_base = base;
        backoff_max = max;
        backoff_multiplier = multiplier;
        backoff_jitter = jitter;
        return *this;
    }

    ChatSessionConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
        backoff_policy = std::move(policy);
        return *this;
    }

    ChatSessionConfig& with_max_attempts(std::size_t attempts) {
        max_attempts = attempts;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Derived policies
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::shared_ptr<IBackoffPolicy> make_backoff_policy() const;
    [[nodiscard]] ReconnectPolicy make_reconnect_policy() const;
};

}  // namespace rtchat

#endif  // RTCHAT_SESSION_CHAT_SESSION_CONFIG_HPP
