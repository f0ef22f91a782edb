#ifndef RTCHAT_SESSION_TYPING_PRESENCE_HPP
#define RTCHAT_SESSION_TYPING_PRESENCE_HPP

#include "rtchat/protocol/chat_types.hpp"
#include "rtchat/protocol/frames.hpp"
#include "rtchat/session/session_timer.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace rtchat {

// ═══════════════════════════════════════════════════════════════════════════
// TypingDebouncer - local keystrokes to outbound typing frames
// ═══════════════════════════════════════════════════════════════════════════
//
//   keystroke ─▶ (re)arm debounce ──fires──▶ send typing:true
//                                             └─▶ arm stop ──fires──▶ send typing:false
//
// A burst of keystrokes closer together than the debounce window produces a
// single typing:true once the burst pauses.
//
// Not thread-safe on its own: every call, and every timer body, runs under
// the owning session's lock.

class TypingDebouncer {
public:
    /// Returns false when a frame cannot be sent right now.
    using CanSend = std::function<bool()>;
    using SendTyping = std::function<void(bool typing)>;

    TypingDebouncer(
        asio::any_io_executor executor,
        const SessionTimer::Guard& guard,
        std::chrono::milliseconds debounce,
        std::chrono::milliseconds stop_after,
        CanSend can_send,
        SendTyping send
    );

    void note_keystroke();

    /// Drop both pending timers without sending anything.
    void cancel() noexcept;

    [[nodiscard]] bool debounce_pending() const noexcept { return debounce_timer_.armed(); }
    [[nodiscard]] bool stop_pending() const noexcept { return stop_timer_.armed(); }

private:
    void on_debounce_elapsed();
    void on_stop_elapsed();

    SessionTimer debounce_timer_;
    SessionTimer stop_timer_;
    std::chrono::milliseconds debounce_;
    std::chrono::milliseconds stop_after_;
    CanSend can_send_;
    SendTyping send_;
};

// ═══════════════════════════════════════════════════════════════════════════
// RemoteTypingTracker - inbound typing signals to TypingPresence
// ═══════════════════════════════════════════════════════════════════════════
// remote_is_typing turns true on a start signal and false on a stop signal,
// on any chat message, or when the expiry timer runs out. on_change fires
// only when the presence actually changes. Same locking rule as above.

class RemoteTypingTracker {
public:
    using OnChange = std::function<void(const TypingPresence&)>;

    RemoteTypingTracker(
        asio::any_io_executor executor,
        const SessionTimer::Guard& guard,
        std::chrono::milliseconds expiry,
        std::optional<std::string> local_participant_id,
        OnChange on_change
    );

    /// Signals that carry the local participant's id are ignored.
    void on_signal(const TypingSignal& signal);

    void on_chat_message();

    /// Clear immediately and notify if it was set.
    void clear();

    /// Clear without notifying.
    void reset() noexcept;

    [[nodiscard]] const TypingPresence& presence() const noexcept { return presence_; }

private:
    void update(TypingPresence next);

    SessionTimer expiry_timer_;
    std::chrono::milliseconds expiry_;
    std::optional<std::string> local_participant_id_;
    OnChange on_change_;
    TypingPresence presence_;
};

}  // namespace rtchat

#endif  // RTCHAT_SESSION_TYPING_PRESENCE_HPP
