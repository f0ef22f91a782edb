#include "rtchat/session/typing_presence.hpp"

#include "rtchat/log/logger.hpp"

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// TypingDebouncer
// ─────────────────────────────────────────────────────────────────────────────

TypingDebouncer::TypingDebouncer(
    asio::any_io_executor executor,
    const SessionTimer::Guard& guard,
    std::chrono::milliseconds debounce,
    std::chrono::milliseconds stop_after,
    CanSend can_send,
    SendTyping send
)
    : debounce_timer_(executor, "typing-debounce", guard)
    , stop_timer_(executor, "typing-stop", guard)
    , debounce_(debounce)
    , stop_after_(stop_after)
    , can_send_(std::move(can_send))
    , send_(std::move(send))
{}

void TypingDebouncer::note_keystroke() {
    debounce_timer_.arm(debounce_, [this] { on_debounce_elapsed(); });
}

void TypingDebouncer::cancel() noexcept {
    debounce_timer_.cancel();
    stop_timer_.cancel();
}

void TypingDebouncer::on_debounce_elapsed() {
    if (can_send_() == false) {
        return;
    }
    send_(true);
    stop_timer_.arm(stop_after_, [this] { on_stop_elapsed(); });
}

void TypingDebouncer::on_stop_elapsed() {
    if (can_send_() == false) {
        return;
    }
    send_(false);
}

// ─────────────────────────────────────────────────────────────────────────────
// RemoteTypingTracker
// ─────────────────────────────────────────────────────────────────────────────

RemoteTypingTracker::RemoteTypingTracker(
    asio::any_io_executor executor,
    const SessionTimer::Guard& guard,
    std::chrono::milliseconds expiry,
    std::optional<std::string> local_participant_id,
    OnChange on_change
)
    : expiry_timer_(std::move(executor), "remote-typing-expiry", guard)
    , expiry_(expiry)
    , local_participant_id_(std::move(local_participant_id))
    , on_change_(std::move(on_change))
{}

void RemoteTypingTracker::on_signal(const TypingSignal& signal) {
    const bool from_self = local_participant_id_.has_value()
        && signal.user_id.has_value()
        && *signal.user_id == *local_participant_id_;
    if (from_self) {
        RTCHAT_LOG_TRACE("Ignoring echo of own typing signal");
        return;
    }

    if (signal.typing == false) {
        clear();
        return;
    }

    expiry_timer_.arm(expiry_, [this] { clear(); });
    update(TypingPresence{true, signal.user_id});
}

void RemoteTypingTracker::on_chat_message() {
    clear();
}

void RemoteTypingTracker::clear() {
    expiry_timer_.cancel();
    update(TypingPresence{});
}

void RemoteTypingTracker::reset() noexcept {
    expiry_timer_.cancel();
    presence_ = TypingPresence{};
}

void RemoteTypingTracker::update(TypingPresence next) {
    if (next == presence_) {
        return;
    }
    presence_ = std::move(next);
    if (on_change_) {
        on_change_(presence_);
    }
}

}  // namespace rtchat
