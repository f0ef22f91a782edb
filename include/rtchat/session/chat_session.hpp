#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ChatSession
// ═══════════════════════════════════════════════════════════════════════════
// One realtime conversation: owns the connection of the current attempt,
// reconnects with backoff, routes inbound frames, and frames outbound text.
//
// Usage:
//   asio::io_context io;
//   ChatSession session(io.get_executor(), config, {
//       .connector = std::make_shared<WebSocketConnector>(),
//       .credentials = std::make_shared<EnvCredentialStore>(),
//   });
//   session.on_message([](const ChatMessage& m) { ... });
//   session.start();
//   io.run();
//
// Threading:
//   - every public method is thread-safe
//   - timers run on the executor passed to the constructor; transport
//     events arrive on the connector's thread; both serialize on one mutex
//   - callbacks are delivered on a strand of that executor, in the order the
//     underlying changes happened, with no session lock held; they may call
//     back into the session

#include "rtchat/protocol/chat_types.hpp"
#include "rtchat/session/chat_session_config.hpp"
#include "rtchat/session/collaborators.hpp"
#include "rtchat/session/message_stream.hpp"
#include "rtchat/session/session_error.hpp"
#include "rtchat/session/session_state.hpp"
#include "rtchat/transport/connection.hpp"

#include <asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rtchat {

struct ChatSessionDeps {
    std::shared_ptr<IConnector> connector;
    std::shared_ptr<ICredentialStore> credentials;
    std::shared_ptr<IHistorySource> history;       // Optional
    std::shared_ptr<IGroupDirectory> groups;       // Optional
    std::shared_ptr<IMessageCache> cache;          // NullMessageCache when empty
};

/// Shown to the user once reconnection gives up.
inline constexpr std::string_view kConnectionLostMessage =
    "Connection lost. Please refresh the page to reconnect.";

class ChatSession {
public:
    using StateCallback = std::function<void(const SessionState&)>;
    using MessageCallback = std::function<void(const ChatMessage&)>;
    using PresenceCallback = std::function<void(const TypingPresence&)>;
    using FatalErrorCallback = std::function<void(const std::string&)>;

    ChatSession(asio::any_io_executor executor, ChatSessionConfig config, ChatSessionDeps deps);

    /// Stops the session.
    ~ChatSession();

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;
    ChatSession(ChatSession&&) = delete;
    ChatSession& operator=(ChatSession&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Idle or ConnectionFailed → Connecting(0), or straight to
    /// ConnectionFailed when a precondition is missing. No-op while active.
    void start();

    /// Any state → Idle. Closes the connection with 1000 "client stopping"
    /// and cancels every timer. Idempotent.
    void stop();

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound
    // ─────────────────────────────────────────────────────────────────────────

    /// Send chat text. On success returns the provisional record; the
    /// confirmed message arrives later through on_message when the backend
    /// echoes it. The provisional record is not added to messages().
    [[nodiscard]] SessionResult<ChatMessage> submit_text(std::string_view text);

    /// One keystroke-equivalent of local typing activity.
    void note_local_typing();

    /// Input-changed hook: whitespace-only input does not count as typing.
    void note_local_input(std::string_view current_input);

    // ─────────────────────────────────────────────────────────────────────────
    // History and metadata
    // ─────────────────────────────────────────────────────────────────────────

    /// Seed messages() with stored history. Blocks on the history source;
    /// call before start() or from a worker thread. Returns the count seeded.
    [[nodiscard]] HistoryResult<std::size_t> load_history();

    /// Conversation header title (group name or the other member's name).
    [[nodiscard]] HistoryResult<std::string> conversation_title();

    // ─────────────────────────────────────────────────────────────────────────
    // Observation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] TypingPresence presence() const;
    [[nodiscard]] std::optional<std::string> last_error() const;
    [[nodiscard]] const MessageStream& messages() const noexcept;
    [[nodiscard]] const ChatSessionConfig& config() const noexcept;

    void on_state_change(StateCallback callback);
    void on_message(MessageCallback callback);
    void on_presence_change(PresenceCallback callback);
    void on_fatal_error(FatalErrorCallback callback);

private:
    class Core;
    std::shared_ptr<Core> core_;
};

}  // namespace rtchat
