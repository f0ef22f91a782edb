#include "rtchat/session/chat_session.hpp"

#include "rtchat/log/logger.hpp"
#include "rtchat/protocol/frames.hpp"
#include "rtchat/session/session_timer.hpp"
#include "rtchat/session/typing_presence.hpp"

#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <format>
#include <mutex>
#include <vector>

namespace rtchat {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string trim(std::string_view text) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto first = std::find_if(text.begin(), text.end(), not_space);
    const auto last = std::find_if(text.rbegin(), text.rend(), not_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ChatSession::Core
// ═══════════════════════════════════════════════════════════════════════════
// Everything the session mutates lives here, behind mutex_. Transport sinks
// and timers hold a weak_ptr to the core, so a late completion after the
// session is gone is a no-op. Methods suffixed _locked expect mutex_ held.

class ChatSession::Core : public std::enable_shared_from_this<ChatSession::Core> {
public:
    Core(asio::any_io_executor executor, ChatSessionConfig config, ChatSessionDeps deps)
        : executor_(executor)
        , notify_strand_(asio::make_strand(executor))
        , config_(std::move(config))
        , deps_(std::move(deps))
        , backoff_(config_.make_backoff_policy())
        , reconnect_(config_.make_reconnect_policy())
    {
        if (!deps_.cache) {
            deps_.cache = std::make_shared<NullMessageCache>();
        }
    }

    /// Second construction phase; needs weak_from_this().
    void init() {
        const SessionTimer::Guard guard = [weak = weak_from_this()](const SessionTimer::Body& body) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            std::lock_guard<std::mutex> lock(self->mutex_);
            body();
        };

        reconnect_timer_ = std::make_unique<SessionTimer>(executor_, "reconnect", guard);

        debouncer_ = std::make_unique<TypingDebouncer>(
            executor_,
            guard,
            config_.typing_debounce,
            config_.typing_stop_after,
            [this] { return holds<state::Connected>(state_) && connection_ && connection_->is_open(); },
            [this](bool typing) { send_typing_locked(typing); }
        );

        remote_typing_ = std::make_unique<RemoteTypingTracker>(
            executor_,
            guard,
            config_.remote_typing_expiry,
            config_.local_participant_id,
            [this](const TypingPresence& presence) {
                notify_locked(presence_callbacks_, presence, "presence");
            }
        );
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool can_start = holds<state::Idle>(state_) || holds<state::ConnectionFailed>(state_);
        if (can_start == false) {
            RTCHAT_LOG_DEBUG(std::format("start() ignored in state {}", to_string(state_)));
            return;
        }
        ++epoch_;
        last_error_.reset();
        backoff_->reset();
        connect_locked(0);
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epoch_;
        reconnect_timer_->cancel();
        debouncer_->cancel();
        remote_typing_->reset();
        release_connection_locked(close_code::kNormal, "client stopping");
        if (stopped_) {
            // Only the previous stop()'s Idle can still be queued; keep it.
            return;
        }
        // Anything queued before this point is discarded at delivery.
        notify_epoch_->store(epoch_);
        if (holds<state::Idle>(state_) == false) {
            set_state_locked(state::Idle{});
        }
        stopped_ = true;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound
    // ─────────────────────────────────────────────────────────────────────────

    SessionResult<ChatMessage> submit_text(std::string_view text) {
        std::string content = trim(text);

        std::lock_guard<std::mutex> lock(mutex_);
        if (holds<state::Connected>(state_) == false || !connection_) {
            return tl::unexpected(SessionError::not_ready(to_string(state_)));
        }
        if (content.empty()) {
            return tl::unexpected(SessionError::empty_message());
        }

        debouncer_->cancel();
        send_typing_locked(false);

        auto sent = connection_->send(make_chat_frame(*config_.conversation_id, content));
        if (!sent) {
            RTCHAT_LOG_WARN(std::format("Chat frame rejected: {}", sent.error().message));
            return tl::unexpected(SessionError::send_failed(sent.error().message));
        }

        const auto now = std::chrono::system_clock::now();
        ChatMessage provisional;
        provisional.sender.id = config_.local_participant_id.value_or("");
        provisional.content = std::move(content);
        provisional.created_at = now;
        provisional.created_at_raw = std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(now));
        provisional.provisional = true;
        return provisional;
    }

    void note_local_typing() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (holds<state::Idle>(state_) || holds<state::ConnectionFailed>(state_)) {
            return;
        }
        debouncer_->note_keystroke();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // History and metadata (no session lock; collaborators may block)
    // ─────────────────────────────────────────────────────────────────────────

    HistoryResult<std::size_t> load_history() {
        if (!config_.conversation_id) {
            return tl::unexpected(HistoryError::unavailable("No conversation id configured"));
        }
        const std::string& conversation = *config_.conversation_id;

        std::vector<ChatMessage> history;
        if (auto cached = deps_.cache->load(conversation)) {
            RTCHAT_LOG_DEBUG(std::format("History for {} served from cache", conversation));
            history = std::move(*cached);
        } else {
            if (!deps_.history) {
                return tl::unexpected(HistoryError::unavailable("No history source configured"));
            }
            auto fetched = deps_.history->fetch_history(conversation);
            if (!fetched) {
                RTCHAT_LOG_WARN(std::format("History fetch failed: {}", fetched.error().message));
                return tl::unexpected(fetched.error());
            }
            history = std::move(*fetched);
            deps_.cache->store(conversation, history);
        }
        return stream_.seed(std::move(history));
    }

    HistoryResult<std::string> conversation_title() {
        if (!config_.conversation_id) {
            return tl::unexpected(HistoryError::unavailable("No conversation id configured"));
        }
        if (!deps_.groups) {
            return tl::unexpected(HistoryError::unavailable("No group directory configured"));
        }
        auto group = deps_.groups->fetch_group(*config_.conversation_id);
        if (!group) {
            return tl::unexpected(group.error());
        }
        return group->display_name(config_.local_participant_id.value_or(""));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Observation
    // ─────────────────────────────────────────────────────────────────────────

    SessionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    TypingPresence presence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return remote_typing_->presence();
    }

    std::optional<std::string> last_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    template <typename Callback>
    void add_callback(std::vector<Callback>& list, Callback callback) {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        list.push_back(std::move(callback));
    }

    void add_state_callback(StateCallback cb) { add_callback(state_callbacks_, std::move(cb)); }
    void add_message_callback(MessageCallback cb) { add_callback(message_callbacks_, std::move(cb)); }
    void add_presence_callback(PresenceCallback cb) { add_callback(presence_callbacks_, std::move(cb)); }
    void add_fatal_callback(FatalErrorCallback cb) { add_callback(fatal_callbacks_, std::move(cb)); }

    [[nodiscard]] const MessageStream& stream() const noexcept { return stream_; }
    [[nodiscard]] const ChatSessionConfig& config() const noexcept { return config_; }

private:
    // ─────────────────────────────────────────────────────────────────────────
    // Connection attempts
    // ─────────────────────────────────────────────────────────────────────────

    void connect_locked(std::size_t attempt) {
        release_connection_locked(close_code::kNormal, "reconnecting");

        if (!deps_.connector || deps_.connector->available() == false) {
            const auto unavailable = ConnectionError::transport_unavailable();
            fail_locked(unavailable.message, unavailable.message, unavailable.code);
            return;
        }

        ConnectionTarget target;
        target.conversation_id = config_.conversation_id;
        target.endpoint_base_url = config_.endpoint_base_url;
        if (deps_.credentials) {
            target.auth_token = deps_.credentials->get_auth_token();
        }

        auto checked = check_preconditions(target);
        if (!checked) {
            RTCHAT_LOG_ERROR(std::format("Cannot connect: {}", checked.error().message));
            fail_locked(checked.error().message, checked.error().message, checked.error().code);
            return;
        }

        set_state_locked(state::Connecting{attempt});
        opened_ = false;
        const std::uint64_t serial = ++connection_serial_;

        ConnectionEventSink sink = [weak = weak_from_this(), serial](ConnectionEvent event) {
            if (auto self = weak.lock()) {
                self->handle_event(serial, std::move(event));
            }
        };

        ConnectionResult<std::unique_ptr<IConnection>> opened =
            tl::unexpected(ConnectionError::connect_failed("not attempted"));
        try {
            opened = deps_.connector->open(target, std::move(sink));
        } catch (const std::exception& e) {
            opened = tl::unexpected(ConnectionError::connect_failed(e.what()));
        }

        if (!opened) {
            const ConnectionError& error = opened.error();
            if (reconnect_.is_retryable(error)) {
                end_attempt_locked(error.message);
            } else {
                RTCHAT_LOG_ERROR(std::format("Cannot connect: {}", error.message));
                fail_locked(error.message, error.message, error.code);
            }
            return;
        }
        connection_ = std::move(*opened);
    }

    /// Current attempt failed: go to Disconnected and schedule the next one,
    /// or give up.
    void end_attempt_locked(const std::string& reason) {
        const std::size_t attempt = current_attempt_locked();

        release_connection_locked(close_code::kNormal, "attempt abandoned");
        debouncer_->cancel();
        remote_typing_->clear();
        last_error_ = reason;
        set_state_locked(state::Disconnected{reason, attempt});

        if (reconnect_.should_retry(attempt) == false) {
            RTCHAT_LOG_ERROR(std::format("Giving up after {} attempts: {}", attempt + 1, reason));
            fail_locked(reason, std::string(kConnectionLostMessage));
            return;
        }

        const auto delay = backoff_->next_delay(attempt);
        RTCHAT_LOG_INFO(std::format("Disconnected ({}); reconnecting in {}ms", reason, delay.count()));

        const std::uint64_t epoch = epoch_;
        reconnect_timer_->arm(delay, [this, attempt, epoch] {
            if (epoch != epoch_ || holds<state::Disconnected>(state_) == false) {
                return;
            }
            connect_locked(attempt + 1);
        });
    }

    void fail_locked(const std::string& reason, const std::string& user_message,
                     std::optional<ConnectionError::Code> precondition = std::nullopt) {
        reconnect_timer_->cancel();
        debouncer_->cancel();
        remote_typing_->clear();
        release_connection_locked(close_code::kNormal, "connection failed");
        last_error_ = reason;
        set_state_locked(state::ConnectionFailed{reason, precondition});
        notify_locked(fatal_callbacks_, user_message, "fatal error");
    }

    void release_connection_locked(std::uint16_t code, const std::string& reason) {
        if (!connection_) {
            return;
        }
        auto connection = std::move(connection_);
        connection->close(code, reason);
    }

    std::size_t current_attempt_locked() const {
        if (const auto* connecting = std::get_if<state::Connecting>(&state_)) {
            return connecting->attempt;
        }
        if (const auto* disconnected = std::get_if<state::Disconnected>(&state_)) {
            return disconnected->attempt;
        }
        return 0;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Transport events
    // ─────────────────────────────────────────────────────────────────────────

    void handle_event(std::uint64_t serial, ConnectionEvent event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (serial != connection_serial_ || !connection_) {
            RTCHAT_LOG_TRACE("Ignoring event from a superseded connection");
            return;
        }
        try {
            std::visit([this](auto& ev) { on_event_locked(ev); }, event);
        } catch (const std::exception& e) {
            RTCHAT_LOG_ERROR(std::format("Connection event handling failed: {}", e.what()));
        }
    }

    void on_event_locked(Opened& /*ev*/) {
        if (holds<state::Connecting>(state_) == false) {
            return;
        }
        opened_ = true;
        backoff_->reset();
        last_error_.reset();
        RTCHAT_LOG_INFO("Chat connection established");
        set_state_locked(state::Connected{});
    }

    void on_event_locked(FrameReceived& ev) {
        if (holds<state::Connected>(state_) == false) {
            RTCHAT_LOG_TRACE("Dropping frame received outside Connected");
            return;
        }
        route_frame_locked(ev.text);
    }

    void on_event_locked(ErrorOccurred& ev) {
        RTCHAT_LOG_WARN(std::format("Connection error: {}", ev.message));
        last_error_ = ev.message;
        if (holds<state::Connecting>(state_) && reconnect_.error_ends_attempt(opened_)) {
            end_attempt_locked(ev.message);
        }
    }

    void on_event_locked(Closed& ev) {
        connection_.reset();

        const bool active = holds<state::Connected>(state_) || holds<state::Connecting>(state_);
        if (active == false) {
            return;
        }

        if (reconnect_.should_reconnect_after_close(ev.code) == false) {
            RTCHAT_LOG_INFO("Chat connection closed normally");
            debouncer_->cancel();
            remote_typing_->clear();
            set_state_locked(state::Idle{});
            return;
        }

        std::string reason = ev.reason.empty()
            ? std::format("connection closed (code {})", ev.code)
            : ev.reason;
        end_attempt_locked(reason);
    }

    void route_frame_locked(const std::string& text) {
        auto parsed = parse_inbound_frame(text);
        if (!parsed) {
            RTCHAT_LOG_WARN(std::format("Dropping malformed frame: {}", parsed.error().message));
            return;
        }

        std::visit(overloaded{
            [this](TypingSignal& signal) {
                remote_typing_->on_signal(signal);
            },
            [this](ChatMessage& message) {
                stream_.append(message);
                notify_locked(message_callbacks_, message, "message");
                remote_typing_->on_chat_message();
            },
            [](IgnoredFrame& ignored) {
                RTCHAT_LOG_DEBUG(std::format("Ignoring frame: {}", ignored.reason));
            },
        }, *parsed);
    }

    void send_typing_locked(bool typing) {
        if (!connection_ || !config_.conversation_id) {
            return;
        }
        auto sent = connection_->send(make_typing_frame(*config_.conversation_id, typing));
        if (!sent) {
            RTCHAT_LOG_DEBUG(std::format("Typing frame not sent: {}", sent.error().message));
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Notifications
    // ─────────────────────────────────────────────────────────────────────────

    void set_state_locked(SessionState next) {
        stopped_ = false;
        RTCHAT_LOG_DEBUG(std::format("Session state: {} -> {}", to_string(state_), to_string(next)));
        state_ = std::move(next);
        notify_locked(state_callbacks_, state_, "state");
    }

    /// Queue `value` for every registered callback on the notification strand.
    /// Posting under mutex_ keeps notifications in mutation order. Each one is
    /// stamped with the stop generation and dropped if stop() ran since.
    template <typename Callback, typename Value>
    void notify_locked(const std::vector<Callback>& list, Value value, const char* what) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = list;
        }
        if (callbacks.empty()) {
            return;
        }
        const std::uint64_t stamp = notify_epoch_->load();
        asio::post(notify_strand_, [callbacks = std::move(callbacks), value = std::move(value), what,
                                    current = notify_epoch_, stamp] {
            if (current->load() != stamp) {
                RTCHAT_LOG_TRACE(std::format("Dropping {} notification queued before stop()", what));
                return;
            }
            for (const auto& callback : callbacks) {
                try {
                    callback(value);
                } catch (const std::exception& e) {
                    RTCHAT_LOG_ERROR(std::format("{} callback threw: {}", what, e.what()));
                }
            }
        });
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Data
    // ─────────────────────────────────────────────────────────────────────────

    const asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> notify_strand_;
    const ChatSessionConfig config_;
    ChatSessionDeps deps_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    const ReconnectPolicy reconnect_;
    MessageStream stream_;

    mutable std::mutex mutex_;
    SessionState state_ = state::Idle{};
    std::optional<std::string> last_error_;
    std::unique_ptr<IConnection> connection_;
    bool opened_ = false;
    std::uint64_t epoch_ = 0;
    // No transition since the last stop().
    bool stopped_ = false;
    // Last epoch set by stop(); shared with queued notifications.
    std::shared_ptr<std::atomic<std::uint64_t>> notify_epoch_ =
        std::make_shared<std::atomic<std::uint64_t>>(0);
    std::uint64_t connection_serial_ = 0;
    std::unique_ptr<SessionTimer> reconnect_timer_;
    std::unique_ptr<TypingDebouncer> debouncer_;
    std::unique_ptr<RemoteTypingTracker> remote_typing_;

    std::mutex callbacks_mutex_;
    std::vector<StateCallback> state_callbacks_;
    std::vector<MessageCallback> message_callbacks_;
    std::vector<PresenceCallback> presence_callbacks_;
    std::vector<FatalErrorCallback> fatal_callbacks_;
};

// ═══════════════════════════════════════════════════════════════════════════
// ChatSession
// ═══════════════════════════════════════════════════════════════════════════

ChatSession::ChatSession(asio::any_io_executor executor, ChatSessionConfig config, ChatSessionDeps deps)
    : core_(std::make_shared<Core>(std::move(executor), std::move(config), std::move(deps)))
{
    core_->init();
}

ChatSession::~ChatSession() {
    core_->stop();
}

void ChatSession::start() {
    core_->start();
}

void ChatSession::stop() {
    core_->stop();
}

SessionResult<ChatMessage> ChatSession::submit_text(std::string_view text) {
    return core_->submit_text(text);
}

void ChatSession::note_local_typing() {
    core_->note_local_typing();
}

void ChatSession::note_local_input(std::string_view current_input) {
    if (trim(current_input).empty()) {
        return;
    }
    core_->note_local_typing();
}

HistoryResult<std::size_t> ChatSession::load_history() {
    return core_->load_history();
}

HistoryResult<std::string> ChatSession::conversation_title() {
    return core_->conversation_title();
}

SessionState ChatSession::state() const {
    return core_->state();
}

TypingPresence ChatSession::presence() const {
    return core_->presence();
}

std::optional<std::string> ChatSession::last_error() const {
    return core_->last_error();
}

const MessageStream& ChatSession::messages() const noexcept {
    return core_->stream();
}

const ChatSessionConfig& ChatSession::config() const noexcept {
    return core_->config();
}

void ChatSession::on_state_change(StateCallback callback) {
    core_->add_state_callback(std::move(callback));
}

void ChatSession::on_message(MessageCallback callback) {
    core_->add_message_callback(std::move(callback));
}

void ChatSession::on_presence_change(PresenceCallback callback) {
    core_->add_presence_callback(std::move(callback));
}

void ChatSession::on_fatal_error(FatalErrorCallback callback) {
    core_->add_fatal_callback(std::move(callback));
}

}  // namespace rtchat
