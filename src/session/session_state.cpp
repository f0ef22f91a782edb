#include "rtchat/session/session_state.hpp"

#include <format>

namespace rtchat {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string to_string(const SessionState& s) {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::string { return "Idle"; },
        [](const state::Connecting& c) -> std::string {
            return std::format("Connecting({})", c.attempt);
        },
        [](const state::Connected&) -> std::string { return "Connected"; },
        [](const state::Disconnected& d) -> std::string {
            return std::format("Disconnected({}, {})", d.reason, d.attempt);
        },
        [](const state::ConnectionFailed& f) -> std::string {
            return std::format("ConnectionFailed({})", f.reason);
        },
    }, s);
}

std::string status_text(const SessionState& s) {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::string { return "Not connected"; },
        [](const state::Connecting& c) -> std::string {
            if (c.attempt == 0) {
                return "Connecting to chat...";
            }
            return std::format("Reconnecting to chat (attempt {})...", c.attempt + 1);
        },
        [](const state::Connected&) -> std::string { return "Connected"; },
        [](const state::Disconnected&) -> std::string {
            return "Disconnected. Messages won't send until reconnected.";
        },
        [](const state::ConnectionFailed& f) -> std::string {
            if (!f.precondition) {
                return "Connection lost. Please refresh the page to reconnect.";
            }
            switch (*f.precondition) {
                case ConnectionError::Code::MissingCredential:
                    return "Authentication error. Please log in again.";
                case ConnectionError::Code::MissingConversation:
                case ConnectionError::Code::InvalidEndpoint:
                    return "Configuration error. Please refresh the page.";
                case ConnectionError::Code::TransportUnavailable:
                    return "Realtime connections are not supported here.";
                default:
                    return "Cannot establish connection. Please try again later.";
            }
        },
    }, s);
}

bool is_terminal(const SessionState& s) noexcept {
    return std::holds_alternative<state::Idle>(s) || std::holds_alternative<state::ConnectionFailed>(s);
}

bool is_failed(const SessionState& s) noexcept {
    return std::holds_alternative<state::ConnectionFailed>(s);
}

}  // namespace rtchat
