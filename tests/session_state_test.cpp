#include <catch2/catch_test_macros.hpp>

#include "rtchat/session/session_error.hpp"
#include "rtchat/session/session_state.hpp"

using namespace rtchat;

TEST_CASE("SessionState to_string", "[session][state]") {
    REQUIRE(to_string(state::Idle{}) == "Idle");
    REQUIRE(to_string(state::Connecting{2}) == "Connecting(2)");
    REQUIRE(to_string(state::Connected{}) == "Connected");
    REQUIRE(to_string(state::Disconnected{"timeout", 1}) == "Disconnected(timeout, 1)");
    REQUIRE(to_string(state::ConnectionFailed{"no credential"}) == "ConnectionFailed(no credential)");
}

TEST_CASE("SessionState status text", "[session][state]") {
    REQUIRE(status_text(state::Idle{}) == "Not connected");
    REQUIRE(status_text(state::Connecting{0}) == "Connecting to chat...");
    REQUIRE(status_text(state::Connecting{1}) == "Reconnecting to chat (attempt 2)...");
    REQUIRE(status_text(state::Connected{}) == "Connected");
    REQUIRE(status_text(state::Disconnected{"x", 0}) == "Disconnected. Messages won't send until reconnected.");
    REQUIRE(status_text(state::ConnectionFailed{"x"}) == "Connection lost. Please refresh the page to reconnect.");
}

TEST_CASE("Status text for precondition failures names the cause", "[session][state]") {
    using Code = ConnectionError::Code;

    REQUIRE(status_text(state::ConnectionFailed{"no credential", Code::MissingCredential}) ==
            "Authentication error. Please log in again.");
    REQUIRE(status_text(state::ConnectionFailed{"missing conversation id", Code::MissingConversation}) ==
            "Configuration error. Please refresh the page.");
    REQUIRE(status_text(state::ConnectionFailed{"bad url", Code::InvalidEndpoint}) ==
            "Configuration error. Please refresh the page.");
    REQUIRE(status_text(state::ConnectionFailed{"transport unavailable", Code::TransportUnavailable}) ==
            "Realtime connections are not supported here.");
}

TEST_CASE("SessionState predicates", "[session][state]") {
    SessionState s = state::Connecting{3};

    REQUIRE(holds<state::Connecting>(s));
    REQUIRE_FALSE(holds<state::Connected>(s));
    REQUIRE_FALSE(is_terminal(s));
    REQUIRE_FALSE(is_failed(s));

    s = state::Connected{};
    REQUIRE_FALSE(is_terminal(s));

    s = state::Idle{};
    REQUIRE(is_terminal(s));
    REQUIRE_FALSE(is_failed(s));

    s = state::ConnectionFailed{"gone"};
    REQUIRE(is_terminal(s));
    REQUIRE(is_failed(s));
    REQUIRE(s == SessionState{state::ConnectionFailed{"gone"}});
    REQUIRE_FALSE(s == SessionState{state::ConnectionFailed{"other"}});
    REQUIRE_FALSE(s == SessionState{state::ConnectionFailed{"gone", ConnectionError::Code::MissingCredential}});
}

TEST_CASE("Session error factories", "[session][error]") {
    const auto not_ready = SessionError::not_ready("Idle");
    REQUIRE(not_ready.code == SessionError::Code::NotReady);
    REQUIRE(not_ready.message.find("Idle") != std::string::npos);

    REQUIRE(SessionError::empty_message().code == SessionError::Code::EmptyMessage);
    REQUIRE(HistoryError::not_found("42").message.find("42") != std::string::npos);
    REQUIRE(HistoryError::already_live().code == HistoryError::Code::AlreadyLive);
}
