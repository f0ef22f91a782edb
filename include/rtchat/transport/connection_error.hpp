#ifndef RTCHAT_TRANSPORT_CONNECTION_ERROR_HPP
#define RTCHAT_TRANSPORT_CONNECTION_ERROR_HPP

#include <string>

#include <tl/expected.hpp>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionError
// ─────────────────────────────────────────────────────────────────────────────
// Two families share this type:
//   - precondition failures, detected before any network call; retrying
//     cannot change their outcome
//   - runtime failures of an established or in-flight connection

struct ConnectionError {
    enum class Code {
        // Preconditions
        MissingCredential,     // No (usable) bearer token
        MissingConversation,   // No conversation id
        TransportUnavailable,  // No transport capability in this runtime
        InvalidEndpoint,       // Base URL unparseable or wrong scheme

        // Runtime
        ConnectFailed,         // Resolve / TCP / TLS / upgrade failed
        NotOpen,               // send() on a handle that is not open-ready
        SendFailed,            // Write was rejected by the transport
        Closed                 // Handle already closed
    };

    Code code;
    std::string message;

    [[nodiscard]] bool is_precondition() const noexcept {
        switch (code) {
            case Code::MissingCredential:
            case Code::MissingConversation:
            case Code::TransportUnavailable:
            case Code::InvalidEndpoint:
                return true;
            case Code::ConnectFailed:
            case Code::NotOpen:
            case Code::SendFailed:
            case Code::Closed:
                return false;
        }
        return false;
    }

    static ConnectionError missing_credential() {
        return {Code::MissingCredential, "no credential"};
    }

    static ConnectionError missing_conversation() {
        return {Code::MissingConversation, "missing conversation id"};
    }

    static ConnectionError transport_unavailable() {
        return {Code::TransportUnavailable, "transport unavailable"};
    }

    static ConnectionError invalid_endpoint(const std::string& msg) {
        return {Code::InvalidEndpoint, msg};
    }

    static ConnectionError connect_failed(const std::string& msg) {
        return {Code::ConnectFailed, msg};
    }

    static ConnectionError not_open() {
        return {Code::NotOpen, "connection is not open"};
    }

    static ConnectionError send_failed(const std::string& msg) {
        return {Code::SendFailed, msg};
    }

    static ConnectionError closed() {
        return {Code::Closed, "connection is closed"};
    }
};

template <typename T>
using ConnectionResult = tl::expected<T, ConnectionError>;

}  // namespace rtchat

#endif  // RTCHAT_TRANSPORT_CONNECTION_ERROR_HPP
