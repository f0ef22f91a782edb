#ifndef RTCHAT_SESSION_SESSION_ERROR_HPP
#define RTCHAT_SESSION_SESSION_ERROR_HPP

#include <string>

#include <tl/expected.hpp>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// SessionError - synchronous rejections of caller requests
// ─────────────────────────────────────────────────────────────────────────────

struct SessionError {
    enum class Code {
        NotReady,       // Session is not Connected
        EmptyMessage,   // Text is empty after trimming
        SendFailed      // Transport refused the frame
    };

    Code code;
    std::string message;

    static SessionError not_ready(const std::string& state) {
        return {Code::NotReady, "Session is not connected (state: " + state + ")"};
    }

    static SessionError empty_message() {
        return {Code::EmptyMessage, "Message is empty"};
    }

    static SessionError send_failed(const std::string& msg) {
        return {Code::SendFailed, msg};
    }
};

template <typename T>
using SessionResult = tl::expected<T, SessionError>;

// ─────────────────────────────────────────────────────────────────────────────
// HistoryError - failures of the history / group collaborators
// ─────────────────────────────────────────────────────────────────────────────

struct HistoryError {
    enum class Code {
        Unavailable,    // Backend could not be reached
        NotFound,       // Unknown conversation
        InvalidData,    // Response could not be decoded
        AlreadyLive     // Stream already holds live messages
    };

    Code code;
    std::string message;

    static HistoryError unavailable(const std::string& msg) {
        return {Code::Unavailable, msg};
    }

    static HistoryError not_found(const std::string& conversation_id) {
        return {Code::NotFound, "Conversation not found: " + conversation_id};
    }

    static HistoryError invalid_data(const std::string& msg) {
        return {Code::InvalidData, msg};
    }

    static HistoryError already_live() {
        return {Code::AlreadyLive, "History can only be seeded into an empty stream"};
    }
};

template <typename T>
using HistoryResult = tl::expected<T, HistoryError>;

}  // namespace rtchat

#endif  // RTCHAT_SESSION_SESSION_ERROR_HPP
