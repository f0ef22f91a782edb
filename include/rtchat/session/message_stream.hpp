#ifndef RTCHAT_SESSION_MESSAGE_STREAM_HPP
#define RTCHAT_SESSION_MESSAGE_STREAM_HPP

#include "rtchat/protocol/chat_types.hpp"
#include "rtchat/session/session_error.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace rtchat {

/// Messages sharing one UTC calendar date.
struct DateGroup {
    std::string date;  // "YYYY-MM-DD", or "" when the timestamp is unknown
    std::vector<ChatMessage> messages;
};

// ─────────────────────────────────────────────────────────────────────────────
// MessageStream
// ─────────────────────────────────────────────────────────────────────────────
// Append-only, arrival-ordered record of a conversation. Readers never see
// a message removed or reordered, so any index they remember stays valid.
// Thread-safe.

class MessageStream {
public:
    MessageStream() = default;

    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;

    void append(ChatMessage message);

    /// Place history ahead of live traffic. Fails unless the stream is empty.
    [[nodiscard]] HistoryResult<std::size_t> seed(std::vector<ChatMessage> history);

    [[nodiscard]] std::vector<ChatMessage> snapshot() const;

    /// Messages at positions [index, size()). Empty when index >= size().
    [[nodiscard]] std::vector<ChatMessage> read_from(std::size_t index) const;

    /// Visit every message in order. The callback must not touch this stream.
    void for_each(const std::function<void(const ChatMessage&)>& fn) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    [[nodiscard]] std::vector<DateGroup> group_by_date() const;

private:
    mutable std::mutex mutex_;
    std::vector<ChatMessage> messages_;
};

/// Group in first-appearance order of each date.
[[nodiscard]] std::vector<DateGroup> group_by_date(const std::vector<ChatMessage>& messages);

}  // namespace rtchat

#endif  // RTCHAT_SESSION_MESSAGE_STREAM_HPP
