#ifndef RTCHAT_PROTOCOL_FRAMES_HPP
#define RTCHAT_PROTOCOL_FRAMES_HPP

#include "rtchat/protocol/chat_types.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rtchat {

// ═══════════════════════════════════════════════════════════════════════════
// Wire frames
// ═══════════════════════════════════════════════════════════════════════════
// Every frame is one JSON text message.
//
//   outbound chat    {"content": "...", "group_id": 42}
//   inbound chat     {"id": 7, "sender": {...}, "content": "...", "created_at": "..."}
//   typing (both)    {"type": "typing", "typing": true, "group_id": 42}
//                    inbound typing also carries "user_id"

inline constexpr std::string_view kTypingFrameType = "typing";

struct FrameError {
    enum class Code {
        InvalidJson,     // Not parseable as JSON at all
        NotAnObject,     // Valid JSON but not an object
        InvalidField     // A recognised field has the wrong type
    };

    Code code;
    std::string message;

    static FrameError invalid_json(const std::string& msg) {
        return {Code::InvalidJson, msg};
    }
    static FrameError not_an_object() {
        return {Code::NotAnObject, "Frame is not a JSON object"};
    }
    static FrameError invalid_field(const std::string& msg) {
        return {Code::InvalidField, msg};
    }
};

template <typename T>
using FrameResult = tl::expected<T, FrameError>;

/// Remote typing start/stop.
struct TypingSignal {
    bool typing = false;
    std::optional<std::string> user_id;
};

/// Well-formed JSON that is neither typing nor chat (e.g. empty content).
struct IgnoredFrame {
    std::string reason;
};

using InboundFrame = std::variant<TypingSignal, ChatMessage, IgnoredFrame>;

/// Classify one inbound text frame.
[[nodiscard]] FrameResult<InboundFrame> parse_inbound_frame(std::string_view text);

/// group_id is sent as a number when the conversation id is all digits,
/// matching what the backend stores.
[[nodiscard]] Json conversation_id_to_json(std::string_view conversation_id);

[[nodiscard]] std::string make_chat_frame(std::string_view conversation_id, std::string_view content);

[[nodiscard]] std::string make_typing_frame(std::string_view conversation_id, bool typing);

}  // namespace rtchat

#endif  // RTCHAT_PROTOCOL_FRAMES_HPP
