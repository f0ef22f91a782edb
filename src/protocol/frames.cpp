#include "rtchat/protocol/frames.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rtchat {

namespace {

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

FrameResult<InboundFrame> parse_typing(const Json& j) {
    TypingSignal signal;
    if (j.contains("typing")) {
        const auto& typing = j.at("typing");
        if (typing.is_boolean() == false) {
            return tl::unexpected(FrameError::invalid_field("'typing' must be a boolean"));
        }
        signal.typing = typing.get<bool>();
    }
    if (j.contains("user_id")) {
        auto user = id_to_string(j.at("user_id"));
        if (!user.empty()) {
            signal.user_id = std::move(user);
        }
    }
    return InboundFrame{std::move(signal)};
}

}  // namespace

FrameResult<InboundFrame> parse_inbound_frame(std::string_view text) {
    Json j = Json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return tl::unexpected(FrameError::invalid_json("Frame is not valid JSON"));
    }
    if (j.is_object() == false) {
        return tl::unexpected(FrameError::not_an_object());
    }

    const auto type_it = j.find("type");
    const bool is_typing = (type_it != j.end())
        && type_it->is_string()
        && (type_it->get<std::string>() == kTypingFrameType);
    if (is_typing) {
        return parse_typing(j);
    }

    const auto content_it = j.find("content");
    if (content_it == j.end() || content_it->is_null()) {
        return InboundFrame{IgnoredFrame{"no content"}};
    }
    if (content_it->is_string() == false) {
        return tl::unexpected(FrameError::invalid_field("'content' must be a string"));
    }
    if (content_it->get_ref<const std::string&>().empty()) {
        return InboundFrame{IgnoredFrame{"empty content"}};
    }

    try {
        return InboundFrame{ChatMessage::from_json(j)};
    } catch (const Json::exception& e) {
        return tl::unexpected(FrameError::invalid_field(e.what()));
    }
}

Json conversation_id_to_json(std::string_view conversation_id) {
    if (all_digits(conversation_id) && conversation_id.size() < 19) {
        std::int64_t value = 0;
        std::from_chars(conversation_id.data(), conversation_id.data() + conversation_id.size(), value);
        return value;
    }
    return std::string(conversation_id);
}

std::string make_chat_frame(std::string_view conversation_id, std::string_view content) {
    const Json frame = {
        {"content", std::string(content)},
        {"group_id", conversation_id_to_json(conversation_id)}
    };
    return frame.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string make_typing_frame(std::string_view conversation_id, bool typing) {
    const Json frame = {
        {"type", std::string(kTypingFrameType)},
        {"typing", typing},
        {"group_id", conversation_id_to_json(conversation_id)}
    };
    return frame.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace rtchat
