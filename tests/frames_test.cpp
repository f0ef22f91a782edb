#include <catch2/catch_test_macros.hpp>

#include "rtchat/protocol/frames.hpp"

#include <variant>

using namespace rtchat;

TEST_CASE("Inbound typing frames", "[protocol][frames]") {
    SECTION("Start signal with a numeric user id") {
        auto frame = parse_inbound_frame(R"({"type":"typing","typing":true,"user_id":9,"group_id":42})");
        REQUIRE(frame.has_value());
        const auto* signal = std::get_if<TypingSignal>(&*frame);
        REQUIRE(signal != nullptr);
        REQUIRE(signal->typing);
        REQUIRE(signal->user_id == "9");
    }

    SECTION("Stop signal without a user id") {
        auto frame = parse_inbound_frame(R"({"type":"typing","typing":false})");
        REQUIRE(frame.has_value());
        const auto* signal = std::get_if<TypingSignal>(&*frame);
        REQUIRE(signal != nullptr);
        REQUIRE_FALSE(signal->typing);
        REQUIRE_FALSE(signal->user_id.has_value());
    }

    SECTION("Non-boolean typing flag is an invalid field") {
        auto frame = parse_inbound_frame(R"({"type":"typing","typing":"yes"})");
        REQUIRE_FALSE(frame.has_value());
        REQUIRE(frame.error().code == FrameError::Code::InvalidField);
    }
}

TEST_CASE("Inbound chat frames", "[protocol][frames]") {
    auto frame = parse_inbound_frame(
        R"({"id":3,"sender":{"id":5,"username":"bob"},"content":"hi","created_at":"2024-03-01T10:00:00Z"})");
    REQUIRE(frame.has_value());
    const auto* message = std::get_if<ChatMessage>(&*frame);
    REQUIRE(message != nullptr);
    REQUIRE(message->id == "3");
    REQUIRE(message->content == "hi");
    REQUIRE(message->sender.username == "bob");

    SECTION("A non-typing type with content is still chat") {
        auto other = parse_inbound_frame(R"({"type":"chat_message","content":"yo"})");
        REQUIRE(other.has_value());
        REQUIRE(std::holds_alternative<ChatMessage>(*other));
    }
}

TEST_CASE("Frames without usable content are ignored", "[protocol][frames]") {
    for (const char* text : {R"({"type":"presence"})", R"({"content":""})", R"({"content":null})"}) {
        auto frame = parse_inbound_frame(text);
        REQUIRE(frame.has_value());
        REQUIRE(std::holds_alternative<IgnoredFrame>(*frame));
    }
}

TEST_CASE("Malformed frames are reported, not thrown", "[protocol][frames]") {
    SECTION("Not JSON") {
        auto frame = parse_inbound_frame("{not json");
        REQUIRE_FALSE(frame.has_value());
        REQUIRE(frame.error().code == FrameError::Code::InvalidJson);
    }

    SECTION("Not an object") {
        auto frame = parse_inbound_frame("[1,2,3]");
        REQUIRE_FALSE(frame.has_value());
        REQUIRE(frame.error().code == FrameError::Code::NotAnObject);
    }

    SECTION("Content of the wrong type") {
        auto frame = parse_inbound_frame(R"({"content":17})");
        REQUIRE_FALSE(frame.has_value());
        REQUIRE(frame.error().code == FrameError::Code::InvalidField);
    }
}

TEST_CASE("Outbound frames", "[protocol][frames]") {
    SECTION("Numeric conversation ids are sent as numbers") {
        const Json chat = Json::parse(make_chat_frame("42", "hello"));
        REQUIRE(chat["content"] == "hello");
        REQUIRE(chat["group_id"].is_number_integer());
        REQUIRE(chat["group_id"] == 42);
        REQUIRE_FALSE(chat.contains("type"));
    }

    SECTION("Other ids stay strings") {
        const Json chat = Json::parse(make_chat_frame("room-a", "hello"));
        REQUIRE(chat["group_id"] == "room-a");
    }

    SECTION("Very long digit strings are not narrowed") {
        REQUIRE(conversation_id_to_json("12345678901234567890").is_string());
    }

    SECTION("Typing frame") {
        const Json typing = Json::parse(make_typing_frame("42", true));
        REQUIRE(typing["type"] == "typing");
        REQUIRE(typing["typing"] == true);
        REQUIRE(typing["group_id"] == 42);
    }

    SECTION("Content is sent verbatim") {
        const std::string content = "<b>\"quoted\"</b> \xF0\x9F\x98\x80";
        const Json chat = Json::parse(make_chat_frame("1", content));
        REQUIRE(chat["content"] == content);
    }
}
