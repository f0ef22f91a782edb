#include <catch2/catch_test_macros.hpp>

#include "rtchat/protocol/chat_types.hpp"

#include <chrono>

using namespace rtchat;
using namespace std::chrono;

TEST_CASE("Participant display name prefers the full name", "[protocol][types]") {
    Participant p{"7", "jdoe", "Jane Doe"};
    REQUIRE(p.display_name() == "Jane Doe");

    p.full_name.clear();
    REQUIRE(p.display_name() == "jdoe");
}

TEST_CASE("Participant from_json tolerates loose payloads", "[protocol][types]") {
    SECTION("Numeric id is stringified") {
        auto p = Participant::from_json(Json{{"id", 12}, {"username", "amy"}});
        REQUIRE(p.id == "12");
        REQUIRE(p.username == "amy");
        REQUIRE(p.full_name.empty());
    }

    SECTION("Null fields become empty strings") {
        auto p = Participant::from_json(Json{{"id", "u1"}, {"username", nullptr}, {"full_name", nullptr}});
        REQUIRE(p.id == "u1");
        REQUIRE(p.username.empty());
    }

    SECTION("A bare id instead of an object") {
        auto p = Participant::from_json(Json(33));
        REQUIRE(p.id == "33");
    }
}

TEST_CASE("ChatMessage from_json reads the echo shape", "[protocol][types]") {
    const Json j = {
        {"id", 101},
        {"sender", {{"id", 5}, {"username", "bob"}, {"full_name", "Bob B"}}},
        {"content", "hello"},
        {"created_at", "2024-03-01T10:15:30.250Z"}
    };

    const auto msg = ChatMessage::from_json(j);
    REQUIRE(msg.id == "101");
    REQUIRE(msg.sender.id == "5");
    REQUIRE(msg.sender.display_name() == "Bob B");
    REQUIRE(msg.content == "hello");
    REQUIRE(msg.created_at_raw == "2024-03-01T10:15:30.250Z");
    REQUIRE(msg.created_at.has_value());
    REQUIRE(msg.provisional == false);

    SECTION("to_json keeps the wire field names") {
        const Json out = msg.to_json();
        REQUIRE(out["id"] == "101");
        REQUIRE(out["content"] == "hello");
        REQUIRE(out["sender"]["username"] == "bob");
    }
}

TEST_CASE("parse_iso8601 handles the timestamp variants the backend emits", "[protocol][time]") {
    const auto expected = sys_days{2024y / March / 1} + 10h + 15min + 30s;

    REQUIRE(parse_iso8601("2024-03-01T10:15:30Z") == expected);
    REQUIRE(parse_iso8601("2024-03-01T10:15:30") == expected);
    REQUIRE(parse_iso8601("2024-03-01 10:15:30Z") == expected);
    REQUIRE(parse_iso8601("2024-03-01T12:15:30+02:00") == expected);
    REQUIRE(parse_iso8601("2024-03-01T05:15:30-0500") == expected);

    SECTION("Fractional seconds keep microsecond precision") {
        const auto parsed = parse_iso8601("2024-03-01T10:15:30.123456789Z");
        REQUIRE(parsed.has_value());
        REQUIRE(duration_cast<microseconds>(*parsed - expected) == 123456us);
    }

    SECTION("Garbage is rejected") {
        REQUIRE_FALSE(parse_iso8601("").has_value());
        REQUIRE_FALSE(parse_iso8601("yesterday").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-13-01T00:00:00Z").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-03-01T10:15:30Q").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-03-01T10:15:30.Z").has_value());
    }
}

TEST_CASE("format_date uses the UTC calendar date", "[protocol][time]") {
    const auto late = sys_days{2023y / December / 31} + 23h + 59min;
    REQUIRE(format_date(late) == "2023-12-31");
    REQUIRE(format_date(late + 2min) == "2024-01-01");
}

TEST_CASE("GroupInfo display name", "[protocol][types]") {
    GroupInfo group = GroupInfo::from_json(Json{
        {"id", 42},
        {"name", ""},
        {"members", Json::array({
            {{"id", 7}, {"username", "me"}},
            {{"id", 8}, {"username", "sam"}, {"full_name", "Sam Smith"}}
        })}
    });

    REQUIRE(group.id == "42");
    REQUIRE(group.members.size() == 2);

    SECTION("Unnamed conversation shows the other member") {
        REQUIRE(group.display_name("7") == "Sam Smith");
    }

    SECTION("Named group shows its name") {
        group.name = "Study Group";
        REQUIRE(group.display_name("7") == "Study Group");
    }

    SECTION("Nobody else falls back to a generic title") {
        group.members.pop_back();
        REQUIRE(group.display_name("7") == "Chat");
    }
}
