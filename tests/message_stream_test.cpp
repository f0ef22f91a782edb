#include <catch2/catch_test_macros.hpp>

#include "rtchat/session/message_stream.hpp"

#include <thread>

using namespace rtchat;

namespace {

ChatMessage message(std::string content, std::string created_at = {}) {
    ChatMessage m;
    m.content = std::move(content);
    m.created_at_raw = std::move(created_at);
    if (!m.created_at_raw.empty()) {
        m.created_at = parse_iso8601(m.created_at_raw);
    }
    return m;
}

std::vector<std::string> contents(const std::vector<ChatMessage>& messages) {
    std::vector<std::string> out;
    for (const auto& m : messages) {
        out.push_back(m.content);
    }
    return out;
}

}  // namespace

TEST_CASE("MessageStream keeps arrival order", "[session][stream]") {
    MessageStream stream;
    REQUIRE(stream.empty());

    stream.append(message("one"));
    stream.append(message("two"));
    stream.append(message("three"));

    REQUIRE(stream.size() == 3);
    REQUIRE(contents(stream.snapshot()) == std::vector<std::string>{"one", "two", "three"});

    SECTION("read_from returns the tail") {
        REQUIRE(contents(stream.read_from(1)) == std::vector<std::string>{"two", "three"});
        REQUIRE(stream.read_from(3).empty());
        REQUIRE(stream.read_from(100).empty());
    }

    SECTION("Earlier indices stay valid as messages arrive") {
        const auto before = stream.read_from(0);
        stream.append(message("four"));
        const auto after = stream.read_from(0);
        for (std::size_t i = 0; i < before.size(); ++i) {
            REQUIRE(after[i].content == before[i].content);
        }
    }

    SECTION("for_each visits in order") {
        std::vector<std::string> seen;
        stream.for_each([&](const ChatMessage& m) { seen.push_back(m.content); });
        REQUIRE(seen == std::vector<std::string>{"one", "two", "three"});
    }
}

TEST_CASE("MessageStream seeding", "[session][stream]") {
    MessageStream stream;

    auto seeded = stream.seed({message("old-1"), message("old-2")});
    REQUIRE(seeded.has_value());
    REQUIRE(*seeded == 2);

    stream.append(message("live"));
    REQUIRE(contents(stream.snapshot()) == std::vector<std::string>{"old-1", "old-2", "live"});

    SECTION("A second seed is refused") {
        auto again = stream.seed({message("late")});
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == HistoryError::Code::AlreadyLive);
        REQUIRE(stream.size() == 3);
    }
}

TEST_CASE("MessageStream tolerates concurrent appends", "[session][stream]") {
    MessageStream stream;
    constexpr int kPerThread = 200;

    std::thread a([&] { for (int i = 0; i < kPerThread; ++i) stream.append(message("a")); });
    std::thread b([&] { for (int i = 0; i < kPerThread; ++i) stream.append(message("b")); });
    a.join();
    b.join();

    REQUIRE(stream.size() == 2 * kPerThread);
}

TEST_CASE("group_by_date", "[session][stream]") {
    const std::vector<ChatMessage> messages = {
        message("m1", "2024-03-01T09:00:00Z"),
        message("m2", "2024-03-01T23:59:59Z"),
        message("m3", "2024-03-02T00:00:01Z"),
        message("m4"),
        message("m5", "2024-03-01T12:00:00Z"),
    };

    const auto groups = group_by_date(messages);
    REQUIRE(groups.size() == 3);

    REQUIRE(groups[0].date == "2024-03-01");
    REQUIRE(contents(groups[0].messages) == std::vector<std::string>{"m1", "m2", "m5"});

    REQUIRE(groups[1].date == "2024-03-02");
    REQUIRE(contents(groups[1].messages) == std::vector<std::string>{"m3"});

    REQUIRE(groups[2].date.empty());
    REQUIRE(contents(groups[2].messages) == std::vector<std::string>{"m4"});

    SECTION("Stream exposes the same grouping") {
        MessageStream stream;
        REQUIRE(stream.seed(messages).has_value());
        REQUIRE(stream.group_by_date().size() == 3);
    }
}
