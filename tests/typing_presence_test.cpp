#include <catch2/catch_test_macros.hpp>

#include "rtchat/session/session_timer.hpp"
#include "rtchat/session/typing_presence.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace rtchat;
using namespace std::chrono_literals;

namespace {

// Runs timer bodies inline; these tests are single-threaded.
const SessionTimer::Guard kInline = [](const SessionTimer::Body& body) { body(); };

void run_for(asio::io_context& io, std::chrono::milliseconds d) {
    io.restart();
    io.run_for(d);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SessionTimer
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionTimer fires once after its delay", "[session][timer]") {
    asio::io_context io;
    SessionTimer timer(io.get_executor(), "test", kInline);
    int fired = 0;

    timer.arm(10ms, [&] { ++fired; });
    REQUIRE(timer.armed());
    run_for(io, 50ms);

    REQUIRE(fired == 1);
    REQUIRE_FALSE(timer.armed());
}

TEST_CASE("SessionTimer re-arm replaces the pending wait", "[session][timer]") {
    asio::io_context io;
    SessionTimer timer(io.get_executor(), "test", kInline);
    std::vector<int> fired;

    timer.arm(10ms, [&] { fired.push_back(1); });
    timer.arm(20ms, [&] { fired.push_back(2); });
    run_for(io, 60ms);

    REQUIRE(fired == std::vector<int>{2});
}

TEST_CASE("SessionTimer cancel drops an already-completed wait", "[session][timer]") {
    asio::io_context io;
    SessionTimer timer(io.get_executor(), "test", kInline);
    int fired = 0;

    timer.arm(0ms, [&] { ++fired; });
    std::this_thread::sleep_for(5ms);
    timer.cancel();
    run_for(io, 20ms);

    REQUIRE(fired == 0);
}

TEST_CASE("SessionTimer does nothing when the guard declines", "[session][timer]") {
    asio::io_context io;
    SessionTimer timer(io.get_executor(), "test", [](const SessionTimer::Body&) {});
    int fired = 0;

    timer.arm(0ms, [&] { ++fired; });
    run_for(io, 20ms);

    REQUIRE(fired == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// TypingDebouncer
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TypingDebouncer sends one start per burst, then a stop", "[session][typing]") {
    asio::io_context io;
    std::vector<bool> sent;
    bool can_send = true;

    TypingDebouncer debouncer(io.get_executor(), kInline, 30ms, 100ms,
                              [&] { return can_send; },
                              [&](bool typing) { sent.push_back(typing); });

    for (int i = 0; i < 5; ++i) {
        debouncer.note_keystroke();
        run_for(io, 5ms);
    }
    REQUIRE(sent.empty());
    REQUIRE(debouncer.debounce_pending());

    run_for(io, 60ms);
    REQUIRE(sent == std::vector<bool>{true});
    REQUIRE(debouncer.stop_pending());

    run_for(io, 150ms);
    REQUIRE(sent == std::vector<bool>{true, false});
    REQUIRE_FALSE(debouncer.stop_pending());

    SECTION("Nothing is sent while sending is impossible") {
        sent.clear();
        can_send = false;
        debouncer.note_keystroke();
        run_for(io, 60ms);
        REQUIRE(sent.empty());
        REQUIRE_FALSE(debouncer.stop_pending());
    }
}

TEST_CASE("TypingDebouncer cancel drops both timers", "[session][typing]") {
    asio::io_context io;
    std::vector<bool> sent;

    TypingDebouncer debouncer(io.get_executor(), kInline, 10ms, 30ms,
                              [] { return true; },
                              [&](bool typing) { sent.push_back(typing); });

    debouncer.note_keystroke();
    debouncer.cancel();
    run_for(io, 60ms);
    REQUIRE(sent.empty());

    debouncer.note_keystroke();
    run_for(io, 20ms);
    REQUIRE(sent == std::vector<bool>{true});
    debouncer.cancel();
    run_for(io, 60ms);
    REQUIRE(sent == std::vector<bool>{true});
}

// ═══════════════════════════════════════════════════════════════════════════
// RemoteTypingTracker
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RemoteTypingTracker follows remote signals", "[session][typing]") {
    asio::io_context io;
    std::vector<TypingPresence> changes;

    RemoteTypingTracker tracker(io.get_executor(), kInline, 100ms, std::string("7"),
                                [&](const TypingPresence& p) { changes.push_back(p); });

    SECTION("Start then stop") {
        tracker.on_signal(TypingSignal{true, "8"});
        REQUIRE(tracker.presence().remote_is_typing);
        REQUIRE(tracker.presence().user_id == "8");

        tracker.on_signal(TypingSignal{false, "8"});
        REQUIRE_FALSE(tracker.presence().remote_is_typing);
        REQUIRE(changes.size() == 2);
    }

    SECTION("Repeated start signals notify once") {
        tracker.on_signal(TypingSignal{true, "8"});
        tracker.on_signal(TypingSignal{true, "8"});
        REQUIRE(changes.size() == 1);
    }

    SECTION("Own signals are ignored") {
        tracker.on_signal(TypingSignal{true, "7"});
        REQUIRE_FALSE(tracker.presence().remote_is_typing);
        REQUIRE(changes.empty());
    }

    SECTION("A chat message clears presence") {
        tracker.on_signal(TypingSignal{true, "8"});
        tracker.on_chat_message();
        REQUIRE_FALSE(tracker.presence().remote_is_typing);
        REQUIRE(changes.size() == 2);
    }

    SECTION("Presence expires without a stop signal") {
        tracker.on_signal(TypingSignal{true, "8"});
        run_for(io, 40ms);
        REQUIRE(tracker.presence().remote_is_typing);

        run_for(io, 150ms);
        REQUIRE_FALSE(tracker.presence().remote_is_typing);
        REQUIRE(changes.size() == 2);
    }

    SECTION("A fresh start signal extends the expiry") {
        tracker.on_signal(TypingSignal{true, "8"});
        run_for(io, 70ms);
        tracker.on_signal(TypingSignal{true, "8"});
        run_for(io, 70ms);
        REQUIRE(tracker.presence().remote_is_typing);
    }

    SECTION("reset clears silently") {
        tracker.on_signal(TypingSignal{true, "8"});
        tracker.reset();
        REQUIRE_FALSE(tracker.presence().remote_is_typing);
        REQUIRE(changes.size() == 1);
        run_for(io, 150ms);
        REQUIRE(changes.size() == 1);
    }
}
