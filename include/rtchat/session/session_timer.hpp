#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// SessionTimer
// ─────────────────────────────────────────────────────────────────────────────
// One-shot timer whose callback runs under its owner's lock.
//
// arm() and cancel() must be called with the owner's lock held. Each arm()
// bumps a serial; a completion whose serial is no longer current is dropped,
// so a callback never runs after cancel() or a re-arm even if the wait had
// already completed and was queued on the executor.
//
// The guard keeps the timer independent of its owner's type: it locks the
// owner (typically through a weak_ptr) and runs the body, or does nothing
// when the owner is gone.

class SessionTimer {
public:
    using Body = std::function<void()>;
    using Guard = std::function<void(const Body& body)>;

    SessionTimer(asio::any_io_executor executor, std::string name, Guard guard);

    SessionTimer(const SessionTimer&) = delete;
    SessionTimer& operator=(const SessionTimer&) = delete;

    /// Replace any pending wait.
    void arm(std::chrono::milliseconds delay, Body on_fire);

    void cancel() noexcept;

    [[nodiscard]] bool armed() const noexcept { return armed_; }
    [[nodiscard]] std::uint64_t serial() const noexcept { return serial_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    asio::steady_timer timer_;
    std::string name_;
    Guard guard_;
    std::uint64_t serial_ = 0;
    bool armed_ = false;
};

}  // namespace rtchat
