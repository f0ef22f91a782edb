#include "rtchat/session/session_timer.hpp"

#include "rtchat/log/logger.hpp"

#include <asio/error.hpp>

#include <format>

namespace rtchat {

SessionTimer::SessionTimer(asio::any_io_executor executor, std::string name, Guard guard)
    : timer_(std::move(executor))
    , name_(std::move(name))
    , guard_(std::move(guard))
{}

void SessionTimer::arm(std::chrono::milliseconds delay, Body on_fire) {
    const std::uint64_t serial = ++serial_;
    armed_ = true;

    if (delay.count() < 0) {
        delay = std::chrono::milliseconds{0};
    }
    timer_.expires_after(delay);
    timer_.async_wait([this, guard = guard_, serial, on_fire = std::move(on_fire)](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        try {
            // `this` is only touched inside the guard, i.e. while the owner
            // (and so this timer) is alive and locked.
            guard([&] {
                if (serial != serial_ || armed_ == false) {
                    return;
                }
                armed_ = false;
                on_fire();
            });
        } catch (const std::exception& e) {
            RTCHAT_LOG_ERROR(std::format("Timer callback threw: {}", e.what()));
        }
    });
}

void SessionTimer::cancel() noexcept {
    ++serial_;
    armed_ = false;
    try {
        timer_.cancel();
    } catch (const std::exception& e) {
        RTCHAT_LOG_WARN(std::format("Timer '{}' cancel failed: {}", name_, e.what()));
    }
}

}  // namespace rtchat
