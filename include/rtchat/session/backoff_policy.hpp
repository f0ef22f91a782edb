#ifndef RTCHAT_SESSION_BACKOFF_POLICY_HPP
#define RTCHAT_SESSION_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before reconnect attempt n+1 after attempt n failed.
//
// Usage:
//   auto policy = std::make_shared<ExponentialBackoff>();
//   timer.expires_after(policy->next_delay(attempt));

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: 0-indexed number of the attempt that just failed.
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    // Called after a connection is established.
    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = clamp(jitter(min(base * multiplier^attempt, max)), 0, max)
//
// With the session defaults (1s, x2, 10s cap, no jitter):
//   Attempt 0: 1000ms
//   Attempt 1: 2000ms
//   Attempt 2: 4000ms
//   Attempt 3: 8000ms
//   Attempt 4+: 10000ms
//
// The jittered value is clamped again, so no delay ever exceeds max.

class ExponentialBackoff : public IBackoffPolicy {
public:
    // 1s base, 2x multiplier, 10s max, no jitter
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{1'000},
              2.0,
              std::chrono::milliseconds{10'000},
              0.0
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 = no jitter, 0.25 = ±25%
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double exponent = static_cast<double>(attempt);
        const double base_ms = static_cast<double>(base_.count());
        const double delay_ms = base_ms * std::pow(multiplier_, exponent);

        // Cap first; pow() overflows to inf for large attempts and min() tames it.
        const double max_ms = static_cast<double>(max_.count());
        const double capped_ms = std::min(delay_ms, max_ms);

        const double jittered_ms = add_jitter(capped_ms);

        const auto result_ms = static_cast<std::int64_t>(std::clamp(jittered_ms, 0.0, max_ms));
        return std::chrono::milliseconds{result_ms};
    }

    void reset() override {}

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds max() const noexcept { return max_; }

private:
    double add_jitter(double base_value) {
        const bool has_jitter = (jitter_factor_ > 0.0);
        if (has_jitter == false) {
            return base_value;
        }

        // [1 - jitter, 1 + jitter]
        std::uniform_real_distribution<double> dist(
            1.0 - jitter_factor_,
            1.0 + jitter_factor_
        );
        return base_value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - Testing Helper
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

}  // namespace rtchat

#endif  // RTCHAT_SESSION_BACKOFF_POLICY_HPP
