#ifndef RTCHAT_TESTS_MOCKS_TEST_LOGGER_HPP
#define RTCHAT_TESTS_MOCKS_TEST_LOGGER_HPP

#include "rtchat/log/logger.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rtchat::testing {

// ─────────────────────────────────────────────────────────────────────────────
// TestLogger - Captures log records for verification
// ─────────────────────────────────────────────────────────────────────────────
// Thread-safe: session tests log from timer and transport threads.

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] bool contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& r) {
            return r.message.find(needle) != std::string::npos;
        });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

private:
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/// Installs a TestLogger for the lifetime of the scope.
class ScopedTestLogger {
public:
    explicit ScopedTestLogger(LogLevel min_level = LogLevel::Trace) {
        auto logger = std::make_unique<TestLogger>(min_level);
        logger_ = logger.get();
        set_logger(std::move(logger));
    }

    ~ScopedTestLogger() {
        set_logger(nullptr);
    }

    ScopedTestLogger(const ScopedTestLogger&) = delete;
    ScopedTestLogger& operator=(const ScopedTestLogger&) = delete;

    TestLogger& operator*() const noexcept { return *logger_; }
    TestLogger* operator->() const noexcept { return logger_; }

private:
    TestLogger* logger_;
};

}  // namespace rtchat::testing

#endif  // RTCHAT_TESTS_MOCKS_TEST_LOGGER_HPP
