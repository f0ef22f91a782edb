#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Frame-level chatter (every inbound/outbound frame)
    Debug = 1,  // Timer and transition details
    Info  = 2,  // Session lifecycle (connected, stopped, ...)
    Warn  = 3,  // Dropped frames, failed best-effort sends
    Error = 4,  // Connection lost, callback threw
    Fatal = 5,  // Session gave up (ConnectionFailed)
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as accepted on the command line ("debug", "WARN", ...).
/// Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Backend-neutral sink. The session and transport layers only ever talk to
// this interface; the spdlog backend lives in spdlog_logger.hpp.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    /// std::format-style helper; the format is only evaluated when the level
    /// is enabled.
    template<typename... Args>
    void logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - colored stderr output, no third-party dependency
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

/// Defaults to NullLogger until set_logger() is called.
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the process logger. nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define RTCHAT_LOG_AT(lvl, msg) \
    do { if (::rtchat::get_logger().should_log(lvl)) \
         ::rtchat::get_logger().write(lvl, msg); } while(false)

#define RTCHAT_LOG_TRACE(msg) RTCHAT_LOG_AT(::rtchat::LogLevel::Trace, msg)
#define RTCHAT_LOG_DEBUG(msg) RTCHAT_LOG_AT(::rtchat::LogLevel::Debug, msg)
#define RTCHAT_LOG_INFO(msg)  RTCHAT_LOG_AT(::rtchat::LogLevel::Info, msg)
#define RTCHAT_LOG_WARN(msg)  RTCHAT_LOG_AT(::rtchat::LogLevel::Warn, msg)
#define RTCHAT_LOG_ERROR(msg) RTCHAT_LOG_AT(::rtchat::LogLevel::Error, msg)
#define RTCHAT_LOG_FATAL(msg) RTCHAT_LOG_AT(::rtchat::LogLevel::Fatal, msg)

}  // namespace rtchat
