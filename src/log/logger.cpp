#include "rtchat/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rtchat {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kDim   = "\033[90m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;35m";
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

[[nodiscard]] std::string wall_clock(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of('/');
    if (slash == std::string_view::npos) {
        return sv;
    }
    return sv.substr(slash + 1);
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::ostringstream line;
    if (colors_enabled_) {
        line << kDim << wall_clock(record.timestamp) << kReset << ' '
             << level_color(record.level) << std::setw(5) << std::left
             << to_string(record.level) << kReset << ' '
             << kDim << basename_of(record.location.file_name()) << ':'
             << record.location.line() << kReset;
    } else {
        line << wall_clock(record.timestamp) << ' '
             << std::setw(5) << std::left << to_string(record.level) << ' '
             << basename_of(record.location.file_name()) << ':'
             << record.location.line();
    }
    line << ' ' << record.message << '\n';

    // Frames from the transport thread and timer callbacks interleave here.
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_slot() {
    static std::unique_ptr<ILogger> slot = std::make_unique<NullLogger>();
    return slot;
}

std::mutex& logger_slot_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_slot_mutex());
    return *logger_slot();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_slot_mutex());
    if (logger) {
        logger_slot() = std::move(logger);
    } else {
        logger_slot() = std::make_unique<NullLogger>();
    }
}

}  // namespace rtchat
