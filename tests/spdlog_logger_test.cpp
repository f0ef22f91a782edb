// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "rtchat/log/spdlog_logger.hpp"
#include "rtchat/log/logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace rtchat;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger level mapping round-trips", "[log][spdlog]") {
    for (const auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                             LogLevel::Warn, LogLevel::Error, LogLevel::Fatal}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
}

TEST_CASE("SpdlogLogger writes through custom sinks", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);

    SpdlogLogger logger(std::vector<spdlog::sink_ptr>{sink}, LogLevel::Info);
    logger.set_pattern("%l %v");
    logger.debug("hidden");
    logger.warn("Reconnecting in 1000ms");
    logger.flush();

    const std::string text = out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("warning Reconnecting in 1000ms") != std::string::npos);
}

TEST_CASE("SpdlogLogger file logger respects log level", "[log][spdlog][file]") {
    const std::string test_file = "rtchat_spdlog_level.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->info("This should not appear");
        logger->warn("This should appear");
        logger->flush();
    }

    const std::string content = read_file(test_file);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("SpdlogLogger async console logger accepts messages", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info);
    REQUIRE(logger != nullptr);

    for (int i = 0; i < 10; ++i) {
        logger->logf(LogLevel::Info, "Async message {}", i);
    }
    logger->flush();

    REQUIRE(logger->should_log(LogLevel::Info));
}

TEST_CASE("SpdlogLogger can be set as global logger", "[log][spdlog][integration]") {
    const std::string test_file = "rtchat_spdlog_global.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
        auto* spdlog_ptr = logger.get();
        set_logger(std::move(logger));

        RTCHAT_LOG_INFO("Global logger test");
        spdlog_ptr->flush();
    }

    REQUIRE(read_file(test_file).find("Global logger test") != std::string::npos);

    set_logger(nullptr);
    std::filesystem::remove(test_file);
}
