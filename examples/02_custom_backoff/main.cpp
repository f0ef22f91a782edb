// Example 02: Custom Backoff
//
// Shows the reconnect schedule of the default policy, then runs a session
// against an unreachable endpoint with a constant 500ms backoff and three
// attempts, logging to a file, until it gives up.

#include <rtchat/log/spdlog_logger.hpp>
#include <rtchat/session/backoff_policy.hpp>
#include <rtchat/session/chat_session.hpp>
#include <rtchat/transport/websocket_connector.hpp>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <iostream>
#include <memory>

using namespace rtchat;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== Custom Backoff Example ===\n\n";

    // 1. The default schedule
    ExponentialBackoff defaults;
    std::cout << "Default delays:\n";
    for (std::size_t attempt = 0; attempt < 6; ++attempt) {
        std::cout << "  after attempt " << attempt << ": "
                  << defaults.next_delay(attempt).count() << "ms\n";
    }

    set_logger(make_spdlog_console_file_logger("rtchat_backoff_example.log", LogLevel::Debug));

    // 2. A session that can never connect
    ChatSessionConfig config;
    config.with_endpoint("http://127.0.0.1:9")
          .with_conversation("1")
          .with_backoff_policy(std::make_shared<ConstantBackoff>(500ms))
          .with_max_attempts(3);

    ChatSessionDeps deps;
    deps.connector = std::make_shared<WebSocketConnector>(
        WebSocketConnectorConfig{}.with_connect_timeout(2s));
    deps.credentials = std::make_shared<StaticCredentialStore>("demo-token");

    asio::io_context io;
    auto work = asio::make_work_guard(io);
    ChatSession session(io.get_executor(), config, deps);

    session.on_state_change([](const SessionState& state) {
        std::cout << "  " << to_string(state) << "\n";
    });
    session.on_fatal_error([&io](const std::string& reason) {
        std::cout << "\nGave up: " << reason << "\n";
        io.stop();
    });

    std::cout << "\nStates:\n";
    session.start();
    io.run_for(30s);

    set_logger(nullptr);
    return is_failed(session.state()) ? 0 : 1;
}
