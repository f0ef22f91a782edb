// Example 01: Basic Session
//
// Joins a conversation, prints state changes and incoming messages, sends one
// greeting once connected, then leaves after a while.
//
//   RTCHAT_TOKEN=<token> ./01_basic_session https://campus.example.edu 42

#include <rtchat/log/spdlog_logger.hpp>
#include <rtchat/session/chat_session.hpp>
#include <rtchat/transport/websocket_connector.hpp>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace rtchat;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <endpoint> <conversation>\n";
        return 1;
    }

    std::cout << "=== Basic Session Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Configure the session
    ChatSessionConfig config;
    config.with_endpoint(argv[1])
          .with_conversation(argv[2]);

    ChatSessionDeps deps;
    deps.connector = std::make_shared<WebSocketConnector>();
    deps.credentials = std::make_shared<EnvCredentialStore>();

    asio::io_context io;
    auto work = asio::make_work_guard(io);
    ChatSession session(io.get_executor(), config, deps);

    // 2. Observe. Callbacks run on io's thread, so calling back in is fine.
    bool greeted = false;
    session.on_state_change([&](const SessionState& state) {
        std::cout << "[" << to_string(state) << "] " << status_text(state) << "\n";
        if (holds<state::Connected>(state) && !greeted) {
            greeted = true;
            if (auto sent = session.submit_text("Hello from rtchat!"); !sent) {
                std::cerr << "send failed: " << sent.error().message << "\n";
            }
        }
    });
    session.on_message([](const ChatMessage& m) {
        std::cout << m.sender.display_name() << ": " << m.content << "\n";
    });
    session.on_fatal_error([&io](const std::string& reason) {
        std::cerr << reason << "\n";
        io.stop();
    });

    // 3. Run for thirty seconds
    session.start();
    io.run_for(std::chrono::seconds(30));

    session.stop();
    std::cout << "\nFinal state: " << to_string(session.state()) << "\n";
    set_logger(nullptr);
    return 0;
}
