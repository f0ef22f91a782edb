// ─────────────────────────────────────────────────────────────────────────────
// rtchat-cli - Terminal chat client
// ─────────────────────────────────────────────────────────────────────────────
// Joins one conversation over the realtime socket and chats from the terminal.
//
// Usage:
//   rtchat-cli --endpoint https://campus.example.edu --conversation 42 \
//              --token eyJhbGciOi... --me 7
//
//   # Token from the environment
//   export RTCHAT_TOKEN=eyJhbGciOi...
//   rtchat-cli -e https://campus.example.edu -c 42
//
// Lines typed at the prompt are sent as chat messages. Commands:
//   /status   connection status
//   /history  print the message stream grouped by date
//   /quit     leave

#include <cxxopts.hpp>

#include "rtchat/log/logger.hpp"
#include "rtchat/log/spdlog_logger.hpp"
#include "rtchat/session/chat_session.hpp"
#include "rtchat/transport/websocket_connector.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace rtchat;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

// Notifications arrive on the io thread while stdin is read on main.
std::mutex g_output_mutex;

void print_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_status(const SessionState& state) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    const char* tint = holds<state::Connected>(state) ? color::green
                     : is_failed(state)               ? color::red
                                                      : color::yellow;
    std::cout << color::c(color::dim) << "[" << color::c(tint) << status_text(state)
              << color::c(color::dim) << "]" << color::c(color::reset) << "\n";
}

void print_message(const ChatMessage& message, const std::string& local_id) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    const bool mine = !local_id.empty() && message.sender.id == local_id;
    std::string name = message.sender.display_name();
    if (name.empty()) {
        name = message.sender.id.empty() ? "?" : message.sender.id;
    }
    std::cout << color::c(color::dim) << message.created_at_raw << " "
              << color::c(color::reset) << color::c(color::bold)
              << color::c(mine ? color::cyan : color::green) << name
              << color::c(color::reset) << ": " << message.content << "\n";
}

void print_typing(const TypingPresence& presence) {
    if (presence.remote_is_typing == false) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << color::c(color::dim) << "... "
              << presence.user_id.value_or("someone") << " is typing"
              << color::c(color::reset) << "\n";
}

void print_history(const ChatSession& session, const std::string& local_id) {
    for (const auto& group : session.messages().group_by_date()) {
        {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cout << "\n" << color::c(color::bold)
                      << "═══ " << (group.date.empty() ? "Undated" : group.date) << " ═══"
                      << color::c(color::reset) << "\n";
        }
        for (const auto& message : group.messages) {
            print_message(message, local_id);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Chat Loop
// ═══════════════════════════════════════════════════════════════════════════

int run_chat(ChatSession& session, const std::string& local_id) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "/quit" || line == "/exit") {
            break;
        }
        if (line == "/status") {
            print_status(session.state());
            if (auto error = session.last_error()) {
                print_error(*error);
            }
            continue;
        }
        if (line == "/history") {
            print_history(session, local_id);
            continue;
        }

        auto sent = session.submit_text(line);
        if (!sent) {
            if (sent.error().code != SessionError::Code::EmptyMessage) {
                print_error(sent.error().message);
            }
            continue;
        }
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("rtchat-cli", "Terminal client for realtime conversations");

    options.add_options()
        ("e,endpoint", "Backend base URL (https:// selects wss://)", cxxopts::value<std::string>())
        ("c,conversation", "Conversation id", cxxopts::value<std::string>())
        ("t,token", "Auth token (or use RTCHAT_TOKEN env var)", cxxopts::value<std::string>())
        ("m,me", "Local participant id, used to hide own typing echoes", cxxopts::value<std::string>())
        ("max-attempts", "Connection attempts before giving up", cxxopts::value<std::size_t>()->default_value("5"))
        ("ca-file", "PEM bundle for TLS verification", cxxopts::value<std::string>())
        ("insecure", "Skip TLS certificate verification")
        ("l,log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    rtchat-cli -e https://campus.example.edu -c 42 -t <token> -m 7\n";
            std::cout << "    RTCHAT_TOKEN=<token> rtchat-cli -e http://localhost:8000 -c 42 -l debug\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        if (!result.count("endpoint") || !result.count("conversation")) {
            print_error("Both --endpoint and --conversation are required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        // Logging
        const LogLevel level = parse_log_level(result["log-level"].as<std::string>());
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_async_console_logger(level));
        }

        // Credentials
        std::shared_ptr<ICredentialStore> credentials;
        if (result.count("token")) {
            credentials = std::make_shared<StaticCredentialStore>(result["token"].as<std::string>());
        } else {
            credentials = std::make_shared<EnvCredentialStore>();
        }

        // Transport
        WebSocketConnectorConfig connector_config;
        connector_config.with_tls_verification(!result.count("insecure"));
        if (result.count("ca-file")) {
            connector_config.with_ca_file(result["ca-file"].as<std::string>());
        }
        auto connector = std::make_shared<WebSocketConnector>(connector_config);

        // Session
        ChatSessionConfig config;
        config.with_endpoint(result["endpoint"].as<std::string>())
              .with_conversation(result["conversation"].as<std::string>())
              .with_max_attempts(result["max-attempts"].as<std::size_t>());
        std::string local_id;
        if (result.count("me")) {
            local_id = result["me"].as<std::string>();
            config.with_local_participant(local_id);
        }

        asio::io_context io;
        auto work = asio::make_work_guard(io);
        std::thread io_thread([&io] { io.run(); });

        std::atomic<bool> failed{false};
        int exit_code = 0;
        {
            ChatSessionDeps deps;
            deps.connector = connector;
            deps.credentials = credentials;
            ChatSession session(io.get_executor(), config, deps);

            session.on_state_change([](const SessionState& state) { print_status(state); });
            session.on_message([local_id](const ChatMessage& m) { print_message(m, local_id); });
            session.on_presence_change([](const TypingPresence& p) { print_typing(p); });
            session.on_fatal_error([&failed](const std::string& reason) {
                failed = true;
                print_error(reason);
            });

            session.start();
            exit_code = run_chat(session, local_id);
            session.stop();
        }

        work.reset();
        io_thread.join();
        set_logger(nullptr);

        if (failed && exit_code == 0) {
            exit_code = 2;
        }
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
