#pragma once

#include "rtchat/transport/connection.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// WebSocketConnectorConfig
// ─────────────────────────────────────────────────────────────────────────────

struct WebSocketConnectorConfig {
    /// Resolve plus TCP connect.
    std::chrono::milliseconds connect_timeout{10'000};

    /// TLS and WebSocket upgrade.
    std::chrono::milliseconds handshake_timeout{10'000};

    /// Verify the server certificate and host name for wss.
    bool verify_tls = true;

    /// PEM bundle; system default paths when absent.
    std::optional<std::string> ca_file;

    std::string user_agent = "rtchat/1.0";

    /// Largest inbound message accepted before the socket is failed.
    std::size_t max_message_size = 1024 * 1024;

    WebSocketConnectorConfig& with_connect_timeout(std::chrono::milliseconds t) {
        connect_timeout = t;
        return *this;
    }

    WebSocketConnectorConfig& with_handshake_timeout(std::chrono::milliseconds t) {
        handshake_timeout = t;
        return *this;
    }

    WebSocketConnectorConfig& with_tls_verification(bool verify) {
        verify_tls = verify;
        return *this;
    }

    WebSocketConnectorConfig& with_ca_file(std::string path) {
        ca_file = std::move(path);
        return *this;
    }

    WebSocketConnectorConfig& with_user_agent(std::string ua) {
        user_agent = std::move(ua);
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// WebSocketConnector
// ═══════════════════════════════════════════════════════════════════════════
// Boost.Beast connector. All socket I/O runs on one background thread owned
// by the connector; event sinks are invoked on that thread.
//
// The connector must outlive every connection it opened.

class WebSocketConnector final : public IConnector {
public:
    explicit WebSocketConnector(WebSocketConnectorConfig config = {});
    ~WebSocketConnector() override;

    WebSocketConnector(const WebSocketConnector&) = delete;
    WebSocketConnector& operator=(const WebSocketConnector&) = delete;

    [[nodiscard]] bool available() const noexcept override;

    [[nodiscard]] ConnectionResult<std::unique_ptr<IConnection>> open(
        const ConnectionTarget& target,
        ConnectionEventSink sink
    ) override;

    [[nodiscard]] const WebSocketConnectorConfig& config() const noexcept { return config_; }

private:
    WebSocketConnectorConfig config_;
    boost::asio::ssl::context ssl_ctx_;
    bool ssl_ready_ = false;
    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread thread_;
};

}  // namespace rtchat
