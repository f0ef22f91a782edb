#include "rtchat/transport/websocket_connector.hpp"

#include "rtchat/log/logger.hpp"
#include "rtchat/transport/endpoint.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <deque>
#include <format>
#include <mutex>
#include <type_traits>

namespace rtchat {

namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
namespace websocket = boost::beast::websocket;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// RFC 6455 limits the close reason to 123 bytes.
constexpr std::size_t kMaxCloseReason = 123;

enum class Phase : std::uint8_t {
    Connecting,
    Open,
    Closing,
    Done
};

// ─────────────────────────────────────────────────────────────────────────────
// ISocketSession
// ─────────────────────────────────────────────────────────────────────────────

class ISocketSession {
public:
    virtual ~ISocketSession() = default;

    virtual void start() = 0;
    [[nodiscard]] virtual ConnectionResult<void> send(std::string text) = 0;
    virtual void close(std::uint16_t code, std::string reason) = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;
    virtual void detach() noexcept = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// WebSocketSession
// ═══════════════════════════════════════════════════════════════════════════
// One socket, driven entirely on its strand. phase_ is also read from the
// caller's thread by send() and is_open(), and only written on the strand.
//
//   resolve ─▶ connect ─▶ [tls handshake] ─▶ ws handshake ─▶ read loop
//
// Exactly one asynchronous operation of the connect chain is outstanding at
// any time, so cancelling the socket always completes the chain.

template <class Stream>
class WebSocketSession final
    : public ISocketSession
    , public std::enable_shared_from_this<WebSocketSession<Stream>> {
    static constexpr bool kSecure = std::is_same_v<Stream, TlsStream>;

public:
    template <class... StreamArgs>
    WebSocketSession(
        SocketEndpoint endpoint,
        const WebSocketConnectorConfig& config,
        ConnectionEventSink sink,
        StreamArgs&&... stream_args
    )
        : ws_(std::forward<StreamArgs>(stream_args)...)
        , resolver_(ws_.get_executor())
        , endpoint_(std::move(endpoint))
        , config_(config)
        , sink_(std::move(sink))
    {}

    void start() override {
        net::post(ws_.get_executor(), [self = this->shared_from_this()] {
            self->do_resolve();
        });
    }

    ConnectionResult<void> send(std::string text) override {
        if (phase_.load() != Phase::Open) {
            return tl::unexpected(ConnectionError::not_open());
        }
        net::post(ws_.get_executor(), [self = this->shared_from_this(), text = std::move(text)]() mutable {
            self->do_send(std::move(text));
        });
        return {};
    }

    void close(std::uint16_t code, std::string reason) override {
        if (reason.size() > kMaxCloseReason) {
            reason.resize(kMaxCloseReason);
        }
        net::post(ws_.get_executor(), [self = this->shared_from_this(), code, reason = std::move(reason)]() mutable {
            self->do_close(code, std::move(reason));
        });
    }

    [[nodiscard]] bool is_open() const noexcept override {
        return phase_.load() == Phase::Open;
    }

    void detach() noexcept override {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = nullptr;
    }

private:
    // ─────────────────────────────────────────────────────────────────────────
    // Connect chain
    // ─────────────────────────────────────────────────────────────────────────

    void do_resolve() {
        if (phase_.load() != Phase::Connecting) {
            finish(close_code_, close_reason_);
            return;
        }
        beast::get_lowest_layer(ws_).expires_after(config_.connect_timeout);
        resolver_.async_resolve(
            endpoint_.host,
            std::to_string(endpoint_.port),
            beast::bind_front_handler(&WebSocketSession::on_resolve, this->shared_from_this())
        );
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail(ec, "resolve");
            return;
        }
        beast::get_lowest_layer(ws_).expires_after(config_.connect_timeout);
        beast::get_lowest_layer(ws_).async_connect(
            results,
            beast::bind_front_handler(&WebSocketSession::on_connect, this->shared_from_this())
        );
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type /*ep*/) {
        if (ec) {
            fail(ec, "connect");
            return;
        }
        if (phase_.load() != Phase::Connecting) {
            finish(close_code_, close_reason_);
            return;
        }

        if constexpr (kSecure) {
            beast::get_lowest_layer(ws_).expires_after(config_.handshake_timeout);
            auto& tls = ws_.next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), endpoint_.host.c_str())) {
                const beast::error_code sni_ec{
                    static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category()
                };
                fail(sni_ec, "tls server name");
                return;
            }
            if (config_.verify_tls) {
                tls.set_verify_callback(ssl::host_name_verification(endpoint_.host));
            }
            tls.async_handshake(
                ssl::stream_base::client,
                beast::bind_front_handler(&WebSocketSession::on_tls_handshake, this->shared_from_this())
            );
        } else {
            do_ws_handshake();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (ec) {
            fail(ec, "tls handshake");
            return;
        }
        do_ws_handshake();
    }

    void do_ws_handshake() {
        if (phase_.load() != Phase::Connecting) {
            finish(close_code_, close_reason_);
            return;
        }

        // The websocket stream runs its own timers from here on.
        beast::get_lowest_layer(ws_).expires_never();
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = config_.handshake_timeout;
        ws_.set_option(timeouts);
        ws_.set_option(websocket::stream_base::decorator(
            [ua = config_.user_agent](websocket::request_type& req) {
                req.set(http::field::user_agent, ua);
            }));
        ws_.read_message_max(config_.max_message_size);
        ws_.text(true);

        ws_.async_handshake(
            endpoint_.host_header(),
            endpoint_.target,
            beast::bind_front_handler(&WebSocketSession::on_handshake, this->shared_from_this())
        );
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            fail(ec, "websocket handshake");
            return;
        }
        if (phase_.load() != Phase::Connecting) {
            finish(close_code_, close_reason_);
            return;
        }
        phase_.store(Phase::Open);
        RTCHAT_LOG_DEBUG(std::format("WebSocket open: {}", endpoint_.redacted_url()));
        emit(Opened{});
        do_read();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Read loop
    // ─────────────────────────────────────────────────────────────────────────

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(&WebSocketSession::on_read, this->shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec == websocket::error::closed) {
            const auto& reason = ws_.reason();
            auto code = static_cast<std::uint16_t>(reason.code);
            if (code == 0) {
                code = close_code::kNoStatus;
            }
            finish(code, std::string(reason.reason.data(), reason.reason.size()));
            return;
        }
        if (ec) {
            fail(ec, "read");
            return;
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        emit(FrameReceived{std::move(text)});
        do_read();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Write queue
    // ─────────────────────────────────────────────────────────────────────────

    void do_send(std::string text) {
        if (phase_.load() != Phase::Open) {
            RTCHAT_LOG_DEBUG("Dropping outbound frame: socket is closing");
            return;
        }
        queue_.push_back(std::move(text));
        if (writing_ == false) {
            do_write();
        }
    }

    void do_write() {
        writing_ = true;
        ws_.async_write(
            net::buffer(queue_.front()),
            beast::bind_front_handler(&WebSocketSession::on_write, this->shared_from_this())
        );
    }

    void on_write(beast::error_code ec, std::size_t /*bytes*/) {
        writing_ = false;
        if (ec) {
            queue_.clear();
            fail(ec, "write");
            return;
        }
        queue_.pop_front();

        if (phase_.load() == Phase::Closing) {
            queue_.clear();
            if (close_after_write_) {
                do_ws_close();
            }
            return;
        }
        if (!queue_.empty()) {
            do_write();
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Closing
    // ─────────────────────────────────────────────────────────────────────────

    void do_close(std::uint16_t code, std::string reason) {
        const Phase phase = phase_.load();
        if (phase == Phase::Closing || phase == Phase::Done) {
            return;
        }
        close_code_ = code;
        close_reason_ = std::move(reason);
        phase_.store(Phase::Closing);

        if (phase == Phase::Connecting) {
            // Abort the connect chain; its pending handler reports Closed.
            resolver_.cancel();
            beast::get_lowest_layer(ws_).cancel();
            return;
        }

        if (writing_) {
            close_after_write_ = true;
            return;
        }
        do_ws_close();
    }

    void do_ws_close() {
        close_after_write_ = false;
        const websocket::close_reason reason(static_cast<websocket::close_code>(close_code_), close_reason_);
        ws_.async_close(
            reason,
            beast::bind_front_handler(&WebSocketSession::on_close, this->shared_from_this())
        );
    }

    void on_close(beast::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            RTCHAT_LOG_DEBUG(std::format("WebSocket close handshake failed: {}", ec.message()));
        }
        finish(close_code_, close_reason_);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Termination
    // ─────────────────────────────────────────────────────────────────────────

    void fail(beast::error_code ec, std::string_view what) {
        const Phase phase = phase_.load();
        if (phase == Phase::Done) {
            return;
        }
        if (phase == Phase::Closing) {
            // Expected fallout of a local close.
            finish(close_code_, close_reason_);
            return;
        }
        std::string message = std::format("{} failed: {}", what, ec.message());
        RTCHAT_LOG_WARN(std::format("WebSocket {}: {}", endpoint_.redacted_url(), message));
        emit(ErrorOccurred{message});
        finish(close_code::kAbnormal, std::move(message));
    }

    void finish(std::uint16_t code, std::string reason) {
        if (phase_.exchange(Phase::Done) == Phase::Done) {
            return;
        }
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        queue_.clear();
        emit(Closed{code, std::move(reason)});
    }

    void emit(ConnectionEvent event) {
        ConnectionEventSink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = sink_;
        }
        if (!sink) {
            return;
        }
        try {
            sink(std::move(event));
        } catch (const std::exception& e) {
            RTCHAT_LOG_ERROR(std::format("Connection event handler threw: {}", e.what()));
        }
    }

    Stream ws_;
    tcp::resolver resolver_;
    beast::flat_buffer buffer_;
    SocketEndpoint endpoint_;
    const WebSocketConnectorConfig config_;

    std::atomic<Phase> phase_{Phase::Connecting};
    std::deque<std::string> queue_;
    bool writing_ = false;
    bool close_after_write_ = false;
    std::uint16_t close_code_ = close_code::kNormal;
    std::string close_reason_;

    std::mutex sink_mutex_;
    ConnectionEventSink sink_;
};

// ─────────────────────────────────────────────────────────────────────────────
// WebSocketConnection - the IConnection handed to callers
// ─────────────────────────────────────────────────────────────────────────────

class WebSocketConnection final : public IConnection {
public:
    explicit WebSocketConnection(std::shared_ptr<ISocketSession> session)
        : session_(std::move(session))
    {}

    ~WebSocketConnection() override {
        session_->detach();
        session_->close(close_code::kGoingAway, "connection released");
    }

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    ConnectionResult<void> send(std::string text) override {
        return session_->send(std::move(text));
    }

    void close(std::uint16_t code, std::string reason) override {
        session_->close(code, std::move(reason));
    }

    [[nodiscard]] bool is_open() const noexcept override {
        return session_->is_open();
    }

private:
    std::shared_ptr<ISocketSession> session_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// WebSocketConnector
// ═══════════════════════════════════════════════════════════════════════════

WebSocketConnector::WebSocketConnector(WebSocketConnectorConfig config)
    : config_(std::move(config))
    , ssl_ctx_(ssl::context::tls_client)
{
    beast::error_code ec;
    if (config_.verify_tls) {
        ssl_ctx_.set_verify_mode(ssl::verify_peer, ec);
        if (!ec) {
            if (config_.ca_file) {
                ssl_ctx_.load_verify_file(*config_.ca_file, ec);
            } else {
                ssl_ctx_.set_default_verify_paths(ec);
            }
        }
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none, ec);
    }
    ssl_ready_ = !ec;
    if (ec) {
        RTCHAT_LOG_ERROR(std::format("TLS context setup failed, wss disabled: {}", ec.message()));
    }

    work_.emplace(net::make_work_guard(io_));
    thread_ = std::thread([this] {
        for (;;) {
            try {
                io_.run();
                return;
            } catch (const std::exception& e) {
                RTCHAT_LOG_ERROR(std::format("WebSocket I/O thread: {}", e.what()));
            }
        }
    });
}

WebSocketConnector::~WebSocketConnector() {
    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool WebSocketConnector::available() const noexcept {
    return thread_.joinable();
}

ConnectionResult<std::unique_ptr<IConnection>> WebSocketConnector::open(
    const ConnectionTarget& target,
    ConnectionEventSink sink
) {
    if (available() == false) {
        return tl::unexpected(ConnectionError::transport_unavailable());
    }
    auto checked = check_preconditions(target);
    if (!checked) {
        return tl::unexpected(checked.error());
    }

    auto endpoint = build_socket_endpoint(
        target.endpoint_base_url,
        *target.conversation_id,
        *target.auth_token
    );
    if (!endpoint) {
        return tl::unexpected(endpoint.error());
    }
    if (endpoint->secure && ssl_ready_ == false) {
        return tl::unexpected(ConnectionError::transport_unavailable());
    }

    RTCHAT_LOG_DEBUG(std::format("Opening {}", endpoint->redacted_url()));

    std::shared_ptr<ISocketSession> session;
    if (endpoint->secure) {
        session = std::make_shared<WebSocketSession<TlsStream>>(
            std::move(*endpoint), config_, std::move(sink), net::make_strand(io_), ssl_ctx_);
    } else {
        session = std::make_shared<WebSocketSession<PlainStream>>(
            std::move(*endpoint), config_, std::move(sink), net::make_strand(io_));
    }
    session->start();

    std::unique_ptr<IConnection> connection = std::make_unique<WebSocketConnection>(std::move(session));
    return connection;
}

}  // namespace rtchat
