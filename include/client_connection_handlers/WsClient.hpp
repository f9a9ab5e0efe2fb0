#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "client_connection_handlers/Transport.hpp"
#include "utils/Logging.hpp"

namespace pushfeed {
    /**
     * TLS WebSocket transport (Beast over OpenSSL), one instance per connection attempt.
     *
     * - SNI + hostname verification against the system trust store
     * - connect deadline covering resolve, TCP, TLS and WS handshakes
     * - serialized outbox, frames sent before open are flushed after the handshake
     * - control pongs surfaced through on_pong
     */
    class WsClient : public ITransport, public std::enable_shared_from_this<WsClient> {
    public:
        static std::shared_ptr<WsClient> create(boost::asio::io_context &ioc) {
            return std::shared_ptr<WsClient>(new WsClient(ioc));
        }

        WsClient(const WsClient &) = delete;

        WsClient &operator=(const WsClient &) = delete;

        void set_on_open(OpenHandler h) override;

        void set_on_raw_message(RawMessageHandler h) override;

        void set_on_pong(PongHandler h) override;

        void set_on_close(CloseHandler h) override;

        void set_logger(LogFn fn) { logger_ = std::move(fn); }

        void set_connect_timeout(std::chrono::milliseconds t) { connect_timeout_ = t; }

        void connect(const EndPoint &ep) override;

        void send_text(std::string text) override;

        void send_ping() override;

        void close() override;

    private:
        explicit WsClient(boost::asio::io_context &ioc);

        void do_resolve_();

        void do_tcp_connect_(const boost::asio::ip::tcp::resolver::results_type &results);

        void do_tls_handshake_();

        void do_ws_handshake_();

        void do_read_();

        void start_write_();

        void do_write_();

        void arm_connect_deadline_();

        void disarm_connect_deadline_();

        void fail_(boost::system::error_code ec, std::string_view where);

        void notify_close_once_(boost::system::error_code ec);

        void close_socket_hard_() noexcept;

        void emit_log_(LogLevel level, std::string_view msg) {
            if (logger_) logger_(level, msg);
        }

    private:
        using tcp = boost::asio::ip::tcp;

        using websocket_stream =
        boost::beast::websocket::stream<
            boost::beast::ssl_stream<tcp::socket> >;

        boost::asio::io_context &ioc_;
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;

        boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};

        websocket_stream ws_;
        tcp::resolver resolver_;

        boost::beast::flat_buffer buffer_;
        std::string message_; // reused capacity for read payload

        std::string host_;
        std::string port_;
        std::string target_;

        bool closing_{false};
        std::atomic_bool close_notified_{false};
        bool opened_{false};

        std::deque<std::string> outbox_;
        bool write_in_flight_{false};
        bool ping_in_flight_{false};

        boost::asio::steady_timer connect_deadline_;
        std::chrono::milliseconds connect_timeout_{5000};

        OpenHandler on_open_;
        RawMessageHandler on_raw_message_;
        PongHandler on_pong_;
        CloseHandler on_close_;
        LogFn logger_;
    };
} // namespace pushfeed
