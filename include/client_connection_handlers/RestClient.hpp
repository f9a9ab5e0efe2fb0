// RestClient.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "client_connection_handlers/Transport.hpp"
#include "utils/Logging.hpp"

namespace pushfeed {
    /**
     * One-shot HTTPS client: resolve, connect, TLS (SNI + hostname check), write, read, shutdown.
     * One request in flight per instance; the callback fires exactly once on the client strand.
     * Non-2xx responses complete with errc::protocol_error and keep the body.
     */
    class RestClient : public std::enable_shared_from_this<RestClient> {
    public:
        using ResponseHandler = std::function<void(boost::system::error_code, std::string)>;
        using Headers = std::vector<std::pair<std::string, std::string> >;

        static std::shared_ptr<RestClient> create(boost::asio::io_context &ioc) {
            return std::shared_ptr<RestClient>(new RestClient(ioc));
        }

        RestClient(const RestClient &) = delete;

        RestClient &operator=(const RestClient &) = delete;

        void set_logger(LogFn fn) { logger_ = std::move(fn); }

        void async_request(boost::beast::http::verb method,
                           const EndPoint &ep,
                           std::string body,
                           Headers headers,
                           ResponseHandler cb);

        int last_http_status() const noexcept { return last_http_status_; }

        void set_timeout(std::chrono::milliseconds t) { timeout_ = t; }
        void set_shutdown_timeout(std::chrono::milliseconds t) { shutdown_timeout_ = t; }

        void set_limits(std::size_t max_header_bytes, std::size_t max_body_bytes) {
            max_header_bytes_ = max_header_bytes;
            max_body_bytes_ = max_body_bytes;
        }

    private:
        explicit RestClient(boost::asio::io_context &ioc);

        // Chain helpers (all executed on strand_)
        void do_resolve_();

        void do_tcp_connect_(const boost::asio::ip::tcp::resolver::results_type &results);

        void do_tls_handshake_();

        void do_http_request_();

        void do_http_read_();

        void do_tls_shutdown_();

        void fail_(boost::system::error_code ec);

        void finish_();

        void close_socket_hard_() noexcept;

        // deadlines
        void arm_deadline_();

        void arm_shutdown_deadline_();

        void emit_log_(LogLevel level, std::string_view msg) {
            if (logger_) logger_(level, msg);
        }

    private:
        boost::asio::io_context &ioc_;

        // Serialize *all* operations.
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;

        boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};
        boost::asio::ip::tcp::resolver resolver_;

        std::unique_ptr<boost::beast::ssl_stream<boost::asio::ip::tcp::socket> > stream_;

        boost::beast::flat_buffer buffer_;
        boost::beast::http::request<boost::beast::http::string_body> req_;
        std::unique_ptr<boost::beast::http::response_parser<boost::beast::http::string_body> > parser_;

        std::string host_;
        std::string port_;

        ResponseHandler cb_;

        std::atomic_bool in_flight_{false};
        bool shutting_down_{false};
        bool tls_handshook_{false};

        boost::system::error_code final_ec_;
        std::string response_body_;

        // bounded deadlines
        boost::asio::steady_timer deadline_;
        std::chrono::milliseconds timeout_{5000};

        boost::asio::steady_timer shutdown_deadline_;
        std::chrono::milliseconds shutdown_timeout_{200};

        // safety limits
        std::size_t max_header_bytes_{32 * 1024};
        std::size_t max_body_bytes_{1024 * 1024};

        int last_http_status_{0};

        LogFn logger_;
    };
} // namespace pushfeed
