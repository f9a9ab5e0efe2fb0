#include "client_connection_handlers/WsClient.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ssl/error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h> // X509_check_host

namespace pushfeed {
    using tcp = boost::asio::ip::tcp;
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace ssl = boost::asio::ssl;

    WsClient::WsClient(boost::asio::io_context &ioc)
        : ioc_(ioc),
          strand_(ioc.get_executor()),
          ssl_ctx_(ssl::context::tls_client),
          ws_(ioc_, ssl_ctx_),
          resolver_(ioc_),
          connect_deadline_(ioc_) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);

        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::request_type &req) {
                req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " pushfeed-ws");
            }
        ));
    }

    void WsClient::set_on_open(OpenHandler h) { on_open_ = std::move(h); }
    void WsClient::set_on_raw_message(RawMessageHandler h) { on_raw_message_ = std::move(h); }
    void WsClient::set_on_pong(PongHandler h) { on_pong_ = std::move(h); }
    void WsClient::set_on_close(CloseHandler h) { on_close_ = std::move(h); }

    void WsClient::connect(const EndPoint &ep) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, ep]() mutable {
            if (self->closing_) return;

            self->host_ = std::move(ep.host);
            self->port_ = std::move(ep.port);
            self->target_ = std::move(ep.target);

            // Configure hostname verification for this host
            const std::string host_for_verify = self->host_;
            self->ws_.next_layer().set_verify_mode(ssl::verify_peer);
            self->ws_.next_layer().set_verify_callback(
                [host_for_verify](bool preverified, ssl::verify_context &ctx) {
                    if (!preverified) return false;

                    X509_STORE_CTX *sctx = ctx.native_handle();
                    if (X509_STORE_CTX_get_error_depth(sctx) != 0) return true;

                    X509 *cert = X509_STORE_CTX_get_current_cert(sctx);
                    if (!cert) return false;

                    return X509_check_host(cert, host_for_verify.c_str(), host_for_verify.size(),
                                           0, nullptr) == 1;
                }
            );

            self->emit_log_(LogLevel::DEBUG,
                            "[WsClient] connecting wss://" + self->host_ + ":" + self->port_ + self->target_);

            self->arm_connect_deadline_();
            self->do_resolve_();
        });
    }

    void WsClient::do_resolve_() {
        auto self = shared_from_this();
        resolver_.async_resolve(
            host_, port_,
            boost::asio::bind_executor(strand_,
                                       [self](const beast::error_code &ec, const tcp::resolver::results_type &results) {
                                           if (ec) return self->fail_(ec, "resolve");
                                           if (self->closing_) return;
                                           self->do_tcp_connect_(results);
                                       }
            )
        );
    }

    void WsClient::do_tcp_connect_(const tcp::resolver::results_type &results) {
        auto self = shared_from_this();

        boost::asio::async_connect(
            beast::get_lowest_layer(ws_), results,
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec, const tcp::endpoint &) {
                                           if (ec) return self->fail_(ec, "tcp_connect");

                                           // SNI
                                           if (!SSL_set_tlsext_host_name(
                                               self->ws_.next_layer().native_handle(), self->host_.c_str())) {
                                               const boost::system::error_code sni_ec{
                                                   static_cast<int>(::ERR_get_error()),
                                                   boost::asio::error::get_ssl_category()
                                               };
                                               return self->fail_(sni_ec, "sni");
                                           }

                                           self->do_tls_handshake_();
                                       }
            )
        );
    }

    void WsClient::do_tls_handshake_() {
        auto self = shared_from_this();
        ws_.next_layer().async_handshake(
            ssl::stream_base::client,
            boost::asio::bind_executor(strand_,
                                       [self](const beast::error_code &ec) {
                                           if (ec) return self->fail_(ec, "tls_handshake");
                                           self->do_ws_handshake_();
                                       }
            )
        );
    }

    void WsClient::do_ws_handshake_() {
        auto self = shared_from_this();

        ws_.async_handshake(
            host_, target_,
            boost::asio::bind_executor(strand_,
                                       [self](const beast::error_code &ec) {
                                           if (ec) return self->fail_(ec, "ws_handshake");

                                           self->disarm_connect_deadline_();

                                           self->ws_.text(true);
                                           self->opened_ = true;

                                           // Runs inside async_read, which keeps `self` alive.
                                           WsClient *raw = self.get();
                                           self->ws_.control_callback(
                                               [raw](websocket::frame_type kind, beast::string_view) {
                                                   if (kind != websocket::frame_type::pong) return;
                                                   if (raw->on_pong_) raw->on_pong_();
                                               });

                                           self->start_write_(); // flush frames queued before open

                                           if (self->on_open_) {
                                               try { self->on_open_(); } catch (const std::exception &e) {
                                                   self->emit_log_(LogLevel::ERROR,
                                                                   std::string("[WsClient] on_open threw: ") +
                                                                   e.what());
                                               }
                                           }

                                           self->do_read_();
                                       }
            )
        );
    }

    void WsClient::do_read_() {
        auto self = shared_from_this();

        ws_.async_read(
            buffer_,
            boost::asio::bind_executor(strand_,
                                       [self](const beast::error_code &ec, std::size_t /*bytes_transferred*/) {
                                           if (ec) {
                                               if (ec == websocket::error::closed) {
                                                   self->closing_ = true;
                                                   self->disarm_connect_deadline_();
                                                   self->close_socket_hard_();
                                                   self->notify_close_once_(ec);
                                                   return;
                                               }

                                               return self->fail_(ec, "read");
                                           }

                                           // Avoid repeated allocations by reusing message_ capacity.
                                           self->message_.assign(beast::buffers_to_string(self->buffer_.data()));
                                           self->buffer_.consume(self->buffer_.size());

                                           if (self->on_raw_message_) {
                                               try {
                                                   self->on_raw_message_(self->message_.data(), self->message_.size());
                                               } catch (const std::exception &e) {
                                                   self->emit_log_(LogLevel::ERROR,
                                                                   std::string("[WsClient] on_message threw: ") +
                                                                   e.what());
                                               }
                                           }

                                           if (self->closing_) return;
                                           self->do_read_();
                                       }
            )
        );
    }

    void WsClient::send_text(std::string text) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, text = std::move(text)]() mutable {
            if (self->closing_) return;

            self->outbox_.push_back(std::move(text));
            if (self->opened_) self->start_write_();
        });
    }

    void WsClient::send_ping() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            if (self->closing_ || !self->opened_ || self->ping_in_flight_) return;

            self->ping_in_flight_ = true;
            self->ws_.async_ping(
                websocket::ping_data{},
                boost::asio::bind_executor(self->strand_,
                                           [self](const beast::error_code &ec) {
                                               self->ping_in_flight_ = false;
                                               if (ec) return self->fail_(ec, "ping");
                                           }
                )
            );
        });
    }

    void WsClient::start_write_() {
        // strand-only
        if (write_in_flight_) return;
        if (outbox_.empty()) return;
        do_write_();
    }

    void WsClient::do_write_() {
        // strand-only
        if (outbox_.empty()) return;
        write_in_flight_ = true;

        auto self = shared_from_this();
        ws_.async_write(
            boost::asio::buffer(outbox_.front()),
            boost::asio::bind_executor(strand_,
                                       [self](const beast::error_code &ec, std::size_t) {
                                           self->write_in_flight_ = false;

                                           if (ec) return self->fail_(ec, "write");

                                           self->outbox_.pop_front();
                                           self->start_write_();
                                       }
            )
        );
    }

    void WsClient::close() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            if (self->closing_) return;
            self->closing_ = true;
            self->outbox_.clear();

            const boost::system::error_code aborted = boost::asio::error::operation_aborted;

            // If not opened yet, just hard-close.
            if (!self->opened_) {
                self->disarm_connect_deadline_();
                self->resolver_.cancel();
                self->close_socket_hard_();
                self->notify_close_once_(aborted);
                return;
            }

            self->ws_.async_close(
                websocket::close_code::normal,
                boost::asio::bind_executor(self->strand_,
                                           [self, aborted](const beast::error_code &ec) {
                                               if (ec) {
                                                   self->emit_log_(LogLevel::DEBUG,
                                                                   "[WsClient] close: " + ec.message());
                                               }
                                               self->close_socket_hard_();
                                               self->notify_close_once_(aborted);
                                           }
                )
            );
        });
    }

    void WsClient::arm_connect_deadline_() {
        connect_deadline_.expires_after(connect_timeout_);
        auto self = shared_from_this();
        connect_deadline_.async_wait(
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec) {
                                           if (ec) return; // canceled
                                           self->fail_(make_error_code(boost::system::errc::timed_out),
                                                       "connect_timeout");
                                       }
            )
        );
    }

    void WsClient::disarm_connect_deadline_() {
        connect_deadline_.cancel();
    }

    void WsClient::fail_(boost::system::error_code ec, std::string_view where) {
        // strand-only
        if (logger_) {
            std::string msg;
            msg.reserve(64 + where.size());
            msg += "[WsClient] ";
            msg += where;
            msg += ": ";
            msg += ec.message();
            emit_log_(LogLevel::WARN, msg);
        }

        if (closing_) {
            notify_close_once_(ec);
            return;
        }
        closing_ = true;
        outbox_.clear();

        disarm_connect_deadline_();
        resolver_.cancel();

        // Hard-close the socket; no attempt to be graceful on error paths.
        close_socket_hard_();
        notify_close_once_(ec);
    }

    void WsClient::notify_close_once_(boost::system::error_code ec) {
        if (close_notified_.exchange(true, std::memory_order_acq_rel)) return;

        if (on_close_) {
            try { on_close_(ec); } catch (const std::exception &e) {
                emit_log_(LogLevel::ERROR, std::string("[WsClient] on_close threw: ") + e.what());
            }
        }
    }

    void WsClient::close_socket_hard_() noexcept {
        boost::system::error_code ignored;
        auto &sock = beast::get_lowest_layer(ws_);
        sock.cancel(ignored);
        sock.close(ignored);
    }
} // namespace pushfeed
