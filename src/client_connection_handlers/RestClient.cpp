// RestClient.cpp
#include "client_connection_handlers/RestClient.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h> // X509_check_host

namespace pushfeed {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    RestClient::RestClient(boost::asio::io_context &ioc)
        : ioc_(ioc),
          strand_(ioc.get_executor()),
          ssl_ctx_(ssl::context::tls_client),
          resolver_(ioc_),
          deadline_(ioc_),
          shutdown_deadline_(ioc_) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    void RestClient::close_socket_hard_() noexcept {
        boost::system::error_code ignored;
        if (stream_) {
            auto &sock = beast::get_lowest_layer(*stream_);
            sock.cancel(ignored);
            sock.shutdown(tcp::socket::shutdown_both, ignored);
            sock.close(ignored);
        }
        tls_handshook_ = false;
    }

    void RestClient::async_request(http::verb method, const EndPoint &ep, std::string body, Headers headers,
                                   ResponseHandler cb) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, method, ep,
                                  body = std::move(body),
                                  headers = std::move(headers),
                                  cb = std::move(cb)]() mutable {
                                  if (self->in_flight_.exchange(true)) {
                                      if (cb) cb(make_error_code(boost::system::errc::operation_in_progress), {});
                                      return;
                                  }

                                  self->cb_ = std::move(cb);
                                  self->host_ = ep.host;
                                  self->port_ = ep.port;

                                  self->final_ec_.clear();
                                  self->response_body_.clear();
                                  self->shutting_down_ = false;
                                  self->last_http_status_ = 0;

                                  if (ep.target.empty() || ep.target[0] != '/') {
                                      self->final_ec_ = make_error_code(boost::system::errc::invalid_argument);
                                      self->finish_();
                                      return;
                                  }

                                  self->buffer_.consume(self->buffer_.size());
                                  self->parser_ = std::make_unique<http::response_parser<http::string_body> >();
                                  self->parser_->header_limit(self->max_header_bytes_);
                                  self->parser_->body_limit(self->max_body_bytes_);

                                  self->stream_ = std::make_unique<beast::ssl_stream<tcp::socket> >(
                                      self->ioc_, self->ssl_ctx_);
                                  self->stream_->set_verify_mode(ssl::verify_peer);

                                  // Hostname verification on leaf cert (depth 0)
                                  const std::string host_for_verify = self->host_;
                                  self->stream_->set_verify_callback(
                                      [host_for_verify](bool preverified, ssl::verify_context &ctx) {
                                          if (!preverified) return false;

                                          X509_STORE_CTX *sctx = ctx.native_handle();
                                          if (X509_STORE_CTX_get_error_depth(sctx) != 0) return true;

                                          X509 *cert = X509_STORE_CTX_get_current_cert(sctx);
                                          if (!cert) return false;

                                          return X509_check_host(cert, host_for_verify.c_str(),
                                                                 host_for_verify.size(), 0, nullptr) == 1;
                                      }
                                  );

                                  self->req_ = {};
                                  self->req_.version(11);
                                  self->req_.method(method);
                                  self->req_.target(ep.target);

                                  std::string host_hdr = self->host_;
                                  if (self->port_ != "443" && self->port_ != "80") host_hdr += ":" + self->port_;

                                  self->req_.set(http::field::host, host_hdr);
                                  self->req_.set(http::field::user_agent,
                                                 std::string(BOOST_BEAST_VERSION_STRING) + " pushfeed-rest");
                                  self->req_.set(http::field::accept_encoding, "identity");
                                  self->req_.set(http::field::connection, "close");
                                  for (auto &[name, value]: headers) self->req_.set(name, value);

                                  if (!body.empty()) {
                                      self->req_.set(http::field::content_type, "application/json");
                                      self->req_.body() = std::move(body);
                                  }
                                  self->req_.prepare_payload();

                                  self->arm_deadline_();
                                  self->do_resolve_();
                              });
    }

    void RestClient::fail_(boost::system::error_code ec) {
        // strand-only
        if (!in_flight_.load(std::memory_order_acquire)) return;
        if (final_ec_) return;
        final_ec_ = ec;

        // If we never established TLS, hard-close and finish immediately.
        if (!tls_handshook_) {
            close_socket_hard_();
            finish_();
            return;
        }

        do_tls_shutdown_();
    }

    void RestClient::finish_() {
        // strand-only, ensure single completion
        if (!in_flight_.exchange(false)) return;

        deadline_.cancel();
        shutdown_deadline_.cancel();
        close_socket_hard_();

        auto cb = std::move(cb_);
        cb_ = {};

        if (cb) {
            try { cb(final_ec_, std::move(response_body_)); } catch (const std::exception &e) {
                // Never allow user callback to unwind through Asio.
                emit_log_(LogLevel::ERROR, std::string("[RestClient] callback threw: ") + e.what());
            }
        }
    }

    void RestClient::do_resolve_() {
        auto self = shared_from_this();
        resolver_.async_resolve(
            host_, port_,
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec,
                                              const tcp::resolver::results_type &results) {
                                           if (ec) return self->fail_(ec);
                                           self->do_tcp_connect_(results);
                                       }
            )
        );
    }

    void RestClient::do_tcp_connect_(const tcp::resolver::results_type &results) {
        auto self = shared_from_this();

        boost::asio::async_connect(
            beast::get_lowest_layer(*stream_), results,
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec, const tcp::endpoint &) {
                                           if (ec) return self->fail_(ec);

                                           // SNI
                                           if (!SSL_set_tlsext_host_name(
                                               self->stream_->native_handle(), self->host_.c_str())) {
                                               const boost::system::error_code sni_ec{
                                                   static_cast<int>(::ERR_get_error()),
                                                   boost::asio::error::get_ssl_category()
                                               };
                                               return self->fail_(sni_ec);
                                           }

                                           self->do_tls_handshake_();
                                       }
            )
        );
    }

    void RestClient::do_tls_handshake_() {
        auto self = shared_from_this();
        stream_->async_handshake(
            ssl::stream_base::client,
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec) {
                                           if (ec) return self->fail_(ec);

                                           self->tls_handshook_ = true;
                                           self->do_http_request_();
                                       }
            )
        );
    }

    void RestClient::do_http_request_() {
        auto self = shared_from_this();
        http::async_write(
            *stream_, req_,
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec, std::size_t) {
                                           if (ec) return self->fail_(ec);
                                           self->do_http_read_();
                                       }
            )
        );
    }

    void RestClient::do_http_read_() {
        auto self = shared_from_this();

        http::async_read(
            *stream_, buffer_, *parser_,
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec, std::size_t) {
                                           if (ec) return self->fail_(ec);

                                           self->deadline_.cancel();

                                           auto &res = self->parser_->get();
                                           self->last_http_status_ = res.result_int();
                                           self->response_body_ = std::move(res.body());

                                           if (self->last_http_status_ < 200 || self->last_http_status_ >= 300) {
                                               // Preserve body (venues put error details there)
                                               self->final_ec_ = make_error_code(boost::system::errc::protocol_error);
                                           }

                                           self->do_tls_shutdown_();
                                       }
            )
        );
    }

    void RestClient::do_tls_shutdown_() {
        // strand-only
        if (!in_flight_.load(std::memory_order_acquire)) return;
        if (shutting_down_) return;
        shutting_down_ = true;

        arm_shutdown_deadline_();

        auto self = shared_from_this();
        stream_->async_shutdown(
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec) {
                                           self->shutdown_deadline_.cancel();

                                           // Many servers skip close_notify; EOF/truncated after a full read is fine.
                                           if (ec &&
                                               ec != boost::asio::error::eof &&
                                               ec != boost::asio::ssl::error::stream_truncated) {
                                               self->emit_log_(LogLevel::DEBUG,
                                                               "[RestClient] TLS shutdown: " + ec.message());
                                           }

                                           self->finish_();
                                       }
            )
        );
    }

    void RestClient::arm_deadline_() {
        deadline_.expires_after(timeout_);
        auto self = shared_from_this();

        deadline_.async_wait(
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec) {
                                           if (ec) return; // canceled

                                           // Cancel resolver + socket ops; this will abort pending handlers.
                                           boost::system::error_code ignored;
                                           self->resolver_.cancel();
                                           if (self->stream_) {
                                               beast::get_lowest_layer(*self->stream_).cancel(ignored);
                                           }

                                           self->fail_(make_error_code(boost::system::errc::timed_out));
                                       }
            )
        );
    }

    void RestClient::arm_shutdown_deadline_() {
        shutdown_deadline_.expires_after(shutdown_timeout_);
        auto self = shared_from_this();

        shutdown_deadline_.async_wait(
            boost::asio::bind_executor(strand_,
                                       [self](const boost::system::error_code &ec) {
                                           if (ec) return; // canceled
                                           if (!self->in_flight_.load(std::memory_order_acquire)) return;
                                           self->finish_();
                                       }
            )
        );
    }
} // namespace pushfeed
