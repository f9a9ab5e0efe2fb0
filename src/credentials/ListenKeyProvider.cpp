#include "credentials/ListenKeyProvider.hpp"

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include "client_connection_handlers/RestClient.hpp"

namespace pushfeed {
    namespace http = boost::beast::http;
    using json = nlohmann::json;

    namespace {
        constexpr std::chrono::minutes kListenKeyValidity{60};

        Credential makeCredential(std::string key) {
            Credential c;
            c.value = std::move(key);
            c.issued_at = std::chrono::system_clock::now();
            c.validity = kListenKeyValidity;
            return c;
        }
    }

    ListenKeyProvider::ListenKeyProvider(boost::asio::io_context &ioc, EndPoint rest, std::string api_key,
                                         bool key_in_query, LogFn log)
        : ioc_(ioc),
          rest_(std::move(rest)),
          api_key_(std::move(api_key)),
          key_in_query_(key_in_query),
          log_(std::move(log)) {
    }

    std::string ListenKeyProvider::parseListenKey(std::string_view body) {
        const json j = json::parse(body.begin(), body.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) return {};
        const auto it = j.find("listenKey");
        if (it == j.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    EndPoint ListenKeyProvider::withKey_(const std::string &listen_key) const {
        EndPoint ep = rest_;
        if (key_in_query_) ep.target += "?listenKey=" + listen_key;
        return ep;
    }

    void ListenKeyProvider::acquire(CredentialCallback cb) {
        if (api_key_.empty()) {
            boost::asio::post(ioc_, [cb = std::move(cb)] {
                cb(make_error_code(boost::system::errc::invalid_argument), Credential{});
            });
            return;
        }

        auto client = RestClient::create(ioc_);
        client->set_logger(log_);
        client->async_request(http::verb::post, rest_, {}, {{"X-MBX-APIKEY", api_key_}},
                              [client, log = log_, cb = std::move(cb)](boost::system::error_code ec,
                                                                       std::string body) {
                                  if (ec) {
                                      if (log) log(LogLevel::WARN, "[ListenKey] create failed: " + ec.message() +
                                                                   " http=" + std::to_string(
                                                                       client->last_http_status()) + " " + body);
                                      cb(ec, Credential{});
                                      return;
                                  }

                                  std::string key = parseListenKey(body);
                                  if (key.empty()) {
                                      cb(make_error_code(boost::system::errc::bad_message), Credential{});
                                      return;
                                  }
                                  cb({}, makeCredential(std::move(key)));
                              });
    }

    void ListenKeyProvider::renew(const Credential &current, CredentialCallback cb) {
        auto client = RestClient::create(ioc_);
        client->set_logger(log_);
        client->async_request(http::verb::put, withKey_(current.value), {}, {{"X-MBX-APIKEY", api_key_}},
                              [client, log = log_, key = current.value, cb = std::move(cb)](
                          boost::system::error_code ec, std::string body) {
                                  if (ec) {
                                      if (log) log(LogLevel::WARN, "[ListenKey] keepalive failed: " + ec.message() +
                                                                   " http=" + std::to_string(
                                                                       client->last_http_status()) + " " + body);
                                      cb(ec, Credential{});
                                      return;
                                  }

                                  // futures echo the (possibly same) key, spot answers {}
                                  std::string echoed = parseListenKey(body);
                                  cb({}, makeCredential(echoed.empty() ? key : std::move(echoed)));
                              });
    }

    void ListenKeyProvider::revoke(const Credential &current, DoneCallback cb) {
        auto client = RestClient::create(ioc_);
        client->set_logger(log_);
        client->async_request(http::verb::delete_, withKey_(current.value), {}, {{"X-MBX-APIKEY", api_key_}},
                              [client, cb = std::move(cb)](boost::system::error_code ec, std::string) {
                                  if (cb) cb(ec);
                              });
    }
} // namespace pushfeed
