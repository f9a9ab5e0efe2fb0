#include "credentials/HmacAuthProvider.hpp"

#include <boost/asio/post.hpp>

#include "utils/Signing.hpp"

namespace pushfeed {
    namespace {
        std::int64_t systemNowMs() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    HmacAuthProvider::HmacAuthProvider(boost::asio::io_context &ioc, std::string api_key, std::string api_secret,
                                       std::chrono::seconds validity, NowMsFn now_ms)
        : ioc_(ioc),
          api_key_(std::move(api_key)),
          api_secret_(std::move(api_secret)),
          validity_(validity),
          now_ms_(now_ms ? std::move(now_ms) : NowMsFn(systemNowMs)) {
    }

    std::string HmacAuthProvider::signaturePayload(std::int64_t expires_ms) {
        return "GET/realtime" + std::to_string(expires_ms);
    }

    void HmacAuthProvider::acquire(CredentialCallback cb) {
        boost::system::error_code ec;
        Credential cred;

        if (api_key_.empty() || api_secret_.empty()) {
            ec = make_error_code(boost::system::errc::invalid_argument);
        } else {
            cred.key_id = api_key_;
            cred.expires_ms = now_ms_() + std::chrono::duration_cast<std::chrono::milliseconds>(validity_).count();
            cred.value = signing::hmacSha256Hex(api_secret_, signaturePayload(cred.expires_ms));
            cred.issued_at = std::chrono::system_clock::now();
            cred.validity = validity_;
            if (cred.value.empty()) ec = make_error_code(boost::system::errc::io_error);
        }

        boost::asio::post(ioc_, [cb = std::move(cb), ec, cred = std::move(cred)]() mutable {
            cb(ec, std::move(cred));
        });
    }

    void HmacAuthProvider::renew(const Credential &, CredentialCallback cb) {
        boost::asio::post(ioc_, [cb = std::move(cb)] {
            cb(make_error_code(boost::system::errc::operation_not_supported), Credential{});
        });
    }

    void HmacAuthProvider::revoke(const Credential &, DoneCallback cb) {
        boost::asio::post(ioc_, [cb = std::move(cb)] {
            if (cb) cb(boost::system::error_code{});
        });
    }
} // namespace pushfeed
