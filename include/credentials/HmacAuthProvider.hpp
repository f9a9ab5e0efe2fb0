#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "pushfeed/SessionCredential.hpp"

namespace pushfeed {
    /**
     * Locally signed one-shot credentials for venues that authenticate with a frame
     * (Bybit V5: HMAC-SHA256(secret, "GET/realtime" + expires)).
     *
     * Every acquire() signs a fresh expiry; nothing goes over the network, so renew() is not
     * supported and revoke() completes immediately.
     */
    class HmacAuthProvider final : public ISessionCredentialProvider {
    public:
        using NowMsFn = std::function<std::int64_t()>;

        HmacAuthProvider(boost::asio::io_context &ioc, std::string api_key, std::string api_secret,
                         std::chrono::seconds validity, NowMsFn now_ms = {});

        void acquire(CredentialCallback cb) override;

        void renew(const Credential &current, CredentialCallback cb) override;

        void revoke(const Credential &current, DoneCallback cb) override;

        [[nodiscard]] bool renewable() const noexcept override { return false; }

        /// The string the venue expects to be signed for a given expiry.
        static std::string signaturePayload(std::int64_t expires_ms);

    private:
        boost::asio::io_context &ioc_;
        std::string api_key_;
        std::string api_secret_;
        std::chrono::seconds validity_;
        NowMsFn now_ms_;
    };
} // namespace pushfeed
