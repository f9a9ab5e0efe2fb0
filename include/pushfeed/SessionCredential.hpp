#pragma once

#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pushfeed {
    /**
     * Short-lived credential required by private feeds.
     *  - listen-key venues : `value` is the key embedded in the connection target
     *  - signed-frame venues: `value` is the signature, `key_id` the API key, `expires_ms` the signed expiry
     */
    struct Credential {
        std::string value;
        std::string key_id;
        std::int64_t expires_ms{0};
        std::chrono::system_clock::time_point issued_at{};
        std::chrono::milliseconds validity{0}; ///< 0 = unknown / until revoked

        [[nodiscard]] bool empty() const noexcept { return value.empty(); }
    };

    /**
     * Out-of-band side channel that creates, extends and revokes session credentials.
     *
     * All operations complete asynchronously through the callback; an error code of zero means success.
     * Implementations must invoke the callback exactly once.
     */
    class ISessionCredentialProvider {
    public:
        using CredentialCallback = std::function<void(boost::system::error_code, Credential)>;
        using DoneCallback = std::function<void(boost::system::error_code)>;

        virtual ~ISessionCredentialProvider() = default;

        /// Create a new credential.
        virtual void acquire(CredentialCallback cb) = 0;

        /// Extend validity. May fail if the credential already expired.
        virtual void renew(const Credential &current, CredentialCallback cb) = 0;

        /// Best-effort cleanup on shutdown.
        virtual void revoke(const Credential &current, DoneCallback cb) = 0;

        /// True when renew() can extend a credential in place (listen keys); false for one-shot signatures.
        [[nodiscard]] virtual bool renewable() const noexcept = 0;
    };
} // namespace pushfeed
