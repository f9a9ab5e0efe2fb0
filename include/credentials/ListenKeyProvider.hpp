#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <string>

#include "client_connection_handlers/Transport.hpp"
#include "pushfeed/SessionCredential.hpp"
#include "utils/Logging.hpp"

namespace pushfeed {
    /**
     * Binance user-data listen keys over REST, authenticated by the X-MBX-APIKEY header.
     *   acquire : POST   <target>              -> {"listenKey": "..."}
     *   renew   : PUT    <target>              (keepalive; extends validity to 60 minutes)
     *   revoke  : DELETE <target>
     * Spot passes the key as a query parameter on PUT/DELETE; futures lines identify it by API key.
     */
    class ListenKeyProvider final : public ISessionCredentialProvider {
    public:
        ListenKeyProvider(boost::asio::io_context &ioc, EndPoint rest, std::string api_key, bool key_in_query,
                          LogFn log = {});

        void acquire(CredentialCallback cb) override;

        void renew(const Credential &current, CredentialCallback cb) override;

        void revoke(const Credential &current, DoneCallback cb) override;

        [[nodiscard]] bool renewable() const noexcept override { return true; }

        /// Extract "listenKey" from a response body; empty when absent.
        static std::string parseListenKey(std::string_view body);

    private:
        EndPoint withKey_(const std::string &listen_key) const;

        boost::asio::io_context &ioc_;
        EndPoint rest_;
        std::string api_key_;
        bool key_in_query_;
        LogFn log_;
    };
} // namespace pushfeed
