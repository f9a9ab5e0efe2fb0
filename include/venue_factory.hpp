#pragma once

#include <boost/asio/io_context.hpp>

#include <memory>

#include "abstract/StreamClient.hpp"
#include "pushfeed/ConnectionManager.hpp"
#include "pushfeed/SessionCredential.hpp"
#include "utils/Logging.hpp"

namespace pushfeed {
    class VenueFactory {
    public:
        /**
         * Create and initialize a connection manager for cfg.venue.
         * Returns nullptr if the venue is unknown or init() fails.
         *
         * Usage:
         *   auto mgr = VenueFactory::create(ioc, cfg);
         *   if (!mgr) { -handle error- }
         *   mgr->subscribe(...);
         *   mgr->start();
         */
        static std::unique_ptr<ConnectionManager>
        create(boost::asio::io_context &ioc, const StreamConfig &cfg, StreamObserver observer = {});

        /**
         * Session credential side channel of the venue's private feed.
         * Returns nullptr for public feeds, venues without one, or missing API keys.
         */
        static std::shared_ptr<ISessionCredentialProvider>
        makeCredentialProvider(boost::asio::io_context &ioc, const StreamConfig &cfg, LogFn log = {});
    };
} // namespace pushfeed
