#include "venue_factory.hpp"

#include "credentials/HmacAuthProvider.hpp"
#include "credentials/ListenKeyProvider.hpp"
#include "pushfeed/VenueAdapter.hpp"

namespace pushfeed {
    std::unique_ptr<ConnectionManager> VenueFactory::create(boost::asio::io_context &ioc, const StreamConfig &cfg,
                                                            StreamObserver observer) {
        if (cfg.venue == VenueId::UNKNOWN) {
            return nullptr; // unknown venue
        }

        auto mgr = std::make_unique<ConnectionManager>(ioc, std::move(observer));
        if (mgr->init(cfg) != Status::OK) {
            return nullptr; // invalid config or precondition failed
        }
        return mgr;
    }

    std::shared_ptr<ISessionCredentialProvider>
    VenueFactory::makeCredentialProvider(boost::asio::io_context &ioc, const StreamConfig &cfg, LogFn log) {
        if (cfg.scope != FeedScope::PRIVATE) return nullptr;

        switch (cfg.venue) {
            case VenueId::BINANCE: {
                if (cfg.api_key.empty()) return nullptr;
                const EndPoint rest = BinanceAdapter{}.credentialEndpoint(cfg);
                return std::make_shared<ListenKeyProvider>(ioc, rest, cfg.api_key, cfg.market == "spot",
                                                           std::move(log));
            }
            case VenueId::BYBIT:
                if (cfg.api_key.empty() || cfg.api_secret.empty()) return nullptr;
                return std::make_shared<HmacAuthProvider>(ioc, cfg.api_key, cfg.api_secret, cfg.auth_validity);

            default:
                return nullptr;
        }
    }
} // namespace pushfeed
