#pragma once

#include <optional>
#include <string>

#include <boost/algorithm/string.hpp>

#include "abstract/StreamClient.hpp"

namespace pushfeed::venue {
    inline VenueId parseVenue(const std::string &raw) {
        const std::string v = boost::algorithm::to_lower_copy(raw);

        if (v == "binance") return VenueId::BINANCE;
        if (v == "bybit") return VenueId::BYBIT;
        if (v == "hyperliquid") return VenueId::HYPERLIQUID;
        return VenueId::UNKNOWN;
    }

    inline std::optional<FeedScope> parseScope(const std::string &raw) {
        const std::string s = boost::algorithm::to_lower_copy(raw);

        if (s == "public") return FeedScope::PUBLIC;
        if (s == "private") return FeedScope::PRIVATE;
        return std::nullopt;
    }

    /// Markets a venue understands; "" means the venue has a single one.
    inline bool isKnownMarket(VenueId venue, const std::string &market) {
        switch (venue) {
            case VenueId::BINANCE:
                return market == "spot" || market == "um" || market == "cm" || market == "pm";
            case VenueId::BYBIT:
                return market == "spot" || market == "linear" || market == "inverse" || market == "option";
            case VenueId::HYPERLIQUID:
                return true;
            default:
                return false;
        }
    }
} // namespace pushfeed::venue
