#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

#include "pushfeed/VenueAdapter.hpp"

using json = nlohmann::json;

namespace pushfeed {
    namespace {
        using boost::algorithm::to_lower_copy;

        constexpr std::array<std::string_view, 12> kKinds{
            "allMids", "l2Book", "trades", "bbo", "activeAssetCtx", "candle", "userEvents", "orderUpdates",
            "userFills", "userFundings", "userNonFundingLedgerUpdates", "webData2"
        };

        bool onlyParams(const Topic &t, std::initializer_list<std::string_view> allowed) {
            for (const auto &[name, value]: t.params) {
                if (value.empty()) return false;
                if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) return false;
            }
            return true;
        }

        bool isCoinKind(const std::string &kind) {
            return kind == "l2Book" || kind == "trades" || kind == "bbo" || kind == "activeAssetCtx" ||
                   kind == "candle";
        }

        bool isUserKind(const std::string &kind) {
            return kind == "userEvents" || kind == "orderUpdates" || kind == "userFills" || kind == "userFundings" ||
                   kind == "userNonFundingLedgerUpdates" || kind == "webData2";
        }

        // Account-wide user streams carry no user in their frames; the identifier is the kind.
        bool isFixedUserKind(const std::string &kind) {
            return kind == "userEvents" || kind == "orderUpdates";
        }

        json subscriptionOf(const Topic &t) {
            json s;
            s["type"] = t.kind;
            if (isCoinKind(t.kind)) s["coin"] = t.symbol;
            if (t.kind == "candle") s["interval"] = t.param("interval");
            if (isUserKind(t.kind)) s["user"] = t.param("user");
            return s;
        }

        // Identifier of a subscription object as echoed in "subscriptionResponse".
        std::string identifierOfSubscription(const json &s) {
            const std::string type = s.value("type", "");
            if (type.empty()) return {};
            if (type == "allMids" || isFixedUserKind(type)) return type;
            if (type == "candle") {
                return "candle:" + to_lower_copy(s.value("coin", "")) + "," + s.value("interval", "");
            }
            if (isCoinKind(type)) return type + ":" + to_lower_copy(s.value("coin", ""));
            if (isUserKind(type)) return type + ":" + to_lower_copy(s.value("user", ""));
            return type;
        }

        // Identifier of a data frame, derived from its channel and payload.
        std::string identifierOfData(const std::string &channel, const json &data) {
            if (channel == "allMids") return "allMids";
            if (channel == "user") return "userEvents";
            if (channel == "orderUpdates") return "orderUpdates";

            if (channel == "l2Book" || channel == "bbo") return channel + ":" + to_lower_copy(data.value("coin", ""));
            if (channel == "activeAssetCtx" || channel == "activeSpotAssetCtx") {
                return "activeAssetCtx:" + to_lower_copy(data.value("coin", ""));
            }
            if (channel == "trades") {
                if (!data.is_array() || data.empty()) return {};
                return "trades:" + to_lower_copy(data[0].value("coin", ""));
            }
            if (channel == "candle") return "candle:" + to_lower_copy(data.value("s", "")) + "," + data.value("i", "");

            if (channel == "userFills" || channel == "userFundings" || channel == "userNonFundingLedgerUpdates" ||
                channel == "webData2") {
                return channel + ":" + to_lower_copy(data.value("user", ""));
            }
            return {};
        }
    }

    VenueCaps HyperliquidAdapter::caps(const StreamConfig &) const noexcept {
        VenueCaps c;
        c.subscribe_ops = true;
        c.auth = AuthMode::None; // user streams are keyed by address, no session credential
        c.ping = PingMode::Text;
        c.control_rate_per_sec = 10;
        c.max_topics_per_frame = 1;
        c.ping_interval = std::chrono::milliseconds(50000);
        c.ping_timeout = std::chrono::milliseconds(15000);
        return c;
    }

    EndPoint HyperliquidAdapter::endpoint(const StreamConfig &cfg, const Credential *) const {
        EndPoint e;
        e.host = cfg.ws_host.empty()
                     ? (cfg.testnet ? "api.hyperliquid-testnet.xyz" : "api.hyperliquid.xyz")
                     : cfg.ws_host;
        e.port = cfg.ws_port.empty() ? "443" : cfg.ws_port;
        e.target = cfg.ws_path.empty() ? "/ws" : cfg.ws_path;
        return e;
    }

    Topic HyperliquidAdapter::canonical(Topic t) const {
        for (const auto kind: kKinds) {
            if (boost::algorithm::iequals(t.kind, std::string(kind))) {
                t.kind = std::string(kind);
                break;
            }
        }
        const auto user = t.params.find("user");
        if (user != t.params.end()) boost::algorithm::to_lower(user->second);
        return t;
    }

    bool HyperliquidAdapter::validate(const Topic &t, FeedScope) const noexcept {
        if (t.kind == "allMids") return t.symbol.empty() && t.params.empty();
        if (t.kind == "candle") return !t.symbol.empty() && onlyParams(t, {"interval"}) && !t.param("interval").empty();
        if (isCoinKind(t.kind)) return !t.symbol.empty() && t.params.empty();
        if (isUserKind(t.kind)) return t.symbol.empty() && onlyParams(t, {"user"}) && !t.param("user").empty();
        return false;
    }

    /**
     *   allMids              : allMids
     *   l2Book / trades ...  : l2Book:btc
     *   candle               : candle:btc,1m
     *   userEvents           : userEvents
     *   userFills ...        : userFills:0xabc...
     */
    std::string HyperliquidAdapter::channelFor(const Topic &t) const {
        return identifierOfSubscription(subscriptionOf(t));
    }

    /// One subscription per frame; Hyperliquid does not echo request ids.
    std::vector<std::string> HyperliquidAdapter::controlFrames(ControlOp op, const std::vector<Topic> &topics,
                                                               std::uint64_t) const {
        std::vector<std::string> frames;
        frames.reserve(topics.size());
        for (const auto &t: topics) {
            json j;
            j["method"] = op == ControlOp::Subscribe ? "subscribe" : "unsubscribe";
            j["subscription"] = subscriptionOf(t);
            frames.push_back(j.dump());
        }
        return frames;
    }

    std::string HyperliquidAdapter::pingFrame() const {
        return R"({"method":"ping"})";
    }

    InboundFrame HyperliquidAdapter::classify(std::string_view msg, FeedScope) const noexcept {
        InboundFrame f;

        try {
            json j = json::parse(msg.begin(), msg.end(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) return f;

            const std::string channel = j.value("channel", "");
            if (channel.empty()) return f;

            if (channel == "pong") {
                f.kind = FrameKind::Pong;
                return f;
            }

            // {"channel":"subscriptionResponse","data":{"method":"subscribe","subscription":{...}}}
            if (channel == "subscriptionResponse") {
                f.kind = FrameKind::ControlAck;
                f.success = true;
                if (j.contains("data") && j["data"].is_object() && j["data"].contains("subscription")) {
                    f.channel = identifierOfSubscription(j["data"]["subscription"]);
                }
                return f;
            }

            if (channel == "error") {
                f.kind = FrameKind::ControlAck;
                f.success = false;
                f.message = j.contains("data") && j["data"].is_string() ? j["data"].get<std::string>() : j.dump();
                return f;
            }

            if (!j.contains("data")) return f;

            f.channel = identifierOfData(channel, j["data"]);
            if (f.channel.empty()) return f;

            f.kind = FrameKind::Data;
            f.shape = PayloadShape::Full;
            f.payload = std::move(j["data"]);
        } catch (const std::exception &e) {
            f = InboundFrame{};
            f.message = e.what();
        }
        return f;
    }
} // namespace pushfeed
