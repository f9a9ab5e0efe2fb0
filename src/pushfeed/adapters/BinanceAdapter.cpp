#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

#include "pushfeed/VenueAdapter.hpp"

using json = nlohmann::json;

/// https://developers.binance.com/docs/binance-spot-api-docs/web-socket-streams
namespace pushfeed {
    namespace {
        bool isFutures(const StreamConfig &cfg) {
            return cfg.market == "um" || cfg.market == "cm" || cfg.market == "pm";
        }

        constexpr std::array<std::string_view, 10> kKinds{
            "aggTrade", "trade", "kline", "miniTicker", "ticker", "bookTicker", "depth", "markPrice", "forceOrder",
            "userData"
        };

        bool isKnownPublicKind(const std::string &kind) {
            return kind != "userData" &&
                   std::find(kKinds.begin(), kKinds.end(), kind) != kKinds.end();
        }

        bool onlyParams(const Topic &t, std::initializer_list<std::string_view> allowed) {
            for (const auto &[name, value]: t.params) {
                if (value.empty()) return false;
                if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) return false;
            }
            return true;
        }

        std::string requestIdOf(const json &id) {
            if (id.is_number_unsigned()) return std::to_string(id.get<std::uint64_t>());
            if (id.is_number_integer()) return std::to_string(id.get<std::int64_t>());
            if (id.is_string()) return id.get<std::string>();
            return {};
        }
    }

    VenueCaps BinanceAdapter::caps(const StreamConfig &cfg) const noexcept {
        VenueCaps c;
        c.ping = PingMode::Control;
        c.control_rate_per_sec = isFutures(cfg) ? 10 : 5;
        c.max_topics_per_frame = 200;

        if (cfg.scope == FeedScope::PRIVATE) {
            // user data stream: one account-wide stream, nothing to subscribe
            c.subscribe_ops = false;
            c.auth = AuthMode::UrlCredential;
            c.ping_interval = std::chrono::milliseconds(180000);
            c.ping_timeout = std::chrono::milliseconds(600000);
        } else {
            c.ping_interval = std::chrono::milliseconds(15000);
            c.ping_timeout = std::chrono::milliseconds(20000);
        }
        return c;
    }

    /**
     * - Public : combined stream "/stream", topics are added with SUBSCRIBE frames
     * - Private: "/ws/<listenKey>" ("/pm/ws/<listenKey>" for portfolio margin)
     */
    EndPoint BinanceAdapter::endpoint(const StreamConfig &cfg, const Credential *cred) const {
        EndPoint e;

        if (cfg.market == "um" || cfg.market == "pm") {
            e.host = cfg.testnet ? "stream.binancefuture.com" : "fstream.binance.com";
            e.port = "443";
        } else if (cfg.market == "cm") {
            e.host = cfg.testnet ? "dstream.binancefuture.com" : "dstream.binance.com";
            e.port = "443";
        } else {
            e.host = cfg.testnet ? "stream.testnet.binance.vision" : "stream.binance.com";
            e.port = cfg.testnet ? "443" : "9443";
        }

        if (!cfg.ws_host.empty()) e.host = cfg.ws_host;
        if (!cfg.ws_port.empty()) e.port = cfg.ws_port;

        if (cfg.scope == FeedScope::PRIVATE) {
            const std::string prefix = !cfg.ws_path.empty() ? cfg.ws_path : (cfg.market == "pm" ? "/pm/ws" : "/ws");
            e.target = prefix + "/" + (cred ? cred->value : std::string{});
        } else {
            e.target = cfg.ws_path.empty() ? "/stream" : cfg.ws_path;
        }
        return e;
    }

    /// Listen key REST side channel (POST create, PUT keepalive, DELETE close).
    EndPoint BinanceAdapter::credentialEndpoint(const StreamConfig &cfg) const {
        EndPoint e;
        e.port = "443";

        if (cfg.market == "um") {
            e.host = cfg.testnet ? "testnet.binancefuture.com" : "fapi.binance.com";
            e.target = "/fapi/v1/listenKey";
        } else if (cfg.market == "cm") {
            e.host = cfg.testnet ? "testnet.binancefuture.com" : "dapi.binance.com";
            e.target = "/dapi/v1/listenKey";
        } else if (cfg.market == "pm") {
            e.host = "papi.binance.com";
            e.target = "/papi/v1/listenKey";
        } else {
            e.host = cfg.testnet ? "testnet.binance.vision" : "api.binance.com";
            e.target = "/api/v3/userDataStream";
        }

        if (!cfg.rest_host.empty()) e.host = cfg.rest_host;
        if (!cfg.rest_port.empty()) e.port = cfg.rest_port;
        return e;
    }

    /// Stream names are lowercase symbol + camelCase kind: "BTCUSDT"/"aggtrade" -> "btcusdt"/"aggTrade".
    Topic BinanceAdapter::canonical(Topic t) const {
        for (const auto kind: kKinds) {
            if (boost::algorithm::iequals(t.kind, std::string(kind))) {
                t.kind = std::string(kind);
                break;
            }
        }
        boost::algorithm::to_lower(t.symbol);
        return t;
    }

    bool BinanceAdapter::validate(const Topic &t, FeedScope scope) const noexcept {
        if (scope == FeedScope::PRIVATE) return t.kind == "userData" && t.symbol.empty() && t.params.empty();

        if (t.symbol.empty() || !isKnownPublicKind(t.kind)) return false;
        if (t.kind == "kline") return onlyParams(t, {"interval"}) && !t.param("interval").empty();
        if (t.kind == "depth") {
            const std::string levels = t.param("levels");
            if (!levels.empty() && levels != "5" && levels != "10" && levels != "20") return false;
            return onlyParams(t, {"levels", "speed"});
        }
        if (t.kind == "markPrice") return onlyParams(t, {"speed"});
        return t.params.empty();
    }

    /**
     * Stream name as Binance echoes it in "stream":
     *   depth  : btcusdt@depth20@100ms
     *   kline  : btcusdt@kline_1m
     *   others : btcusdt@aggTrade
     */
    std::string BinanceAdapter::channelFor(const Topic &t) const {
        if (t.kind == "userData") return "userData";

        std::string ch = boost::algorithm::to_lower_copy(t.symbol) + "@" + t.kind;
        if (t.kind == "depth") ch += t.param("levels");
        const std::string interval = t.param("interval");
        if (!interval.empty()) ch += "_" + interval;
        const std::string speed = t.param("speed");
        if (!speed.empty()) ch += "@" + speed;
        return ch;
    }

    std::vector<std::string> BinanceAdapter::controlFrames(ControlOp op, const std::vector<Topic> &topics,
                                                           std::uint64_t request_id) const {
        if (topics.empty()) return {};

        json params = json::array();
        for (const auto &t: topics) params.push_back(channelFor(t));

        json j;
        j["method"] = op == ControlOp::Subscribe ? "SUBSCRIBE" : "UNSUBSCRIBE";
        j["params"] = std::move(params);
        j["id"] = request_id;
        return {j.dump()};
    }

    InboundFrame BinanceAdapter::classify(std::string_view msg, FeedScope scope) const noexcept {
        InboundFrame f;

        try {
            json j = json::parse(msg.begin(), msg.end(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) return f;

            if (scope == FeedScope::PRIVATE) {
                const std::string event = j.value("e", "");
                if (event == "listenKeyExpired") {
                    f.kind = FrameKind::CredentialExpired;
                    f.message = "listen key expired";
                    return f;
                }
                if (event.empty()) return f;

                f.kind = FrameKind::Data;
                f.channel = "userData";
                f.payload = std::move(j);
                return f;
            }

            if (j.contains("stream") && j.contains("data")) {
                f.kind = FrameKind::Data;
                f.channel = j["stream"].get<std::string>();
                f.payload = std::move(j["data"]);
                return f;
            }

            // {"result":null,"id":N} / {"error":{"code":..,"msg":..},"id":N}
            if (j.contains("id") && (j.contains("result") || j.contains("error"))) {
                f.kind = FrameKind::ControlAck;
                f.request_id = requestIdOf(j["id"]);
                f.success = !j.contains("error");
                if (!f.success) {
                    const auto &err = j["error"];
                    f.message = err.is_object() ? err.value("msg", err.dump()) : err.dump();
                }
                return f;
            }
        } catch (const std::exception &e) {
            f = InboundFrame{};
            f.message = e.what();
        }
        return f;
    }
} // namespace pushfeed
