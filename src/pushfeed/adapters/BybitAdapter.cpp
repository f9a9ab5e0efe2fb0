#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

#include "pushfeed/VenueAdapter.hpp"

using json = nlohmann::json;

/// https://bybit-exchange.github.io/docs/v5/websocket/public/orderbook
namespace pushfeed {
    namespace {
        bool isPrivateKind(const std::string &kind) {
            return kind == "position" || kind == "execution" || kind == "execution.fast" || kind == "order" ||
                   kind == "wallet" || kind == "greeks";
        }

        bool isPublicKind(const std::string &kind) {
            return kind == "orderbook" || kind == "tickers" || kind == "publicTrade" || kind == "kline" ||
                   kind == "liquidation" || kind == "allLiquidation";
        }

        constexpr std::array<std::string_view, 12> kKinds{
            "orderbook", "tickers", "publicTrade", "kline", "liquidation", "allLiquidation",
            "position", "execution", "execution.fast", "order", "wallet", "greeks"
        };

        bool onlyParams(const Topic &t, std::initializer_list<std::string_view> allowed) {
            for (const auto &[name, value]: t.params) {
                if (value.empty()) return false;
                if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) return false;
            }
            return true;
        }

        // Channels Bybit publishes as snapshot + delta.
        bool isDeltaChannel(std::string_view channel) {
            return channel.starts_with("orderbook.") || channel.starts_with("tickers.");
        }
    }

    VenueCaps BybitAdapter::caps(const StreamConfig &cfg) const noexcept {
        VenueCaps c;
        c.subscribe_ops = true;
        c.auth = cfg.scope == FeedScope::PRIVATE ? AuthMode::AuthFrame : AuthMode::None;
        c.ping = PingMode::Text;
        c.control_rate_per_sec = 10;
        c.max_topics_per_frame = 10;
        c.ping_interval = std::chrono::milliseconds(20000);
        c.ping_timeout = std::chrono::milliseconds(10000);
        return c;
    }

    EndPoint BybitAdapter::endpoint(const StreamConfig &cfg, const Credential *) const {
        EndPoint e;
        e.host = cfg.ws_host.empty() ? (cfg.testnet ? "stream-testnet.bybit.com" : "stream.bybit.com") : cfg.ws_host;
        e.port = cfg.ws_port.empty() ? "443" : cfg.ws_port;

        if (!cfg.ws_path.empty()) {
            e.target = cfg.ws_path;
        } else if (cfg.scope == FeedScope::PRIVATE) {
            e.target = "/v5/private";
        } else {
            e.target = "/v5/public/" + cfg.market; // spot | linear | inverse | option
        }
        return e;
    }

    /// Topics carry uppercase symbols: "btcusdt" -> "BTCUSDT".
    Topic BybitAdapter::canonical(Topic t) const {
        for (const auto kind: kKinds) {
            if (boost::algorithm::iequals(t.kind, std::string(kind))) {
                t.kind = std::string(kind);
                break;
            }
        }
        boost::algorithm::to_upper(t.symbol);
        return t;
    }

    bool BybitAdapter::validate(const Topic &t, FeedScope scope) const noexcept {
        if (scope == FeedScope::PRIVATE) return isPrivateKind(t.kind) && t.symbol.empty() && t.params.empty();

        if (!isPublicKind(t.kind) || t.symbol.empty()) return false;
        if (t.kind == "orderbook") return onlyParams(t, {"depth"}) && !t.param("depth").empty();
        if (t.kind == "kline") return onlyParams(t, {"interval"}) && !t.param("interval").empty();
        return t.params.empty();
    }

    /**
     *   orderbook : orderbook.<depth>.<SYMBOL>
     *   kline     : kline.<interval>.<SYMBOL>
     *   others    : <kind>.<SYMBOL>, private topics by kind alone
     */
    std::string BybitAdapter::channelFor(const Topic &t) const {
        if (t.symbol.empty()) return t.kind;

        const std::string sym = boost::algorithm::to_upper_copy(t.symbol);
        if (t.kind == "orderbook") return "orderbook." + t.param("depth") + "." + sym;
        if (t.kind == "kline") return "kline." + t.param("interval") + "." + sym;
        return t.kind + "." + sym;
    }

    /// Topics are split into frames of at most 10 args; every frame shares the request id.
    std::vector<std::string> BybitAdapter::controlFrames(ControlOp op, const std::vector<Topic> &topics,
                                                         std::uint64_t request_id) const {
        constexpr std::size_t kArgsPerFrame = 10;

        std::vector<std::string> frames;
        for (std::size_t i = 0; i < topics.size(); i += kArgsPerFrame) {
            json args = json::array();
            for (std::size_t k = i; k < topics.size() && k < i + kArgsPerFrame; ++k) {
                args.push_back(channelFor(topics[k]));
            }

            json j;
            j["op"] = op == ControlOp::Subscribe ? "subscribe" : "unsubscribe";
            j["req_id"] = std::to_string(request_id);
            j["args"] = std::move(args);
            frames.push_back(j.dump());
        }
        return frames;
    }

    /// {"op":"auth","args":[api_key, expires_ms, signature]}
    std::string BybitAdapter::authFrame(const Credential &cred) const {
        json j;
        j["op"] = "auth";
        j["args"] = json::array({cred.key_id, cred.expires_ms, cred.value});
        return j.dump();
    }

    std::string BybitAdapter::pingFrame() const {
        return R"({"op":"ping"})";
    }

    std::string BybitAdapter::pongFrame() const {
        return R"({"op":"pong"})";
    }

    InboundFrame BybitAdapter::classify(std::string_view msg, FeedScope) const noexcept {
        InboundFrame f;

        try {
            json j = json::parse(msg.begin(), msg.end(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) return f;

            if (j.contains("topic")) {
                f.kind = FrameKind::Data;
                f.channel = j["topic"].get<std::string>();

                const std::string type = j.value("type", "");
                if (isDeltaChannel(f.channel) && type == "snapshot") f.shape = PayloadShape::Snapshot;
                else if (isDeltaChannel(f.channel) && type == "delta") f.shape = PayloadShape::Delta;
                else f.shape = PayloadShape::Full;

                f.payload = j.contains("data") ? std::move(j["data"]) : std::move(j);
                return f;
            }

            const std::string op = j.value("op", "");
            const std::string ret_msg = j.value("ret_msg", "");

            // public spot answers a ping with {"op":"ping","ret_msg":"pong"}; others with {"op":"pong"}
            if (ret_msg == "pong" || op == "pong") {
                f.kind = FrameKind::Pong;
                return f;
            }
            if (op == "ping" || ret_msg == "ping") {
                f.kind = FrameKind::Ping;
                return f;
            }

            if (op == "auth" || j.value("type", "") == "AUTH_RESP") {
                f.kind = FrameKind::AuthResult;
                f.success = j.value("success", false);
                f.message = ret_msg;
                return f;
            }

            if (op == "subscribe" || op == "unsubscribe") {
                f.kind = FrameKind::ControlAck;
                f.request_id = j.value("req_id", "");
                f.success = j.value("success", false);
                f.message = ret_msg;
                return f;
            }
        } catch (const std::exception &e) {
            f = InboundFrame{};
            f.message = e.what();
        }
        return f;
    }

    /// Orderbook: bids "b" best-first (descending), asks "a" ascending. Tickers: field overwrite.
    DeltaSpec BybitAdapter::deltaSpec(std::string_view channel) const {
        DeltaSpec spec;
        if (channel.starts_with("orderbook.")) {
            spec.level_fields.push_back(LevelField{"b", true, 0, 1});
            spec.level_fields.push_back(LevelField{"a", false, 0, 1});
        }
        return spec;
    }
} // namespace pushfeed
