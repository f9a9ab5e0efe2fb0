#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "pushfeed/VenueAdapter.hpp"

using namespace pushfeed;
using json = nlohmann::json;

namespace {
    StreamConfig config(VenueId venue, FeedScope scope, std::string market = "spot") {
        StreamConfig cfg;
        cfg.venue = venue;
        cfg.scope = scope;
        cfg.market = std::move(market);
        return cfg;
    }
}

// ------------------------------------------------------------------ Binance

TEST(BinanceAdapterTest, PublicEndpointsPerMarket) {
    BinanceAdapter a;

    auto spot = a.endpoint(config(VenueId::BINANCE, FeedScope::PUBLIC), nullptr);
    EXPECT_EQ(spot.host, "stream.binance.com");
    EXPECT_EQ(spot.port, "9443");
    EXPECT_EQ(spot.target, "/stream");

    auto um = a.endpoint(config(VenueId::BINANCE, FeedScope::PUBLIC, "um"), nullptr);
    EXPECT_EQ(um.host, "fstream.binance.com");
    EXPECT_EQ(um.port, "443");

    auto cfg = config(VenueId::BINANCE, FeedScope::PUBLIC, "cm");
    cfg.testnet = true;
    EXPECT_EQ(a.endpoint(cfg, nullptr).host, "dstream.binancefuture.com");

    EXPECT_EQ(a.caps(config(VenueId::BINANCE, FeedScope::PUBLIC)).control_rate_per_sec, 5u);
    EXPECT_EQ(a.caps(config(VenueId::BINANCE, FeedScope::PUBLIC, "um")).control_rate_per_sec, 10u);
}

TEST(BinanceAdapterTest, PrivateTargetCarriesListenKey) {
    BinanceAdapter a;
    Credential cred;
    cred.value = "abc123";

    auto cfg = config(VenueId::BINANCE, FeedScope::PRIVATE, "um");
    EXPECT_EQ(a.endpoint(cfg, &cred).target, "/ws/abc123");

    cfg.market = "pm";
    EXPECT_EQ(a.endpoint(cfg, &cred).target, "/pm/ws/abc123");

    const auto caps = a.caps(cfg);
    EXPECT_FALSE(caps.subscribe_ops);
    EXPECT_EQ(caps.auth, AuthMode::UrlCredential);

    EXPECT_EQ(a.credentialEndpoint(config(VenueId::BINANCE, FeedScope::PRIVATE, "um")).target, "/fapi/v1/listenKey");
    EXPECT_EQ(a.credentialEndpoint(config(VenueId::BINANCE, FeedScope::PRIVATE)).target, "/api/v3/userDataStream");
}

TEST(BinanceAdapterTest, ValidatesAndNamesChannels) {
    BinanceAdapter a;

    EXPECT_TRUE(a.validate(Topic{"aggTrade", "BTCUSDT"}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"aggTrade"}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"kline", "BTCUSDT"}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"depth", "BTCUSDT", {{"levels", "7"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"nonsense", "BTCUSDT"}, FeedScope::PUBLIC));
    EXPECT_TRUE(a.validate(Topic{"userData"}, FeedScope::PRIVATE));
    EXPECT_FALSE(a.validate(Topic{"aggTrade", "BTCUSDT"}, FeedScope::PRIVATE));

    EXPECT_EQ(a.channelFor(Topic{"aggTrade", "BTCUSDT"}), "btcusdt@aggTrade");
    EXPECT_EQ(a.channelFor(Topic{"depth", "BTCUSDT", {{"levels", "20"}, {"speed", "100ms"}}}),
              "btcusdt@depth20@100ms");
    EXPECT_EQ(a.channelFor(Topic{"kline", "ETHUSDT", {{"interval", "1m"}}}), "ethusdt@kline_1m");
}

TEST(BinanceAdapterTest, CanonicalSpellingAndUnusedParameters) {
    BinanceAdapter a;

    const Topic t = a.canonical(Topic{"AGGTRADE", "BtcUsdt"});
    EXPECT_EQ(t.kind, "aggTrade");
    EXPECT_EQ(t.symbol, "btcusdt");
    EXPECT_EQ(makeTopicKey(t), makeTopicKey(a.canonical(Topic{"aggTrade", "BTCUSDT"})));

    EXPECT_FALSE(a.validate(Topic{"aggTrade", "BTCUSDT", {{"x", "1"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"aggTrade", "BTCUSDT", {{"interval", "1m"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"kline", "BTCUSDT", {{"interval", "1m"}, {"levels", "5"}}}, FeedScope::PUBLIC));
    EXPECT_TRUE(a.validate(Topic{"markPrice", "BTCUSDT", {{"speed", "1s"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"depth", "BTCUSDT", {{"levels", ""}}}, FeedScope::PUBLIC));
}

TEST(BinanceAdapterTest, SubscribeFrame) {
    BinanceAdapter a;
    const auto frames = a.controlFrames(ControlOp::Subscribe,
                                        {Topic{"aggTrade", "BTCUSDT"}, Topic{"bookTicker", "ETHUSDT"}}, 7);
    ASSERT_EQ(frames.size(), 1u);

    const json j = json::parse(frames[0]);
    EXPECT_EQ(j["method"], "SUBSCRIBE");
    EXPECT_EQ(j["params"], json::array({"btcusdt@aggTrade", "ethusdt@bookTicker"}));
    EXPECT_EQ(j["id"], 7);
}

TEST(BinanceAdapterTest, ClassifiesFrames) {
    BinanceAdapter a;

    auto data = a.classify(R"({"stream":"btcusdt@aggTrade","data":{"p":"1"}})", FeedScope::PUBLIC);
    EXPECT_EQ(data.kind, FrameKind::Data);
    EXPECT_EQ(data.channel, "btcusdt@aggTrade");
    EXPECT_EQ(data.payload["p"], "1");

    auto ack = a.classify(R"({"result":null,"id":3})", FeedScope::PUBLIC);
    EXPECT_EQ(ack.kind, FrameKind::ControlAck);
    EXPECT_EQ(ack.request_id, "3");
    EXPECT_TRUE(ack.success);

    auto nack = a.classify(R"({"error":{"code":2,"msg":"Invalid request"},"id":4})", FeedScope::PUBLIC);
    EXPECT_EQ(nack.kind, FrameKind::ControlAck);
    EXPECT_FALSE(nack.success);
    EXPECT_EQ(nack.message, "Invalid request");

    auto expired = a.classify(R"({"e":"listenKeyExpired","E":1})", FeedScope::PRIVATE);
    EXPECT_EQ(expired.kind, FrameKind::CredentialExpired);

    auto account = a.classify(R"({"e":"ORDER_TRADE_UPDATE","E":1})", FeedScope::PRIVATE);
    EXPECT_EQ(account.kind, FrameKind::Data);
    EXPECT_EQ(account.channel, "userData");

    EXPECT_EQ(a.classify("not json", FeedScope::PUBLIC).kind, FrameKind::Unknown);
}

// ------------------------------------------------------------------ Bybit

TEST(BybitAdapterTest, EndpointsAndCaps) {
    BybitAdapter a;

    auto pub = a.endpoint(config(VenueId::BYBIT, FeedScope::PUBLIC, "linear"), nullptr);
    EXPECT_EQ(pub.host, "stream.bybit.com");
    EXPECT_EQ(pub.target, "/v5/public/linear");

    auto priv_cfg = config(VenueId::BYBIT, FeedScope::PRIVATE);
    priv_cfg.testnet = true;
    auto priv = a.endpoint(priv_cfg, nullptr);
    EXPECT_EQ(priv.host, "stream-testnet.bybit.com");
    EXPECT_EQ(priv.target, "/v5/private");

    EXPECT_EQ(a.caps(priv_cfg).auth, AuthMode::AuthFrame);
    EXPECT_EQ(a.caps(priv_cfg).ping, PingMode::Text);
    EXPECT_EQ(a.caps(priv_cfg).max_topics_per_frame, 10u);
}

TEST(BybitAdapterTest, ChannelsAndValidation) {
    BybitAdapter a;

    EXPECT_EQ(a.channelFor(Topic{"orderbook", "btcusdt", {{"depth", "50"}}}), "orderbook.50.BTCUSDT");
    EXPECT_EQ(a.channelFor(Topic{"kline", "BTCUSDT", {{"interval", "5"}}}), "kline.5.BTCUSDT");
    EXPECT_EQ(a.channelFor(Topic{"publicTrade", "BTCUSDT"}), "publicTrade.BTCUSDT");
    EXPECT_EQ(a.channelFor(Topic{"position"}), "position");

    EXPECT_FALSE(a.validate(Topic{"orderbook", "BTCUSDT"}, FeedScope::PUBLIC));
    EXPECT_TRUE(a.validate(Topic{"position"}, FeedScope::PRIVATE));
    EXPECT_FALSE(a.validate(Topic{"position"}, FeedScope::PUBLIC));

    EXPECT_FALSE(a.validate(Topic{"publicTrade", "BTCUSDT", {{"depth", "50"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"orderbook", "BTCUSDT", {{"depth", "50"}, {"x", "1"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"position", "", {{"x", "1"}}}, FeedScope::PRIVATE));

    const Topic t = a.canonical(Topic{"PUBLICTRADE", "btcusdt"});
    EXPECT_EQ(t.kind, "publicTrade");
    EXPECT_EQ(t.symbol, "BTCUSDT");
}

TEST(BybitAdapterTest, AuthFrameCarriesSignedExpiry) {
    BybitAdapter a;
    Credential c;
    c.key_id = "KEY";
    c.value = "deadbeef";
    c.expires_ms = 1700000000000;

    const json j = json::parse(a.authFrame(c));
    EXPECT_EQ(j["op"], "auth");
    EXPECT_EQ(j["args"], json::array({"KEY", 1700000000000, "deadbeef"}));
}

TEST(BybitAdapterTest, ClassifiesFrames) {
    BybitAdapter a;

    auto snap = a.classify(R"({"topic":"orderbook.50.BTCUSDT","type":"snapshot","data":{"b":[],"a":[]}})",
                           FeedScope::PUBLIC);
    EXPECT_EQ(snap.kind, FrameKind::Data);
    EXPECT_EQ(snap.shape, PayloadShape::Snapshot);

    auto delta = a.classify(R"({"topic":"orderbook.50.BTCUSDT","type":"delta","data":{"b":[]}})", FeedScope::PUBLIC);
    EXPECT_EQ(delta.shape, PayloadShape::Delta);

    auto trade = a.classify(R"({"topic":"publicTrade.BTCUSDT","type":"snapshot","data":[]})", FeedScope::PUBLIC);
    EXPECT_EQ(trade.shape, PayloadShape::Full);

    EXPECT_EQ(a.classify(R"({"op":"pong"})", FeedScope::PRIVATE).kind, FrameKind::Pong);
    EXPECT_EQ(a.classify(R"({"success":true,"ret_msg":"pong","op":"ping"})", FeedScope::PUBLIC).kind,
              FrameKind::Pong);

    auto auth = a.classify(R"({"success":false,"ret_msg":"Params Error","op":"auth"})", FeedScope::PRIVATE);
    EXPECT_EQ(auth.kind, FrameKind::AuthResult);
    EXPECT_FALSE(auth.success);

    auto ack = a.classify(R"({"success":true,"ret_msg":"","op":"subscribe","req_id":"12"})", FeedScope::PUBLIC);
    EXPECT_EQ(ack.kind, FrameKind::ControlAck);
    EXPECT_EQ(ack.request_id, "12");
    EXPECT_TRUE(ack.success);
}

TEST(BybitAdapterTest, OrderbookDeltaSpec) {
    BybitAdapter a;
    const auto spec = a.deltaSpec("orderbook.50.BTCUSDT");
    ASSERT_NE(spec.find("b"), nullptr);
    EXPECT_TRUE(spec.find("b")->descending);
    EXPECT_FALSE(spec.find("a")->descending);
    EXPECT_TRUE(a.deltaSpec("tickers.BTCUSDT").level_fields.empty());
}

// ------------------------------------------------------------------ Hyperliquid

TEST(HyperliquidAdapterTest, OneSubscriptionPerFrame) {
    HyperliquidAdapter a;
    const auto frames = a.controlFrames(ControlOp::Subscribe,
                                        {Topic{"l2Book", "BTC"}, Topic{"candle", "ETH", {{"interval", "1m"}}}}, 1);
    ASSERT_EQ(frames.size(), 2u);

    const json first = json::parse(frames[0]);
    EXPECT_EQ(first["method"], "subscribe");
    EXPECT_EQ(first["subscription"]["type"], "l2Book");
    EXPECT_EQ(first["subscription"]["coin"], "BTC");

    const json second = json::parse(frames[1]);
    EXPECT_EQ(second["subscription"]["interval"], "1m");
}

TEST(HyperliquidAdapterTest, AckAndDataResolveToTheSameChannel) {
    HyperliquidAdapter a;
    const Topic book{"l2Book", "BTC"};
    const std::string channel = a.channelFor(book);
    EXPECT_EQ(channel, "l2Book:btc");

    auto ack = a.classify(
        R"({"channel":"subscriptionResponse","data":{"method":"subscribe","subscription":{"type":"l2Book","coin":"BTC"}}})",
        FeedScope::PUBLIC);
    EXPECT_EQ(ack.kind, FrameKind::ControlAck);
    EXPECT_TRUE(ack.success);
    EXPECT_EQ(ack.channel, channel);

    auto data = a.classify(R"({"channel":"l2Book","data":{"coin":"BTC","levels":[[],[]]}})", FeedScope::PUBLIC);
    EXPECT_EQ(data.kind, FrameKind::Data);
    EXPECT_EQ(data.channel, channel);

    auto trades = a.classify(R"({"channel":"trades","data":[{"coin":"ETH","px":"1"}]})", FeedScope::PUBLIC);
    EXPECT_EQ(trades.channel, "trades:eth");

    auto candle = a.classify(R"({"channel":"candle","data":{"s":"ETH","i":"1m"}})", FeedScope::PUBLIC);
    EXPECT_EQ(candle.channel, a.channelFor(Topic{"candle", "ETH", {{"interval", "1m"}}}));
}

TEST(HyperliquidAdapterTest, ValidationAndControl) {
    HyperliquidAdapter a;
    EXPECT_TRUE(a.validate(Topic{"allMids"}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"l2Book"}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"userFills"}, FeedScope::PUBLIC));
    EXPECT_TRUE(a.validate(Topic{"userFills", "", {{"user", "0xabc"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"l2Book", "BTC", {{"nSigFigs", "5"}}}, FeedScope::PUBLIC));
    EXPECT_FALSE(a.validate(Topic{"userFills", "", {{"user", "0xabc"}, {"coin", "BTC"}}}, FeedScope::PUBLIC));

    // coins keep their case, addresses do not
    const Topic book = a.canonical(Topic{"l2book", "kPEPE"});
    EXPECT_EQ(book.kind, "l2Book");
    EXPECT_EQ(book.symbol, "kPEPE");
    const Topic fills = a.canonical(Topic{"userFills", "", {{"user", "0xAbC"}}});
    EXPECT_EQ(fills.param("user"), "0xabc");
    EXPECT_EQ(a.channelFor(fills), a.channelFor(Topic{"userFills", "", {{"user", "0xABC"}}}));

    EXPECT_EQ(a.classify(R"({"channel":"pong"})", FeedScope::PUBLIC).kind, FrameKind::Pong);
    auto err = a.classify(R"({"channel":"error","data":"Invalid subscription"})", FeedScope::PUBLIC);
    EXPECT_EQ(err.kind, FrameKind::ControlAck);
    EXPECT_FALSE(err.success);
    EXPECT_EQ(json::parse(a.pingFrame())["method"], "ping");
}

TEST(VenueAdapterTest, UnknownVenueHasNoAdapter) {
    AnyAdapter adapter;
    EXPECT_FALSE(makeAdapter(VenueId::UNKNOWN, adapter));
    EXPECT_TRUE(makeAdapter(VenueId::HYPERLIQUID, adapter));
    EXPECT_TRUE(std::holds_alternative<HyperliquidAdapter>(adapter));
}
