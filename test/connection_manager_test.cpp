#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "mocks/FakeTransport.h"
#include "mocks/MockCredentialProvider.h"
#include "pushfeed/ConnectionManager.hpp"

using namespace pushfeed;
using namespace std::chrono_literals;
using json = nlohmann::json;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (mgr) {
            mgr->stop();
            runFor(20ms);
            mgr.reset();
        }
    }

    static StreamConfig binancePublic() {
        StreamConfig cfg;
        cfg.venue = VenueId::BINANCE;
        cfg.scope = FeedScope::PUBLIC;
        cfg.market = "spot";
        cfg.reconnect_initial = 10ms;
        cfg.reconnect_max = 40ms;
        cfg.replay_batch_pause = 5ms;
        cfg.control_rate_per_sec = 100;
        cfg.ping_interval = 3600s;
        cfg.ping_timeout = 3600s;
        return cfg;
    }

    static StreamConfig hyperliquid() {
        StreamConfig cfg;
        cfg.venue = VenueId::HYPERLIQUID;
        cfg.scope = FeedScope::PUBLIC;
        cfg.reconnect_initial = 10ms;
        cfg.reconnect_max = 40ms;
        cfg.control_rate_per_sec = 100;
        cfg.ping_interval = 3600s;
        cfg.ping_timeout = 3600s;
        return cfg;
    }

    static StreamConfig bybitPrivate() {
        StreamConfig cfg;
        cfg.venue = VenueId::BYBIT;
        cfg.scope = FeedScope::PRIVATE;
        cfg.reconnect_initial = 10ms;
        cfg.reconnect_max = 40ms;
        cfg.ping_interval = 3600s;
        cfg.ping_timeout = 3600s;
        return cfg;
    }

    void make(const StreamConfig &cfg, std::shared_ptr<ISessionCredentialProvider> provider = nullptr) {
        StreamObserver obs;
        obs.log = [](LogLevel, std::string_view) {};
        obs.on_error = [this](ErrorKind kind, std::string_view msg) { errors.emplace_back(kind, std::string(msg)); };
        obs.on_state = [this](ConnectionState s) { states.push_back(s); };

        mgr = std::make_unique<ConnectionManager>(ioc, obs);
        ASSERT_EQ(mgr->init(cfg, std::move(provider), pool.factory()), Status::OK);
    }

    bool runUntil(const std::function<bool()> &pred, std::chrono::milliseconds timeout = 2000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            ioc.restart();
            ioc.run_for(2ms);
        }
        return true;
    }

    void runFor(std::chrono::milliseconds d) {
        ioc.restart();
        ioc.run_for(d);
    }

    bool ready() const { return mgr->state() == ConnectionState::READY; }

    std::size_t countErrors(ErrorKind kind) const {
        std::size_t n = 0;
        for (const auto &[k, msg]: errors) n += k == kind ? 1 : 0;
        return n;
    }

    /// Channels carried by SUBSCRIBE frames sent on `t`.
    static std::set<std::string> subscribedChannels(const test::FakeTransport &t) {
        std::set<std::string> out;
        for (const auto &f: t.sent) {
            const json j = json::parse(f);
            if (j.value("method", "") != "SUBSCRIBE") continue;
            for (const auto &p: j["params"]) out.insert(p.get<std::string>());
        }
        return out;
    }

    static std::size_t framesWithMethod(const test::FakeTransport &t, const std::string &method) {
        std::size_t n = 0;
        for (const auto &f: t.sent) {
            if (json::parse(f).value("method", "") == method) ++n;
        }
        return n;
    }

    /// Positive ack for every Binance control frame sent on `t`.
    static void ackAll(test::FakeTransport &t) {
        for (const auto &f: t.sent) {
            const json j = json::parse(f);
            if (!j.contains("id")) continue;
            t.inject(json{{"result", nullptr}, {"id", j["id"]}}.dump());
        }
    }

    static MessageHandler ignore() {
        return [](const StreamMessage &) {};
    }

    boost::asio::io_context ioc;
    test::FakeTransportPool pool{ioc};
    std::vector<std::pair<ErrorKind, std::string> > errors;
    std::vector<ConnectionState> states;
    std::unique_ptr<ConnectionManager> mgr;
};

// ------------------------------------------------------------------ lifecycle

TEST_F(ConnectionManagerTest, InitRejectsUnknownVenueAndBadBackoff) {
    ConnectionManager m(ioc, StreamObserver{[](LogLevel, std::string_view) {}, {}, {}});
    StreamConfig cfg = binancePublic();
    cfg.venue = VenueId::UNKNOWN;
    EXPECT_EQ(m.init(cfg, nullptr, pool.factory()), Status::ERROR);

    cfg = binancePublic();
    cfg.reconnect_max = 1ms;
    EXPECT_EQ(m.init(cfg, nullptr, pool.factory()), Status::ERROR);

    EXPECT_EQ(m.start(), Status::ERROR); // never initialized
}

TEST_F(ConnectionManagerTest, PrivateFeedWithoutCredentialsFailsInit) {
    ConnectionManager m(ioc, StreamObserver{[](LogLevel, std::string_view) {}, {}, {}});
    EXPECT_EQ(m.init(bybitPrivate(), nullptr, pool.factory()), Status::ERROR);
}

TEST_F(ConnectionManagerTest, ConnectsAndSubscribesRegisteredTopics) {
    make(binancePublic());
    std::vector<StreamMessage> got;
    ASSERT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, [&](const StreamMessage &m) { got.push_back(m); }),
              Status::OK);

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready() && pool.last() && !pool.last()->sent.empty(); }));

    auto t = pool.last();
    EXPECT_EQ(t->endpoint.host, "stream.binance.com");
    EXPECT_EQ(t->endpoint.target, "/stream");
    EXPECT_EQ(subscribedChannels(*t), std::set<std::string>{"btcusdt@aggTrade"});

    ackAll(*t);
    ASSERT_TRUE(runUntil([&] { return mgr->registry().isActive("aggtrade:btcusdt"); }));

    t->inject(R"({"stream":"btcusdt@aggTrade","data":{"p":"100.5","q":"2"}})");
    ASSERT_TRUE(runUntil([&] { return !got.empty(); }));
    EXPECT_EQ(got[0].key, "aggtrade:btcusdt");
    EXPECT_EQ(got[0].data["p"], "100.5");
    EXPECT_GT(got[0].recv_ts_ns, 0);

    EXPECT_THAT(states, ::testing::ElementsAre(ConnectionState::CONNECTING, ConnectionState::READY));
}

TEST_F(ConnectionManagerTest, SubscribeAndUnsubscribeWhileReady) {
    make(binancePublic());
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));
    auto t = pool.last();
    EXPECT_TRUE(t->sent.empty()); // nothing registered yet

    ASSERT_EQ(mgr->subscribe(Topic{"bookTicker", "ETHUSDT"}, ignore()), Status::OK);
    ASSERT_TRUE(runUntil([&] { return framesWithMethod(*t, "SUBSCRIBE") == 1; }));

    // same topic again only swaps the handler
    ASSERT_EQ(mgr->subscribe(Topic{"bookTicker", "ETHUSDT"}, ignore()), Status::OK);
    runFor(20ms);
    EXPECT_EQ(framesWithMethod(*t, "SUBSCRIBE"), 1u);

    ASSERT_EQ(mgr->unsubscribe(Topic{"bookTicker", "ETHUSDT"}), Status::OK);
    ASSERT_TRUE(runUntil([&] { return framesWithMethod(*t, "UNSUBSCRIBE") == 1; }));
    EXPECT_FALSE(mgr->registry().contains("bookticker:ethusdt"));
}

TEST_F(ConnectionManagerTest, InvalidAndUnknownTopicsAreRefused) {
    make(binancePublic());

    EXPECT_EQ(mgr->subscribe(Topic{"aggTrade"}, ignore()), Status::INVALID_TOPIC);
    EXPECT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, nullptr), Status::ERROR);
    EXPECT_EQ(mgr->unsubscribe(Topic{"aggTrade", "BTCUSDT"}), Status::UNKNOWN_TOPIC);
    EXPECT_EQ(mgr->unsubscribe(Topic{"nonsense", "BTCUSDT"}), Status::INVALID_TOPIC);
    EXPECT_TRUE(mgr->registry().empty());
}

TEST_F(ConnectionManagerTest, SpellingsOfOneTopicShareOneSubscription) {
    make(binancePublic());
    int first = 0, second = 0;

    ASSERT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, [&](const StreamMessage &) { ++first; }), Status::OK);
    // a parameter the stream name does not carry would alias btcusdt@aggTrade
    EXPECT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT", {{"x", "1"}}}, ignore()), Status::INVALID_TOPIC);
    ASSERT_EQ(mgr->subscribe(Topic{"AGGTRADE", "btcusdt"}, [&](const StreamMessage &) { ++second; }), Status::OK);
    EXPECT_EQ(mgr->unsubscribe(Topic{"aggTrade", "BTCUSDT", {{"x", "1"}}}), Status::INVALID_TOPIC);
    EXPECT_EQ(mgr->registry().size(), 1u);

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready() && pool.last() && !pool.last()->sent.empty(); }));
    auto t = pool.last();
    ASSERT_EQ(t->sent.size(), 1u);
    EXPECT_EQ(json::parse(t->sent.front())["params"], json::array({"btcusdt@aggTrade"}));

    ackAll(*t);
    t->inject(R"({"stream":"btcusdt@aggTrade","data":{"p":"1"}})");
    ASSERT_TRUE(runUntil([&] { return second == 1; }));
    EXPECT_EQ(first, 0);
    EXPECT_EQ(framesWithMethod(*t, "UNSUBSCRIBE"), 0u);
    EXPECT_EQ(mgr->stats().dispatch.unroutable, 0u);
}

TEST_F(ConnectionManagerTest, UserAddressesMatchRegardlessOfCase) {
    make(hyperliquid());
    int calls = 0;

    ASSERT_EQ(mgr->subscribe(Topic{"userFills", "", {{"user", "0xAbCdEf01"}}},
                             [&](const StreamMessage &) { ++calls; }), Status::OK);
    ASSERT_EQ(mgr->subscribe(Topic{"userFills", "", {{"user", "0xABCDEF01"}}},
                             [&](const StreamMessage &) { ++calls; }), Status::OK);
    EXPECT_EQ(mgr->registry().size(), 1u);
    EXPECT_TRUE(mgr->registry().contains("userfills,user=0xabcdef01"));

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready() && pool.last() && !pool.last()->sent.empty(); }));
    auto t = pool.last();
    ASSERT_EQ(t->sent.size(), 1u);
    const json frame = json::parse(t->sent.front());
    EXPECT_EQ(frame["method"], "subscribe");
    EXPECT_EQ(frame["subscription"]["user"], "0xabcdef01");

    t->inject(R"({"channel":"userFills","data":{"user":"0xABCDEF01","isSnapshot":true,"fills":[]}})");
    ASSERT_TRUE(runUntil([&] { return calls == 1; }));

    ASSERT_EQ(mgr->unsubscribe(Topic{"userfills", "", {{"user", "0xabcdef01"}}}), Status::OK);
    ASSERT_TRUE(runUntil([&] { return t->sent.size() == 2; }));
    EXPECT_EQ(json::parse(t->sent.back())["method"], "unsubscribe");
    EXPECT_TRUE(mgr->registry().empty());
}

// ------------------------------------------------------------------ replay

TEST_F(ConnectionManagerTest, ReplaysEveryTopicInBatchesAfterDisconnect) {
    make(binancePublic());

    std::set<std::string> expected;
    for (int i = 0; i < 450; ++i) {
        const Topic t{"aggTrade", "SYM" + std::to_string(i)};
        ASSERT_EQ(mgr->subscribe(t, ignore()), Status::OK);
        expected.insert("sym" + std::to_string(i) + "@aggTrade");
    }

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return pool.last() && framesWithMethod(*pool.last(), "SUBSCRIBE") == 3; }));
    auto first = pool.last();
    EXPECT_EQ(subscribedChannels(*first), expected);

    ackAll(*first);
    ASSERT_TRUE(runUntil([&] { return mgr->registry().isActive("aggtrade:sym449"); }));

    first->drop();
    ASSERT_TRUE(runUntil([&] {
        return pool.created.size() == 2 && framesWithMethod(*pool.last(), "SUBSCRIBE") == 3;
    }));

    auto second = pool.last();
    EXPECT_EQ(subscribedChannels(*second), expected);
    // nothing is live until the venue confirms it on the new connection
    EXPECT_FALSE(mgr->registry().isActive("aggtrade:sym0"));
    EXPECT_EQ(countErrors(ErrorKind::TRANSIENT), 1u);

    ackAll(*second);
    ASSERT_TRUE(runUntil([&] { return mgr->registry().isActive("aggtrade:sym0"); }));
    EXPECT_EQ(mgr->stats().connections, 2u);
}

TEST_F(ConnectionManagerTest, ControlFramesRespectTheRateLimit) {
    StreamConfig cfg = binancePublic();
    cfg.control_rate_per_sec = 5;
    make(cfg);

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));
    auto t = pool.last();

    for (int i = 0; i < 7; ++i) {
        ASSERT_EQ(mgr->subscribe(Topic{"trade", "SYM" + std::to_string(i)}, ignore()), Status::OK);
    }
    runFor(300ms);
    EXPECT_EQ(t->sent.size(), 5u);

    ASSERT_TRUE(runUntil([&] { return t->sent.size() == 7; }, 2000ms));
}

TEST_F(ConnectionManagerTest, RejectedSubscriptionIsReportedAndStaysInactive) {
    make(binancePublic());
    ASSERT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, ignore()), Status::OK);
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return pool.last() && !pool.last()->sent.empty(); }));

    auto t = pool.last();
    const json sub = json::parse(t->sent.front());
    t->inject(json{{"error", {{"code", 2}, {"msg", "Invalid request"}}}, {"id", sub["id"]}}.dump());

    ASSERT_TRUE(runUntil([&] { return countErrors(ErrorKind::PROTOCOL) == 1; }));
    EXPECT_FALSE(mgr->registry().isActive("aggtrade:btcusdt"));
    EXPECT_TRUE(mgr->registry().contains("aggtrade:btcusdt"));
    // the connection survives a rejected request
    EXPECT_TRUE(ready());
    EXPECT_FALSE(t->closed);
}

// ------------------------------------------------------------------ liveness

TEST_F(ConnectionManagerTest, HeartbeatStallForcesReconnect) {
    StreamConfig cfg = binancePublic();
    cfg.ping_interval = 20ms;
    cfg.ping_timeout = 30ms;
    pool.auto_pong = false;
    make(cfg);

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return pool.created.size() >= 2; }));

    auto first = pool.created.front();
    EXPECT_GT(first->pings, 0);
    EXPECT_TRUE(first->closed_locally);
    EXPECT_GE(countErrors(ErrorKind::TRANSIENT), 1u);
    EXPECT_EQ(errors.front().second, "heartbeat timeout");
}

TEST_F(ConnectionManagerTest, AnsweredPingsKeepTheConnection) {
    StreamConfig cfg = binancePublic();
    cfg.ping_interval = 20ms;
    cfg.ping_timeout = 30ms;
    make(cfg);

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));
    runFor(200ms);

    EXPECT_EQ(pool.created.size(), 1u);
    EXPECT_GE(pool.last()->pings, 3);
    EXPECT_TRUE(ready());
}

TEST_F(ConnectionManagerTest, FailedConnectBacksOffAndRetries) {
    pool.auto_open = false;
    make(binancePublic());

    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return pool.last() != nullptr; }));
    pool.last()->drop(boost::asio::error::connection_refused);

    ASSERT_TRUE(runUntil([&] { return pool.created.size() == 2; }));
    EXPECT_EQ(mgr->stats().reconnect_attempts, 1u);

    pool.last()->open();
    ASSERT_TRUE(runUntil([&] { return ready(); }));
}

// ------------------------------------------------------------------ stop

TEST_F(ConnectionManagerTest, StopIsIdempotentAndFinal) {
    make(binancePublic());
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));

    EXPECT_EQ(mgr->stop(), Status::OK);
    EXPECT_EQ(mgr->stop(), Status::OK);
    EXPECT_EQ(mgr->state(), ConnectionState::STOPPED);

    runFor(100ms);
    EXPECT_TRUE(pool.last()->closed);
    EXPECT_EQ(pool.created.size(), 1u);
    EXPECT_EQ(mgr->state(), ConnectionState::STOPPED);

    EXPECT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, ignore()), Status::STOPPED);
    EXPECT_EQ(mgr->unsubscribe(Topic{"aggTrade", "BTCUSDT"}), Status::STOPPED);
    EXPECT_EQ(mgr->start(), Status::STOPPED);
    EXPECT_FALSE(mgr->waitUntilReady(10ms));
    EXPECT_EQ(countErrors(ErrorKind::TRANSIENT), 0u);
}

TEST_F(ConnectionManagerTest, WaitUntilStoppedReportsFinishedTeardown) {
    make(binancePublic());
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));

    mgr->stop();
    EXPECT_FALSE(mgr->waitUntilStopped(0ms)); // teardown is queued on the strand
    runFor(20ms);
    EXPECT_TRUE(mgr->waitUntilStopped(0ms));
    EXPECT_TRUE(pool.last()->closed_locally);
}

TEST_F(ConnectionManagerTest, DestroyingRightAfterStopTearsDownInline) {
    make(binancePublic());
    int calls = 0;
    ASSERT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, [&](const StreamMessage &) { ++calls; }), Status::OK);
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));
    auto t = pool.last();

    mgr->stop();
    mgr.reset(); // the queued teardown never ran
    EXPECT_TRUE(t->closed_locally);
    EXPECT_EQ(states.back(), ConnectionState::STOPPED);

    // the io_context keeps running handlers that were queued for the destroyed manager
    t->closed = false;
    t->inject(R"({"stream":"btcusdt@aggTrade","data":{}})");
    t->drop();
    runFor(50ms);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(pool.created.size(), 1u);
}

TEST_F(ConnectionManagerTest, DestroyingAReadyManagerWithoutStop) {
    make(binancePublic());
    ASSERT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, ignore()), Status::OK);
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));
    auto t = pool.last();
    t->inject(R"({"stream":"btcusdt@aggTrade","data":{}})"); // still queued at destruction

    mgr.reset();
    EXPECT_TRUE(t->closed_locally);

    runFor(50ms);
    EXPECT_EQ(pool.created.size(), 1u);
}

TEST_F(ConnectionManagerTest, StopDuringBackoffCancelsTheReconnect) {
    make(binancePublic());
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));

    pool.last()->drop();
    ASSERT_TRUE(runUntil([&] { return mgr->state() == ConnectionState::DISCONNECTED; }));
    mgr->stop();

    runFor(150ms);
    EXPECT_EQ(pool.created.size(), 1u);
    EXPECT_EQ(mgr->state(), ConnectionState::STOPPED);
}

TEST_F(ConnectionManagerTest, LateFramesAfterStopAreIgnored) {
    make(binancePublic());
    int calls = 0;
    ASSERT_EQ(mgr->subscribe(Topic{"aggTrade", "BTCUSDT"}, [&](const StreamMessage &) { ++calls; }), Status::OK);
    ASSERT_EQ(mgr->start(), Status::OK);
    ASSERT_TRUE(runUntil([&] { return ready(); }));

    auto t = pool.last();
    mgr->stop();
    runFor(20ms);
    t->closed = false; // simulate a frame already in flight
    t->inject(R"({"stream":"btcusdt@aggTrade","data":{}})");
    runFor(20ms);
    EXPECT_EQ(calls, 0);
}

// ------------------------------------------------------------------ authentication

class AuthenticatedConnectionTest : public ConnectionManagerTest {
protected:
    void SetUp() override {
        provider = std::make_shared<NiceMock<test::MockCredentialProvider> >();
        ON_CALL(*provider, renewable()).WillByDefault(Return(false));
    }

    /// Completes acquire() asynchronously with `value`.
    auto acquireWith(std::string value) {
        return [this, value](ISessionCredentialProvider::CredentialCallback cb) {
            boost::asio::post(ioc, [cb, value] { cb({}, test::makeCredential(value)); });
        };
    }

    static json lastJson(const test::FakeTransport &t) { return json::parse(t.sent.back()); }

    std::shared_ptr<NiceMock<test::MockCredentialProvider> > provider;
};

TEST_F(AuthenticatedConnectionTest, SendsAuthFrameThenSubscribes) {
    EXPECT_CALL(*provider, acquire(_)).WillOnce(acquireWith("sig1"));
    make(bybitPrivate(), provider);
    ASSERT_EQ(mgr->subscribe(Topic{"position"}, ignore()), Status::OK);
    ASSERT_EQ(mgr->start(), Status::OK);

    ASSERT_TRUE(runUntil([&] { return mgr->state() == ConnectionState::AUTHENTICATING && !pool.last()->sent.empty(); }));
    auto t = pool.last();
    EXPECT_EQ(t->endpoint.target, "/v5/private");

    const json auth = lastJson(*t);
    EXPECT_EQ(auth["op"], "auth");
    EXPECT_EQ(auth["args"][2], "sig1");

    t->inject(R"({"success":true,"ret_msg":"","op":"auth","conn_id":"x"})");
    ASSERT_TRUE(runUntil([&] { return ready() && t->sent.size() == 2; }));

    const json sub = lastJson(*t);
    EXPECT_EQ(sub["op"], "subscribe");
    EXPECT_EQ(sub["args"], json::array({"position"}));

    t->inject(json{{"success", true}, {"ret_msg", ""}, {"op", "subscribe"}, {"req_id", sub["req_id"]}}.dump());
    ASSERT_TRUE(runUntil([&] { return mgr->registry().isActive("position"); }));
}

TEST_F(AuthenticatedConnectionTest, RejectedAuthRetriesWithAFreshCredential) {
    EXPECT_CALL(*provider, acquire(_))
            .WillOnce(acquireWith("sig1"))
            .WillOnce(acquireWith("sig2"));
    make(bybitPrivate(), provider);
    ASSERT_EQ(mgr->start(), Status::OK);

    ASSERT_TRUE(runUntil([&] { return pool.last() && !pool.last()->sent.empty(); }));
    auto first = pool.last();
    EXPECT_EQ(lastJson(*first)["args"][2], "sig1");

    first->inject(R"({"success":false,"ret_msg":"Invalid signature","op":"auth"})");
    ASSERT_TRUE(runUntil([&] { return pool.created.size() == 2 && !pool.last()->sent.empty(); }));

    EXPECT_TRUE(first->closed_locally);
    EXPECT_EQ(countErrors(ErrorKind::AUTHENTICATION), 1u);
    EXPECT_EQ(countErrors(ErrorKind::TRANSIENT), 0u);
    EXPECT_EQ(lastJson(*pool.last())["args"][2], "sig2");

    pool.last()->inject(R"({"success":true,"ret_msg":"","op":"auth"})");
    ASSERT_TRUE(runUntil([&] { return ready(); }));
    EXPECT_EQ(mgr->stats().auth_failures, 1u);
}

TEST_F(AuthenticatedConnectionTest, RepeatedAuthFailuresAreFatal) {
    EXPECT_CALL(*provider, acquire(_))
            .Times(2)
            .WillRepeatedly([this](ISessionCredentialProvider::CredentialCallback cb) {
                boost::asio::post(ioc, [cb] { cb({}, test::makeCredential("bad")); });
            });

    StreamConfig cfg = bybitPrivate();
    cfg.max_consecutive_auth_failures = 2;
    make(cfg, provider);
    ASSERT_EQ(mgr->start(), Status::OK);

    for (std::size_t n = 1; n <= 2; ++n) {
        ASSERT_TRUE(runUntil([&] { return pool.created.size() == n && !pool.last()->sent.empty(); }));
        pool.last()->inject(R"({"success":false,"ret_msg":"expired","op":"auth"})");
    }

    ASSERT_TRUE(runUntil([&] { return mgr->state() == ConnectionState::STOPPED; }));
    EXPECT_EQ(countErrors(ErrorKind::AUTHENTICATION), 2u);
    EXPECT_EQ(countErrors(ErrorKind::FATAL), 1u);

    runFor(100ms);
    EXPECT_EQ(pool.created.size(), 2u);
    EXPECT_EQ(mgr->subscribe(Topic{"position"}, ignore()), Status::STOPPED);
}

TEST_F(AuthenticatedConnectionTest, UnansweredAuthTimesOut) {
    EXPECT_CALL(*provider, acquire(_))
            .WillOnce(acquireWith("sig1"))
            .WillRepeatedly(acquireWith("sig2"));

    StreamConfig cfg = bybitPrivate();
    cfg.auth_timeout = 30ms;
    make(cfg, provider);
    ASSERT_EQ(mgr->start(), Status::OK);

    ASSERT_TRUE(runUntil([&] { return pool.created.size() >= 2; }));
    EXPECT_TRUE(pool.created.front()->closed_locally);
    EXPECT_GE(countErrors(ErrorKind::TRANSIENT), 1u);
    EXPECT_EQ(countErrors(ErrorKind::AUTHENTICATION), 0u);
}

TEST_F(AuthenticatedConnectionTest, AcquireFailureIsRetried) {
    EXPECT_CALL(*provider, acquire(_))
            .WillOnce([this](ISessionCredentialProvider::CredentialCallback cb) {
                boost::asio::post(ioc, [cb] {
                    cb(make_error_code(boost::system::errc::connection_refused), Credential{});
                });
            })
            .WillOnce(acquireWith("sig2"));

    make(bybitPrivate(), provider);
    ASSERT_EQ(mgr->start(), Status::OK);

    ASSERT_TRUE(runUntil([&] { return pool.last() && !pool.last()->sent.empty(); }));
    EXPECT_EQ(pool.created.size(), 1u); // no transport for the failed attempt
    EXPECT_EQ(countErrors(ErrorKind::TRANSIENT), 1u);
    EXPECT_EQ(lastJson(*pool.last())["args"][2], "sig2");
}
