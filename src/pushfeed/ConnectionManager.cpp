#include "pushfeed/ConnectionManager.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>

#include "client_connection_handlers/WsClient.hpp"
#include "venue_factory.hpp"

namespace pushfeed {
    namespace {
        /// Topics per replay group; groups are separated by the configured replay pause.
        constexpr std::size_t kReplayBatch = 200;

        StreamObserver withDefaults(StreamObserver obs) {
            if (!obs.log) obs.log = stderrLogger();
            return obs;
        }

        const char *to_string(ControlOp op) {
            return op == ControlOp::Subscribe ? "subscribe" : "unsubscribe";
        }
    }

    ConnectionManager::ConnectionManager(boost::asio::io_context &ioc, StreamObserver observer)
        : ioc_(ioc),
          strand_(boost::asio::make_strand(ioc)),
          obs_(withDefaults(std::move(observer))),
          dispatcher_(registry_, obs_.log),
          heartbeat_(strand_, std::chrono::milliseconds(0), std::chrono::milliseconds(0), lifetime_),
          reconnect_timer_(strand_),
          control_timer_(strand_),
          auth_timer_(strand_),
          renew_timer_(strand_) {
    }

    /// Queued handlers still reference `this`; they are expired first, then teardown runs inline.
    ConnectionManager::~ConnectionManager() {
        auto lock = lifetime_.expire();
        stopped_.store(true);
        stopInternal_();
    }

    std::int64_t ConnectionManager::now_ns_() noexcept {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    void ConnectionManager::log_(LogLevel level, std::string_view msg) const {
        std::string line;
        line.reserve(rt_.identity.size() + msg.size() + 3);
        line += '[';
        line += rt_.identity;
        line += "] ";
        line += msg;
        obs_.log(level, line);
    }

    void ConnectionManager::report_(ErrorKind kind, std::string_view msg) {
        if (!obs_.on_error) return;
        try {
            obs_.on_error(kind, msg);
        } catch (const std::exception &e) {
            log_(LogLevel::ERROR, std::string("error observer threw: ") + e.what());
        }
    }

    void ConnectionManager::setState_(ConnectionState s) {
        ConnectionState prev;
        {
            std::lock_guard lock(ready_mtx_);
            if (stopped_.load() && s != ConnectionState::STOPPED) return;
            prev = state_.exchange(s);
        }
        ready_cv_.notify_all();
        if (prev == s) return;

        log_(LogLevel::DEBUG, std::string("state ") + to_string(prev) + " -> " + to_string(s));
        if (obs_.on_state) {
            try {
                obs_.on_state(s);
            } catch (const std::exception &e) {
                log_(LogLevel::ERROR, std::string("state observer threw: ") + e.what());
            }
        }
    }

    // ---------------------------------------------------------------- lifecycle

    Status ConnectionManager::init(const StreamConfig &cfg) {
        return init(cfg, nullptr, {});
    }

    Status ConnectionManager::init(const StreamConfig &cfg,
                                   std::shared_ptr<ISessionCredentialProvider> provider,
                                   TransportFactory transport_factory) {
        if (started_.load()) return Status::ERROR;
        if (stopped_.load()) return Status::STOPPED;

        if (!makeAdapter(cfg.venue, adapter_)) return Status::ERROR;
        if (cfg.reconnect_initial.count() <= 0 || cfg.reconnect_factor < 1.0 ||
            cfg.reconnect_max < cfg.reconnect_initial) {
            return Status::ERROR;
        }
        if (cfg.connect_timeout.count() <= 0) return Status::ERROR;

        cfg_ = cfg;

        /// Resolve once (Cold Path)
        rt_.caps = std::visit([&](auto const &a) { return a.caps(cfg_); }, adapter_);
        rt_.scope = cfg_.scope;
        rt_.identity = cfg_.identity.empty()
                           ? std::string(to_string(cfg_.venue)) + "-" + to_string(cfg_.scope)
                           : cfg_.identity;

        rt_.control_rate = cfg_.control_rate_per_sec > 0 ? cfg_.control_rate_per_sec : rt_.caps.control_rate_per_sec;
        rt_.topics_per_frame = cfg_.max_topics_per_frame > 0
                                   ? std::min(cfg_.max_topics_per_frame, rt_.caps.max_topics_per_frame)
                                   : rt_.caps.max_topics_per_frame;
        rt_.topics_per_frame = std::max<std::size_t>(rt_.topics_per_frame, 1);
        rt_.replay_pause = cfg_.replay_batch_pause;

        rt_.ping_interval = cfg_.ping_interval.count() > 0 ? cfg_.ping_interval : rt_.caps.ping_interval;
        rt_.ping_timeout = cfg_.ping_timeout.count() > 0 ? cfg_.ping_timeout : rt_.caps.ping_timeout;

        rt_.auth_timeout = cfg_.auth_timeout;
        rt_.renew_interval = cfg_.credential_renew_interval;
        rt_.max_auth_failures = cfg_.max_consecutive_auth_failures;

        if (rt_.caps.auth != AuthMode::None) {
            provider_ = provider ? std::move(provider) : VenueFactory::makeCredentialProvider(ioc_, cfg_, obs_.log);
            if (!provider_) {
                log_(LogLevel::ERROR, "private feed needs API credentials");
                return Status::ERROR;
            }
        } else {
            provider_.reset();
        }

        if (transport_factory) {
            transport_factory_ = std::move(transport_factory);
        } else {
            transport_factory_ = [&ioc = ioc_, timeout = cfg_.connect_timeout, log = obs_.log] {
                auto ws = WsClient::create(ioc);
                ws->set_connect_timeout(timeout);
                ws->set_logger(log);
                return std::shared_ptr<ITransport>(std::move(ws));
            };
        }

        limiter_ = RateLimiter(rt_.control_rate);
        backoff_ = ExponentialBackoff(cfg_.reconnect_initial, cfg_.reconnect_factor, cfg_.reconnect_max);
        heartbeat_.configure(rt_.ping_interval, rt_.ping_timeout);

        dispatcher_.setLogPrefix("[" + rt_.identity + "] ");
        dispatcher_.setDeltaSpec([this](std::string_view channel) {
            return std::visit([&](auto const &a) { return a.deltaSpec(channel); }, adapter_);
        });

        initialized_ = true;

        log_(LogLevel::INFO, "initialized: rate=" + std::to_string(rt_.control_rate) +
                             "/s topics/frame=" + std::to_string(rt_.topics_per_frame) +
                             " ping=" + std::to_string(rt_.ping_interval.count()) + "ms/" +
                             std::to_string(rt_.ping_timeout.count()) + "ms");
        return Status::OK;
    }

    Status ConnectionManager::start() {
        if (!initialized_) return Status::ERROR;
        if (stopped_.load()) return Status::STOPPED;
        if (started_.exchange(true)) return Status::ERROR;

        boost::asio::post(strand_, lifetime_.guard([this] { connect_(); }));
        return Status::OK;
    }

    Status ConnectionManager::stop() {
        if (stopped_.exchange(true)) return Status::OK;

        setState_(ConnectionState::STOPPED);
        boost::asio::post(strand_, lifetime_.guard([this] { stopInternal_(); }));
        return Status::OK;
    }

    void ConnectionManager::stopInternal_() {
        if (torn_down_) return;

        reconnect_timer_.cancel();
        renew_timer_.cancel();
        teardownConnection_();

        if (transport_) {
            ++conn_gen_; // its close notification is no longer ours
            auto t = std::move(transport_);
            t->close();
        }

        retireCredential_();

        setState_(ConnectionState::STOPPED);
        {
            std::lock_guard lock(ready_mtx_);
            torn_down_ = true;
        }
        ready_cv_.notify_all();
        log_(LogLevel::INFO, "stopped");
    }

    bool ConnectionManager::waitUntilReady(std::chrono::milliseconds timeout) {
        std::unique_lock lock(ready_mtx_);
        ready_cv_.wait_for(lock, timeout, [this] {
            const auto s = state_.load();
            return s == ConnectionState::READY || s == ConnectionState::STOPPED;
        });
        return state_.load() == ConnectionState::READY;
    }

    bool ConnectionManager::waitUntilStopped(std::chrono::milliseconds timeout) {
        std::unique_lock lock(ready_mtx_);
        return ready_cv_.wait_for(lock, timeout, [this] { return torn_down_; });
    }

    ConnectionStats ConnectionManager::stats() const {
        ConnectionStats s;
        s.dispatch = dispatcher_.stats();
        s.control_frames_sent = control_frames_sent_.load(std::memory_order_relaxed);
        s.connections = connections_.load(std::memory_order_relaxed);
        s.reconnect_attempts = reconnect_attempts_.load(std::memory_order_relaxed);
        s.auth_failures = auth_failures_.load(std::memory_order_relaxed);
        return s;
    }

    // ---------------------------------------------------------------- subscriptions

    Status ConnectionManager::subscribe(const Topic &requested, MessageHandler handler) {
        if (stopped_.load()) return Status::STOPPED;
        if (!initialized_ || !handler) return Status::ERROR;

        const Topic topic = std::visit([&](auto const &a) { return a.canonical(requested); }, adapter_);
        const bool valid = std::visit([&](auto const &a) { return a.validate(topic, rt_.scope); }, adapter_);
        if (!valid) {
            log_(LogLevel::WARN, "rejected topic '" + makeTopicKey(topic) + "'");
            return Status::INVALID_TOPIC;
        }

        std::string key = makeTopicKey(topic);
        std::string channel = std::visit([&](auto const &a) { return a.channelFor(topic); }, adapter_);
        if (registry_.upsert(topic, key, channel, std::move(handler)) == UpsertResult::ChannelTaken) {
            log_(LogLevel::WARN, "rejected topic '" + key + "': channel " + channel + " is already subscribed");
            return Status::INVALID_TOPIC;
        }

        boost::asio::post(strand_, lifetime_.guard([this, key = std::move(key), channel = std::move(channel)] {
            if (stopped_.load()) return;
            // a re-subscribe keeps the spelling the venue was first asked for
            const auto topic = registry_.topicFor(key);
            if (!topic) return;

            if (state_.load() == ConnectionState::READY) {
                if (!rt_.caps.subscribe_ops) {
                    registry_.markActive({channel}, true);
                    return;
                }
                // already live, or covered by a request in flight (replay)
                if (registry_.isActive(key) || isPending_(channel)) return;
                sendControl_(ControlOp::Subscribe, {*topic}, std::chrono::milliseconds(0));
                return;
            }

            if (started_.load() && state_.load() == ConnectionState::DISCONNECTED && !reconnect_scheduled_) {
                connect_();
            }
        }));
        return Status::OK;
    }

    Status ConnectionManager::unsubscribe(const Topic &requested) {
        if (stopped_.load()) return Status::STOPPED;
        if (!initialized_) return Status::ERROR;

        const Topic topic = std::visit([&](auto const &a) { return a.canonical(requested); }, adapter_);
        const bool valid = std::visit([&](auto const &a) { return a.validate(topic, rt_.scope); }, adapter_);
        if (!valid) return Status::INVALID_TOPIC;

        auto removed = registry_.remove(makeTopicKey(topic));
        if (!removed) return Status::UNKNOWN_TOPIC;

        boost::asio::post(strand_, lifetime_.guard([this, sub = std::move(*removed)] {
            dispatcher_.discard(sub.key);
            if (stopped_.load()) return;

            if (state_.load() == ConnectionState::READY && rt_.caps.subscribe_ops) {
                sendControl_(ControlOp::Unsubscribe, {sub.topic}, std::chrono::milliseconds(0));
            }
        }));
        return Status::OK;
    }

    // ---------------------------------------------------------------- connection sequence

    void ConnectionManager::connect_() {
        if (stopped_.load()) return;
        if (state_.load() != ConnectionState::DISCONNECTED) return; // Ready or attempt in flight

        const std::uint64_t gen = ++conn_gen_;
        close_reason_.clear();
        setState_(ConnectionState::CONNECTING);

        if (rt_.caps.auth == AuthMode::None) {
            openTransport_(gen);
            return;
        }
        obtainCredential_(gen);
    }

    /**
     * - UrlCredential: the cached listen key is kept alive with renew() before it goes into the
     *                  target; a failed renew replaces it with a fresh acquire()
     * - AuthFrame    : every attempt signs a fresh credential
     */
    void ConnectionManager::obtainCredential_(std::uint64_t gen) {
        if (rt_.caps.auth != AuthMode::UrlCredential || credential_.empty()) {
            acquireCredential_(gen);
            return;
        }
        if (!provider_->renewable()) {
            openTransport_(gen);
            return;
        }

        const Credential current = credential_;
        provider_->renew(current, [this, strand = strand_, life = lifetime_, gen, current](
                          boost::system::error_code ec, Credential renewed) {
            boost::asio::post(strand, life.guard([this, gen, current, ec, renewed = std::move(renewed)]() mutable {
                if (stopped_.load() || gen != conn_gen_) return;

                if (ec) {
                    log_(LogLevel::WARN, "credential renew failed (" + ec.message() + "), acquiring a new one");
                    if (credential_.value == current.value) retireCredential_();
                    acquireCredential_(gen);
                    return;
                }

                swapCredential_(std::move(renewed));
                armRenewTimer_();
                openTransport_(gen);
            }));
        });
    }

    void ConnectionManager::acquireCredential_(std::uint64_t gen) {
        provider_->acquire([this, strand = strand_, life = lifetime_, gen](
                            boost::system::error_code ec, Credential cred) {
            boost::asio::post(strand, life.guard([this, gen, ec, cred = std::move(cred)]() mutable {
                if (stopped_.load() || gen != conn_gen_) return;

                if (ec) {
                    const std::string msg = "credential acquire failed: " + ec.message();
                    log_(LogLevel::WARN, msg);
                    report_(ErrorKind::TRANSIENT, msg);
                    setState_(ConnectionState::DISCONNECTED);
                    scheduleReconnect_();
                    return;
                }

                swapCredential_(std::move(cred));
                armRenewTimer_();
                openTransport_(gen);
            }));
        });
    }

    void ConnectionManager::openTransport_(std::uint64_t gen) {
        const Credential *cred = rt_.caps.auth == AuthMode::UrlCredential ? &credential_ : nullptr;
        const EndPoint ep = std::visit([&](auto const &a) { return a.endpoint(cfg_, cred); }, adapter_);

        auto t = transport_factory_();
        if (!t) {
            report_(ErrorKind::FATAL, "transport factory returned no transport");
            stopped_.store(true);
            stopInternal_();
            return;
        }

        // The transport may outlive the manager: callbacks hold a strand copy, never `this` unguarded.
        t->set_on_open([this, strand = strand_, life = lifetime_, gen] {
            boost::asio::post(strand, life.guard([this, gen] { onOpen_(gen); }));
        });
        t->set_on_raw_message([this, strand = strand_, life = lifetime_, gen](
                                  const char *data, std::size_t len) {
            boost::asio::post(strand, life.guard([this, gen, raw = std::string(data, len), ts = now_ns_()] {
                onMessage_(gen, raw, ts);
            }));
        });
        t->set_on_pong([this, strand = strand_, life = lifetime_, gen] {
            boost::asio::post(strand, life.guard([this, gen] {
                if (gen == conn_gen_) heartbeat_.onPong();
            }));
        });
        t->set_on_close([this, strand = strand_, life = lifetime_, gen](boost::system::error_code ec) {
            boost::asio::post(strand, life.guard([this, gen, ec] { onClose_(gen, ec); }));
        });

        transport_ = t;
        // the target may carry a credential; host only
        log_(LogLevel::INFO, "connecting to " + ep.host + ":" + ep.port);
        t->connect(ep);
    }

    void ConnectionManager::onOpen_(std::uint64_t gen) {
        if (stopped_.load() || gen != conn_gen_ || !transport_) return;

        heartbeat_.onTraffic();

        if (rt_.caps.auth != AuthMode::AuthFrame) {
            onReady_();
            return;
        }

        setState_(ConnectionState::AUTHENTICATING);
        enqueueControl_(std::visit([&](auto const &a) { return a.authFrame(credential_); }, adapter_),
                        std::chrono::milliseconds(0));

        auth_timer_.expires_after(rt_.auth_timeout);
        auth_timer_.async_wait(lifetime_.guard([this, gen](const boost::system::error_code &ec) {
            if (ec || stopped_.load() || gen != conn_gen_) return;
            if (state_.load() != ConnectionState::AUTHENTICATING) return;

            log_(LogLevel::WARN, "authentication timed out");
            report_(ErrorKind::TRANSIENT, "authentication timed out");
            credential_ = {};
            closeTransport_("authentication timeout");
        }));
    }

    void ConnectionManager::onReady_() {
        auth_timer_.cancel();
        consecutive_auth_failures_ = 0;
        backoff_.reset();
        connections_.fetch_add(1, std::memory_order_relaxed);
        setState_(ConnectionState::READY);

        heartbeat_.start(
            [this] {
                if (!transport_) return false;
                if (rt_.caps.ping == PingMode::Control) {
                    transport_->send_ping();
                } else {
                    transport_->send_text(std::visit([](auto const &a) { return a.pingFrame(); }, adapter_));
                }
                return true;
            },
            [this] {
                log_(LogLevel::WARN, "heartbeat timeout, connection is stale");
                report_(ErrorKind::TRANSIENT, "heartbeat timeout");
                closeTransport_("heartbeat timeout");
            });

        const std::vector<Topic> topics = registry_.desiredTopics();
        if (topics.empty()) {
            log_(LogLevel::INFO, "ready");
            return;
        }

        if (!rt_.caps.subscribe_ops) {
            // single account-wide stream: everything registered is live once connected
            std::vector<std::string> channels;
            channels.reserve(topics.size());
            for (const auto &t: topics) {
                channels.push_back(std::visit([&](auto const &a) { return a.channelFor(t); }, adapter_));
            }
            registry_.markActive(channels, true);
            log_(LogLevel::INFO, "ready");
            return;
        }

        const auto batches = registry_.replayBatches(kReplayBatch);
        log_(LogLevel::INFO, "ready, replaying " + std::to_string(topics.size()) + " topics in " +
                             std::to_string(batches.size()) + " batches");
        for (std::size_t i = 0; i < batches.size(); ++i) {
            const bool last = i + 1 == batches.size();
            sendControl_(ControlOp::Subscribe, batches[i], last ? std::chrono::milliseconds(0) : rt_.replay_pause);
        }
    }

    void ConnectionManager::onMessage_(std::uint64_t gen, const std::string &raw, std::int64_t recv_ts_ns) {
        if (stopped_.load() || gen != conn_gen_) return;

        heartbeat_.onTraffic();
        if (debug::raw.load(std::memory_order_relaxed)) {
            log_(LogLevel::DEBUG, "<< " + debug::raw_excerpt(raw));
        }

        InboundFrame f = std::visit([&](auto const &a) { return a.classify(raw, rt_.scope); }, adapter_);

        switch (f.kind) {
            case FrameKind::Pong:
                heartbeat_.onPong();
                break;

            case FrameKind::Ping: {
                const std::string pong = std::visit([](auto const &a) { return a.pongFrame(); }, adapter_);
                if (!pong.empty() && transport_) transport_->send_text(pong);
                break;
            }

            case FrameKind::AuthResult:
                if (state_.load() != ConnectionState::AUTHENTICATING) {
                    log_(LogLevel::DEBUG, "auth reply outside of authentication ignored");
                    break;
                }
                if (f.success) {
                    log_(LogLevel::INFO, "authenticated");
                    onReady_();
                } else {
                    onAuthFailure_(f.message.empty() ? "rejected" : f.message);
                }
                break;

            case FrameKind::ControlAck:
                onControlAck_(f);
                break;

            case FrameKind::CredentialExpired:
                log_(LogLevel::WARN, "session credential expired, rotating");
                report_(ErrorKind::AUTHENTICATION, "session credential expired");
                retireCredential_();
                renew_timer_.cancel();
                closeTransport_("credential expired");
                break;

            case FrameKind::Data:
                dispatcher_.dispatch(f, recv_ts_ns);
                break;

            case FrameKind::Unknown:
            default:
                dispatcher_.noteMalformed(raw, f.message);
                break;
        }
    }

    void ConnectionManager::onControlAck_(const InboundFrame &f) {
        std::optional<PendingRequest> req;

        if (!f.request_id.empty()) {
            const auto it = pending_.find(f.request_id);
            if (it != pending_.end()) {
                req = std::move(it->second);
                pending_.erase(it);
            }
        } else if (!f.channel.empty()) {
            // venues acknowledging by channel: settle the request covering it
            for (auto it = pending_.begin(); it != pending_.end(); ++it) {
                auto &channels = it->second.channels;
                const auto ch = std::find(channels.begin(), channels.end(), f.channel);
                if (ch == channels.end()) continue;

                req = PendingRequest{it->second.op, {f.channel}};
                channels.erase(ch);
                if (channels.empty()) pending_.erase(it);
                break;
            }
        }

        if (req && req->op == ControlOp::Subscribe) registry_.markActive(req->channels, f.success);

        if (f.success) {
            if (!req) log_(LogLevel::DEBUG, "ack without pending request");
            return;
        }

        std::string msg = std::string(req ? to_string(req->op) : "control request") + " rejected";
        if (!f.message.empty()) msg += ": " + f.message;
        log_(LogLevel::WARN, msg);
        report_(ErrorKind::PROTOCOL, msg);
    }

    bool ConnectionManager::isPending_(const std::string &channel) const {
        for (const auto &[id, req]: pending_) {
            if (req.op != ControlOp::Subscribe) continue;
            if (std::find(req.channels.begin(), req.channels.end(), channel) != req.channels.end()) return true;
        }
        return false;
    }

    void ConnectionManager::onClose_(std::uint64_t gen, boost::system::error_code ec) {
        if (gen != conn_gen_) return;

        transport_.reset();
        teardownConnection_();
        if (stopped_.load()) return;

        if (close_reason_.empty()) {
            const std::string msg = "connection lost: " + ec.message();
            log_(LogLevel::WARN, msg);
            report_(ErrorKind::TRANSIENT, msg);
        } else {
            log_(LogLevel::INFO, "connection closed (" + close_reason_ + ")");
        }
        close_reason_.clear();

        setState_(ConnectionState::DISCONNECTED);
        scheduleReconnect_();
    }

    void ConnectionManager::teardownConnection_() {
        heartbeat_.stop();
        auth_timer_.cancel();

        control_timer_.cancel();
        control_timer_armed_ = false;
        ++control_gen_;
        control_queue_.clear();

        pending_.clear();
        registry_.markAllInactive();
        dispatcher_.reset();
    }

    void ConnectionManager::closeTransport_(std::string reason) {
        if (!transport_) return;
        if (close_reason_.empty()) close_reason_ = std::move(reason);
        transport_->close();
    }

    void ConnectionManager::scheduleReconnect_() {
        if (stopped_.load() || reconnect_scheduled_) return;
        reconnect_scheduled_ = true;

        const auto delay = backoff_.next();
        reconnect_attempts_.fetch_add(1, std::memory_order_relaxed);
        log_(LogLevel::INFO, "reconnecting in " + std::to_string(delay.count()) + "ms");

        reconnect_timer_.expires_after(delay);
        reconnect_timer_.async_wait(lifetime_.guard([this](const boost::system::error_code &ec) {
            reconnect_scheduled_ = false;
            if (ec) return; // canceled
            if (stopped_.load()) return;
            connect_();
        }));
    }

    // ---------------------------------------------------------------- control frames

    void ConnectionManager::sendControl_(ControlOp op, const std::vector<Topic> &topics,
                                         std::chrono::milliseconds pause_after) {
        const std::size_t per_frame = rt_.topics_per_frame;

        for (std::size_t i = 0; i < topics.size(); i += per_frame) {
            const std::size_t end = std::min(topics.size(), i + per_frame);
            const std::vector<Topic> chunk(topics.begin() + static_cast<std::ptrdiff_t>(i),
                                           topics.begin() + static_cast<std::ptrdiff_t>(end));

            const std::uint64_t id = ++next_request_id_;
            auto frames = std::visit([&](auto const &a) { return a.controlFrames(op, chunk, id); }, adapter_);

            PendingRequest req{op, {}};
            req.channels.reserve(chunk.size());
            for (const auto &t: chunk) {
                req.channels.push_back(std::visit([&](auto const &a) { return a.channelFor(t); }, adapter_));
            }
            pending_[std::to_string(id)] = std::move(req);

            const bool last_chunk = end == topics.size();
            for (std::size_t k = 0; k < frames.size(); ++k) {
                const bool last = last_chunk && k + 1 == frames.size();
                enqueueControl_(std::move(frames[k]), last ? pause_after : std::chrono::milliseconds(0));
            }
        }
    }

    void ConnectionManager::enqueueControl_(std::string frame, std::chrono::milliseconds pause_after) {
        if (frame.empty()) return;
        control_queue_.push_back(ControlItem{std::move(frame), pause_after});
        pumpControl_();
    }

    void ConnectionManager::pumpControl_() {
        if (control_timer_armed_) return;

        while (!control_queue_.empty()) {
            if (!transport_) {
                control_queue_.clear();
                return;
            }

            const auto wait = limiter_.tryAcquire(RateLimiter::clock::now());
            if (wait > RateLimiter::clock::duration::zero()) {
                armControlTimer_(wait);
                return;
            }

            ControlItem item = std::move(control_queue_.front());
            control_queue_.pop_front();

            transport_->send_text(std::move(item.frame));
            control_frames_sent_.fetch_add(1, std::memory_order_relaxed);

            if (item.pause_after.count() > 0) {
                armControlTimer_(item.pause_after);
                return;
            }
        }
    }

    void ConnectionManager::armControlTimer_(std::chrono::steady_clock::duration wait) {
        control_timer_armed_ = true;
        const std::uint64_t gen = control_gen_;

        control_timer_.expires_after(wait);
        control_timer_.async_wait(lifetime_.guard([this, gen](const boost::system::error_code &ec) {
            if (gen != control_gen_) return; // connection torn down meanwhile
            control_timer_armed_ = false;
            if (ec || stopped_.load()) return;
            pumpControl_();
        }));
    }

    // ---------------------------------------------------------------- credentials

    void ConnectionManager::onAuthFailure_(std::string_view why) {
        auth_failures_.fetch_add(1, std::memory_order_relaxed);
        ++consecutive_auth_failures_;

        // never retry the rejected credential
        credential_ = {};
        renew_timer_.cancel();

        const std::string msg = "authentication failed: " + std::string(why);
        log_(LogLevel::WARN, msg);
        report_(ErrorKind::AUTHENTICATION, msg);

        if (rt_.max_auth_failures > 0 && consecutive_auth_failures_ >= rt_.max_auth_failures) {
            const std::string fatal = "authentication rejected " + std::to_string(consecutive_auth_failures_) +
                                      " times in a row, giving up";
            log_(LogLevel::ERROR, fatal);
            report_(ErrorKind::FATAL, fatal);
            stopped_.store(true);
            stopInternal_();
            return;
        }

        if (transport_) {
            closeTransport_("authentication failed");
            return;
        }
        setState_(ConnectionState::DISCONNECTED);
        scheduleReconnect_();
    }

    void ConnectionManager::armRenewTimer_() {
        if (rt_.caps.auth != AuthMode::UrlCredential || !provider_ || !provider_->renewable()) return;
        if (rt_.renew_interval.count() <= 0 || credential_.empty()) return;

        renew_timer_.expires_after(rt_.renew_interval);
        renew_timer_.async_wait(lifetime_.guard([this](const boost::system::error_code &ec) {
            if (ec || stopped_.load()) return;
            renewCredential_();
        }));
    }

    /**
     * Keepalive on schedule. A failed renew falls back to exactly one acquire; the new credential
     * replaces the old one and, when it changed, the live connection is recycled onto it.
     */
    void ConnectionManager::renewCredential_() {
        if (credential_.empty()) return;
        const Credential current = credential_;

        provider_->renew(current, [this, strand = strand_, life = lifetime_, current](
                          boost::system::error_code ec, Credential renewed) {
            boost::asio::post(strand, life.guard([this, current, ec, renewed = std::move(renewed)]() mutable {
                if (stopped_.load() || credential_.value != current.value) return;

                if (!ec) {
                    log_(LogLevel::DEBUG, "credential renewed");
                    swapCredential_(std::move(renewed));
                    armRenewTimer_();
                    return;
                }

                log_(LogLevel::WARN, "credential renew failed (" + ec.message() + "), acquiring a new one");
                provider_->acquire([this, strand = strand_, life = lifetime_, current](
                                    boost::system::error_code ec2, Credential fresh) {
                    boost::asio::post(strand, life.guard([this, current, ec2, fresh = std::move(fresh)]() mutable {
                        if (stopped_.load() || credential_.value != current.value) return;

                        if (ec2) {
                            const std::string msg = "credential acquire failed: " + ec2.message();
                            log_(LogLevel::WARN, msg);
                            report_(ErrorKind::TRANSIENT, msg);
                            retireCredential_(); // next connection attempt acquires
                            return;
                        }

                        swapCredential_(std::move(fresh));
                        armRenewTimer_();
                    }));
                });
            }));
        });
    }

    /// A replaced credential is revoked; a changed listen key moves the live connection onto the new one.
    void ConnectionManager::swapCredential_(Credential next) {
        const bool changed = next.value != credential_.value;
        Credential previous = std::exchange(credential_, std::move(next));
        if (!changed || previous.empty()) return;

        revoke_(previous);

        if (rt_.caps.auth == AuthMode::UrlCredential) {
            log_(LogLevel::INFO, "session credential rotated");
            if (transport_) closeTransport_("credential rotated");
        }
    }

    void ConnectionManager::retireCredential_() {
        if (credential_.empty()) return;
        revoke_(credential_);
        credential_ = {};
    }

    void ConnectionManager::revoke_(const Credential &cred) {
        if (!provider_) return;
        provider_->revoke(cred, [log = obs_.log, id = rt_.identity](boost::system::error_code ec) {
            if (ec) log(LogLevel::DEBUG, "[" + id + "] credential revoke failed: " + ec.message());
        });
    }
} // namespace pushfeed
