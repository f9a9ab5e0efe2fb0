#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "abstract/StreamClient.hpp"
#include "client_connection_handlers/Transport.hpp"
#include "pushfeed/Backoff.hpp"
#include "pushfeed/HeartbeatMonitor.hpp"
#include "pushfeed/InboundDispatcher.hpp"
#include "pushfeed/Lifetime.hpp"
#include "pushfeed/RateLimiter.hpp"
#include "pushfeed/SessionCredential.hpp"
#include "pushfeed/SubscriptionRegistry.hpp"
#include "pushfeed/VenueAdapter.hpp"
#include "utils/Logging.hpp"

namespace pushfeed {
    /// Injected sinks. Every member is optional; a missing logger falls back to stderr.
    struct StreamObserver {
        using ErrorFn = std::function<void(ErrorKind, std::string_view)>;
        using StateFn = std::function<void(ConnectionState)>;

        LogFn log;
        ErrorFn on_error;
        StateFn on_state;
    };

    struct ConnectionStats {
        DispatchStats dispatch;
        std::uint64_t control_frames_sent{0};
        std::uint64_t connections{0}; ///< times Ready was reached
        std::uint64_t reconnect_attempts{0};
        std::uint64_t auth_failures{0};
    };

    /**
     * Owns one duplex connection at a time and keeps the desired subscriptions alive across it.
     *
     *   DISCONNECTED -> CONNECTING -> (AUTHENTICATING) -> READY -> DISCONNECTED ... -> STOPPED
     *
     * Everything connection-related runs on one strand of the externally driven io_context.
     * Public methods are thread-safe. Destruction tears the connection down synchronously and
     * leaves only inert handlers behind, so the io_context may keep running; it must not happen
     * from inside one of the manager's own callbacks.
     */
    class ConnectionManager final : public IStreamClient {
    public:
        explicit ConnectionManager(boost::asio::io_context &ioc, StreamObserver observer = {});

        ~ConnectionManager() override;

        ConnectionManager(const ConnectionManager &) = delete;

        ConnectionManager &operator=(const ConnectionManager &) = delete;

        /// Venue defaults: WsClient transport, venue credential provider for private feeds.
        Status init(const StreamConfig &cfg) override;

        Status init(const StreamConfig &cfg,
                    std::shared_ptr<ISessionCredentialProvider> provider,
                    TransportFactory transport_factory = {});

        Status start() override;

        Status stop() override;

        Status subscribe(const Topic &topic, MessageHandler handler) override;

        Status unsubscribe(const Topic &topic) override;

        [[nodiscard]] ConnectionState state() const noexcept override { return state_.load(); }

        /// Catch-all for data frames whose channel has no registered topic.
        void setDefaultHandler(MessageHandler handler) { registry_.setDefaultHandler(std::move(handler)); }

        /// Blocks the calling thread (never the io_context thread) until READY, STOPPED or timeout.
        bool waitUntilReady(std::chrono::milliseconds timeout);

        /// Blocks the calling thread (never the io_context thread) until stop() finished its teardown:
        /// transport closed, timers canceled, credential revoked. False on timeout.
        bool waitUntilStopped(std::chrono::milliseconds timeout);

        [[nodiscard]] ConnectionStats stats() const;

        [[nodiscard]] const SubscriptionRegistry &registry() const noexcept { return registry_; }

        [[nodiscard]] const std::string &identity() const noexcept { return rt_.identity; }

    private:
        /// Cold-path resolved runtime (no config reads in hot path):
        struct RuntimeResolved {
            VenueCaps caps;
            FeedScope scope{FeedScope::PUBLIC};
            std::string identity;

            std::size_t control_rate{5};
            std::size_t topics_per_frame{200};
            std::chrono::milliseconds replay_pause{200};

            std::chrono::milliseconds ping_interval{0};
            std::chrono::milliseconds ping_timeout{0};

            std::chrono::milliseconds auth_timeout{10000};
            std::chrono::milliseconds renew_interval{0};
            std::size_t max_auth_failures{0};
        };

        struct ControlItem {
            std::string frame;
            std::chrono::milliseconds pause_after{0};
        };

        struct PendingRequest {
            ControlOp op{ControlOp::Subscribe};
            std::vector<std::string> channels;
        };

        /// Connection sequence (strand)
        void connect_();

        void obtainCredential_(std::uint64_t gen);

        void acquireCredential_(std::uint64_t gen);

        void openTransport_(std::uint64_t gen);

        void onOpen_(std::uint64_t gen);

        void onReady_();

        void onMessage_(std::uint64_t gen, const std::string &raw, std::int64_t recv_ts_ns);

        void onControlAck_(const InboundFrame &f);

        void onClose_(std::uint64_t gen, boost::system::error_code ec);

        void teardownConnection_();

        void closeTransport_(std::string reason);

        void scheduleReconnect_();

        /// Control frames (strand)
        void sendControl_(ControlOp op, const std::vector<Topic> &topics, std::chrono::milliseconds pause_after);

        void enqueueControl_(std::string frame, std::chrono::milliseconds pause_after);

        void pumpControl_();

        void armControlTimer_(std::chrono::steady_clock::duration wait);

        [[nodiscard]] bool isPending_(const std::string &channel) const;

        /// Credentials (strand)
        void onAuthFailure_(std::string_view why);

        void armRenewTimer_();

        void renewCredential_();

        void swapCredential_(Credential next);

        /// Revoke the current credential best-effort and forget it.
        void retireCredential_();

        void revoke_(const Credential &cred);

        /// Shutdown (strand)
        void stopInternal_();

        void setState_(ConnectionState s);

        void report_(ErrorKind kind, std::string_view msg);

        void log_(LogLevel level, std::string_view msg) const;

        static std::int64_t now_ns_() noexcept;

    private:
        boost::asio::io_context &ioc_;
        HeartbeatMonitor::Strand strand_;
        StreamObserver obs_;
        Lifetime lifetime_; // every handler that reaches `this` runs through lifetime_.guard

        StreamConfig cfg_; /// DO NOT READ IN HOT PATH
        RuntimeResolved rt_;
        AnyAdapter adapter_;

        SubscriptionRegistry registry_;
        InboundDispatcher dispatcher_;
        RateLimiter limiter_{5};
        ExponentialBackoff backoff_;
        HeartbeatMonitor heartbeat_;

        std::shared_ptr<ISessionCredentialProvider> provider_;
        TransportFactory transport_factory_;

        std::shared_ptr<ITransport> transport_;
        std::uint64_t conn_gen_{0}; // bumps per attempt; callbacks of older attempts are ignored
        std::string close_reason_; // set when we close on purpose, suppresses the transient report

        Credential credential_;

        std::deque<ControlItem> control_queue_;
        bool control_timer_armed_{false};
        std::uint64_t control_gen_{0};
        std::unordered_map<std::string, PendingRequest> pending_;
        std::uint64_t next_request_id_{0};

        boost::asio::steady_timer reconnect_timer_;
        boost::asio::steady_timer control_timer_;
        boost::asio::steady_timer auth_timer_;
        boost::asio::steady_timer renew_timer_;
        bool reconnect_scheduled_{false};
        std::size_t consecutive_auth_failures_{0};

        bool initialized_{false};
        bool torn_down_{false};
        std::atomic<bool> started_{false};
        std::atomic<bool> stopped_{false};
        std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

        mutable std::mutex ready_mtx_;
        std::condition_variable ready_cv_;

        std::atomic<std::uint64_t> control_frames_sent_{0};
        std::atomic<std::uint64_t> connections_{0};
        std::atomic<std::uint64_t> reconnect_attempts_{0};
        std::atomic<std::uint64_t> auth_failures_{0};
    };
} // namespace pushfeed
