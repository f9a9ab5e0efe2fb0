#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "pushfeed/Topic.hpp"

namespace pushfeed {
    /**
     * @brief Return code for synchronous client operations.
     *
     * Semantics:
     *  - OK            : Accepted (async work enqueued) or completed.
     *  - ERROR         : Precondition failed or invalid configuration.
     *  - INVALID_TOPIC : Topic shape rejected by the venue adapter; nothing was sent.
     *  - UNKNOWN_TOPIC : Topic is not registered; nothing was sent.
     *  - STOPPED       : Client was stopped; the request is refused instead of queued.
     *  - NOT_SUPPORTED : Venue/feed does not offer the requested operation.
     */
    enum class Status {
        OK,
        ERROR,
        INVALID_TOPIC,
        UNKNOWN_TOPIC,
        STOPPED,
        NOT_SUPPORTED
    };

    inline const char *to_string(Status s) {
        switch (s) {
            case Status::OK: return "OK";
            case Status::ERROR: return "ERROR";
            case Status::INVALID_TOPIC: return "INVALID_TOPIC";
            case Status::UNKNOWN_TOPIC: return "UNKNOWN_TOPIC";
            case Status::STOPPED: return "STOPPED";
            case Status::NOT_SUPPORTED: return "NOT_SUPPORTED";
            default: return "UNKNOWN";
        }
    }

    /// Error taxonomy reported through StreamObserver::on_error.
    enum class ErrorKind : std::uint8_t {
        TRANSIENT, // network drop, timeout, stale connection; always retried
        AUTHENTICATION, // credential rejected; retried with a fresh credential
        PROTOCOL, // malformed/unroutable/rejected frame; connection stays up
        USAGE, // invalid call from the application
        FATAL // manager stopped for good
    };

    inline const char *to_string(ErrorKind k) {
        switch (k) {
            case ErrorKind::TRANSIENT: return "transient";
            case ErrorKind::AUTHENTICATION: return "authentication";
            case ErrorKind::PROTOCOL: return "protocol";
            case ErrorKind::USAGE: return "usage";
            case ErrorKind::FATAL: return "fatal";
            default: return "unknown";
        }
    }

    enum class ConnectionState : std::uint8_t {
        DISCONNECTED,
        CONNECTING,
        AUTHENTICATING,
        READY,
        STOPPED
    };

    inline const char *to_string(ConnectionState s) {
        switch (s) {
            case ConnectionState::DISCONNECTED: return "DISCONNECTED";
            case ConnectionState::CONNECTING: return "CONNECTING";
            case ConnectionState::AUTHENTICATING: return "AUTHENTICATING";
            case ConnectionState::READY: return "READY";
            case ConnectionState::STOPPED: return "STOPPED";
            default: return "UNKNOWN";
        }
    }

    enum class VenueId { BINANCE, BYBIT, HYPERLIQUID, UNKNOWN };

    inline const char *to_string(VenueId v) {
        switch (v) {
            case VenueId::BINANCE: return "binance";
            case VenueId::BYBIT: return "bybit";
            case VenueId::HYPERLIQUID: return "hyperliquid";
            default: return "UNKNOWN";
        }
    }

    enum class FeedScope { PUBLIC, PRIVATE };

    inline const char *to_string(FeedScope s) {
        return s == FeedScope::PRIVATE ? "private" : "public";
    }

    /**
     * @brief Configuration for one streaming connection.
     *
     * Zero durations / counts mean "use the venue default" unless stated otherwise.
     * Resolved once in init(); never read on the hot path.
     */
    struct StreamConfig {
        VenueId venue{VenueId::UNKNOWN};
        FeedScope scope{FeedScope::PUBLIC};

        std::string market{"spot"}; ///< binance: spot|um|cm|pm, bybit: spot|linear|inverse|option
        bool testnet{false};

        std::string ws_host; ///< optional override, "" = default
        std::string ws_port; ///< optional override, "" = default
        std::string ws_path; ///< optional override, "" = default

        std::string rest_host; ///< optional override for the credential side channel
        std::string rest_port; ///< optional override for the credential side channel

        std::string api_key;
        std::string api_secret;

        std::chrono::milliseconds ping_interval{0};
        std::chrono::milliseconds ping_timeout{0};
        std::chrono::milliseconds connect_timeout{5000};

        std::chrono::milliseconds reconnect_initial{1000};
        std::chrono::milliseconds reconnect_max{30000};
        double reconnect_factor{1.7};

        std::size_t control_rate_per_sec{0};
        std::size_t max_topics_per_frame{0};
        std::chrono::milliseconds replay_batch_pause{200};

        std::chrono::milliseconds auth_timeout{10000};
        std::chrono::seconds auth_validity{30}; ///< signed auth frames expire after this window
        std::chrono::milliseconds credential_renew_interval{25 * 60 * 1000};
        std::size_t max_consecutive_auth_failures{0}; ///< 0 = never give up

        std::string identity; ///< log prefix, "" = "<venue>-<scope>"
    };

    /// One decoded inbound message, presented with snapshot semantics.
    struct StreamMessage {
        std::string key; ///< normalized topic key ("" for the default handler)
        std::string channel; ///< venue channel the frame arrived on
        nlohmann::json data; ///< merged view for delta feeds, payload otherwise
        bool merged{false}; ///< true when data was produced by snapshot/delta merging
        std::int64_t recv_ts_ns{0};
    };

    using MessageHandler = std::function<void(const StreamMessage &)>;

    /**
     * @brief Abstract interface of a streaming client.
     *
     * Lifecycle:
     *   1) init(cfg)   : validate config, resolve venue defaults. No network I/O.
     *   2) start()     : enqueue connect on the externally-driven io_context.
     *   3) stop()      : terminal; cancels timers, closes the transport. Idempotent.
     *
     * subscribe()/unsubscribe() may be called at any time from any thread.
     */
    struct IStreamClient {
        virtual ~IStreamClient() = default;

        virtual Status init(const StreamConfig &) = 0;

        virtual Status start() = 0;

        virtual Status stop() = 0;

        virtual Status subscribe(const Topic &topic, MessageHandler handler) = 0;

        virtual Status unsubscribe(const Topic &topic) = 0;

        [[nodiscard]] virtual ConnectionState state() const noexcept = 0;
    };
} // namespace pushfeed
