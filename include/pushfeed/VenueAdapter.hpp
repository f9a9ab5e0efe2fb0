#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "abstract/StreamClient.hpp"
#include "client_connection_handlers/Transport.hpp"
#include "pushfeed/SessionCredential.hpp"
#include "pushfeed/SnapshotNormalizer.hpp"
#include "pushfeed/Topic.hpp"

namespace pushfeed {
    enum class AuthMode : std::uint8_t {
        None,
        UrlCredential, // credential embedded in the connection target (listen key)
        AuthFrame // explicit auth frame after open
    };

    enum class PingMode : std::uint8_t {
        Control, // WebSocket ping control frame, pong observed by the transport
        Text // venue-specific text frame, pong classified by the adapter
    };

    enum class ControlOp : std::uint8_t { Subscribe, Unsubscribe };

    struct VenueCaps {
        bool subscribe_ops{true}; // false: topics are routed locally, nothing is sent
        AuthMode auth{AuthMode::None};
        PingMode ping{PingMode::Control};

        std::size_t control_rate_per_sec{5};
        std::size_t max_topics_per_frame{200};

        std::chrono::milliseconds ping_interval{15000};
        std::chrono::milliseconds ping_timeout{20000};
    };

    enum class FrameKind : std::uint8_t {
        Unknown, // not JSON, or a shape we do not know
        ControlAck, // reply to a subscribe/unsubscribe request
        AuthResult, // reply to the auth frame
        Pong, // liveness reply
        Ping, // server-initiated liveness probe, must be answered
        CredentialExpired, // venue says the session credential is gone
        Data // routed payload
    };

    inline const char *to_string(FrameKind k) {
        switch (k) {
            case FrameKind::Unknown: return "unknown";
            case FrameKind::ControlAck: return "ack";
            case FrameKind::AuthResult: return "auth";
            case FrameKind::Pong: return "pong";
            case FrameKind::Ping: return "ping";
            case FrameKind::CredentialExpired: return "credential-expired";
            case FrameKind::Data: return "data";
            default: return "?";
        }
    }

    struct InboundFrame {
        FrameKind kind{FrameKind::Unknown};

        // ControlAck / AuthResult
        std::string request_id;
        bool success{false};
        std::string message;

        // Data; also set on a ControlAck from venues that acknowledge by channel instead of request id
        std::string channel;
        PayloadShape shape{PayloadShape::Full};
        nlohmann::json payload;
    };

    /**
     * Venue adapters share one method set and are held in an AnyAdapter by the
     * ConnectionManager, dispatched with std::visit.
     *
     * Cold-path:
     *      - caps / endpoints / topic canonicalization, validation and channel naming
     *      - control, auth and ping frame building
     * Hot-path:
     *      - classify(): parse + shape a single inbound frame
     *      - deltaSpec(): merge policy for a data channel
     */
    struct BinanceAdapter {
        VenueCaps caps(const StreamConfig &cfg) const noexcept;

        EndPoint endpoint(const StreamConfig &cfg, const Credential *cred) const;

        EndPoint credentialEndpoint(const StreamConfig &cfg) const;

        /// Venue spelling of kind, symbol and parameter values; applied before keys and channels are built.
        Topic canonical(Topic t) const;

        /// Rejects unknown kinds and parameters the channel would not carry.
        bool validate(const Topic &t, FeedScope scope) const noexcept;

        std::string channelFor(const Topic &t) const;

        std::vector<std::string> controlFrames(ControlOp op, const std::vector<Topic> &topics,
                                               std::uint64_t request_id) const;

        std::string authFrame(const Credential &) const { return {}; }

        std::string pingFrame() const { return {}; }
        std::string pongFrame() const { return {}; }

        InboundFrame classify(std::string_view msg, FeedScope scope) const noexcept;

        DeltaSpec deltaSpec(std::string_view) const { return {}; }
    };

    /// https://bybit-exchange.github.io/docs/v5/ws/connect
    struct BybitAdapter {
        VenueCaps caps(const StreamConfig &cfg) const noexcept;

        EndPoint endpoint(const StreamConfig &cfg, const Credential *cred) const;

        EndPoint credentialEndpoint(const StreamConfig &) const { return {}; }

        Topic canonical(Topic t) const;

        bool validate(const Topic &t, FeedScope scope) const noexcept;

        std::string channelFor(const Topic &t) const;

        std::vector<std::string> controlFrames(ControlOp op, const std::vector<Topic> &topics,
                                               std::uint64_t request_id) const;

        std::string authFrame(const Credential &cred) const;

        std::string pingFrame() const;
        std::string pongFrame() const;

        InboundFrame classify(std::string_view msg, FeedScope scope) const noexcept;

        DeltaSpec deltaSpec(std::string_view channel) const;
    };

    /// https://hyperliquid.gitbook.io/hyperliquid-docs/for-developers/api/websocket
    struct HyperliquidAdapter {
        VenueCaps caps(const StreamConfig &cfg) const noexcept;

        EndPoint endpoint(const StreamConfig &cfg, const Credential *cred) const;

        EndPoint credentialEndpoint(const StreamConfig &) const { return {}; }

        /// Coins keep their spelling (names like "kPEPE" are case-sensitive); user addresses are lowercased.
        Topic canonical(Topic t) const;

        bool validate(const Topic &t, FeedScope scope) const noexcept;

        std::string channelFor(const Topic &t) const;

        std::vector<std::string> controlFrames(ControlOp op, const std::vector<Topic> &topics,
                                               std::uint64_t request_id) const;

        std::string authFrame(const Credential &) const { return {}; }

        std::string pingFrame() const;
        std::string pongFrame() const { return {}; }

        InboundFrame classify(std::string_view msg, FeedScope scope) const noexcept;

        DeltaSpec deltaSpec(std::string_view) const { return {}; }
    };

    using AnyAdapter = std::variant<BinanceAdapter, BybitAdapter, HyperliquidAdapter>;

    /// Returns false for VenueId::UNKNOWN.
    inline bool makeAdapter(VenueId venue, AnyAdapter &out) {
        switch (venue) {
            case VenueId::BINANCE: out = BinanceAdapter{};
                return true;
            case VenueId::BYBIT: out = BybitAdapter{};
                return true;
            case VenueId::HYPERLIQUID: out = HyperliquidAdapter{};
                return true;
            default: return false;
        }
    }
} // namespace pushfeed
