#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "pushfeed/SnapshotNormalizer.hpp"
#include "pushfeed/SubscriptionRegistry.hpp"
#include "pushfeed/VenueAdapter.hpp"
#include "utils/Logging.hpp"

namespace pushfeed {
    /// Plain copy of the dispatcher counters.
    struct DispatchStats {
        std::uint64_t frames{0}; ///< data frames seen
        std::uint64_t delivered{0}; ///< handler invocations (routed + default)
        std::uint64_t unroutable{0}; ///< no topic and no default handler
        std::uint64_t dropped_no_snapshot{0};
        std::uint64_t malformed{0}; ///< unclassifiable frames and deltas that failed to merge
        std::uint64_t handler_errors{0};
    };

    /**
     * Routes classified data frames to subscription handlers.
     *
     * Data frame -> registry route (or default handler) -> snapshot normalizer -> handler.
     * Handler exceptions are logged and counted; they never reach the connection.
     *
     * dispatch()/discard()/reset() run on the connection strand. stats() may be read from any thread.
     */
    class InboundDispatcher {
    public:
        enum class Result : std::uint8_t {
            Delivered,
            DeliveredDefault,
            Unroutable,
            DroppedNoSnapshot,
            Malformed
        };

        using DeltaSpecFn = std::function<DeltaSpec(std::string_view channel)>;

        InboundDispatcher(SubscriptionRegistry &registry, LogFn log);

        void setDeltaSpec(DeltaSpecFn fn) { delta_spec_ = std::move(fn); }

        void setLogPrefix(std::string prefix) { prefix_ = std::move(prefix); }

        Result dispatch(InboundFrame &frame, std::int64_t recv_ts_ns);

        /// Count and log a frame the adapter could not classify.
        void noteMalformed(std::string_view raw, std::string_view why);

        /// Forget the merged state of one topic (unsubscribe).
        void discard(const std::string &key) { normalizer_.discard(key); }

        /// Forget all merged state (connection lost; the venue re-sends snapshots).
        void reset() { normalizer_.clear(); }

        [[nodiscard]] DispatchStats stats() const noexcept;

        [[nodiscard]] const SnapshotNormalizer &normalizer() const noexcept { return normalizer_; }

    private:
        void deliver_(const MessageHandler &handler, const StreamMessage &msg);

        void log_(LogLevel level, const std::string &msg) const {
            if (log_fn_) log_fn_(level, prefix_ + msg);
        }

        SubscriptionRegistry &registry_;
        SnapshotNormalizer normalizer_;
        DeltaSpecFn delta_spec_;
        LogFn log_fn_;
        std::string prefix_;

        std::atomic<std::uint64_t> frames_{0};
        std::atomic<std::uint64_t> delivered_{0};
        std::atomic<std::uint64_t> unroutable_{0};
        std::atomic<std::uint64_t> dropped_no_snapshot_{0};
        std::atomic<std::uint64_t> malformed_{0};
        std::atomic<std::uint64_t> handler_errors_{0};
    };
} // namespace pushfeed
