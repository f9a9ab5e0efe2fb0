#include "pushfeed/InboundDispatcher.hpp"

namespace pushfeed {
    InboundDispatcher::InboundDispatcher(SubscriptionRegistry &registry, LogFn log)
        : registry_(registry),
          log_fn_(std::move(log)) {
    }

    InboundDispatcher::Result InboundDispatcher::dispatch(InboundFrame &frame, std::int64_t recv_ts_ns) {
        frames_.fetch_add(1, std::memory_order_relaxed);

        MessageHandler handler;
        std::string key;
        bool via_default = false;

        if (auto route = registry_.routeFor(frame.channel)) {
            key = std::move(route->key);
            handler = std::move(route->handler);
        } else if (auto fallback = registry_.defaultHandler()) {
            // merged state of unregistered channels is keyed by channel
            key = frame.channel;
            handler = std::move(fallback);
            via_default = true;
        } else {
            unroutable_.fetch_add(1, std::memory_order_relaxed);
            log_(LogLevel::DEBUG, "unroutable frame on channel '" + frame.channel + "'");
            return Result::Unroutable;
        }

        const DeltaSpec spec = delta_spec_ ? delta_spec_(frame.channel) : DeltaSpec{};
        auto res = normalizer_.apply(key, frame.shape, frame.payload, spec);

        switch (res.outcome) {
            case SnapshotNormalizer::Outcome::DroppedNoSnapshot:
                dropped_no_snapshot_.fetch_add(1, std::memory_order_relaxed);
                log_(LogLevel::DEBUG, "delta before snapshot dropped for '" + key + "'");
                return Result::DroppedNoSnapshot;
            case SnapshotNormalizer::Outcome::Malformed:
                malformed_.fetch_add(1, std::memory_order_relaxed);
                log_(LogLevel::WARN, "delta could not be merged for '" + key + "'");
                return Result::Malformed;
            default:
                break;
        }

        StreamMessage msg;
        msg.key = via_default ? std::string{} : std::move(key);
        msg.channel = std::move(frame.channel);
        msg.data = std::move(*res.view);
        msg.merged = frame.shape != PayloadShape::Full;
        msg.recv_ts_ns = recv_ts_ns;

        deliver_(handler, msg);
        return via_default ? Result::DeliveredDefault : Result::Delivered;
    }

    void InboundDispatcher::deliver_(const MessageHandler &handler, const StreamMessage &msg) {
        delivered_.fetch_add(1, std::memory_order_relaxed);
        try {
            handler(msg);
        } catch (const std::exception &e) {
            handler_errors_.fetch_add(1, std::memory_order_relaxed);
            log_(LogLevel::ERROR, "handler for '" + msg.channel + "' threw: " + e.what());
        }
    }

    void InboundDispatcher::noteMalformed(std::string_view raw, std::string_view why) {
        malformed_.fetch_add(1, std::memory_order_relaxed);

        std::string msg = "unrecognized frame";
        if (!why.empty()) {
            msg += " (";
            msg += why;
            msg += ")";
        }
        if (debug::raw.load(std::memory_order_relaxed)) {
            msg += ": ";
            msg += debug::raw_excerpt(raw);
        }
        log_(LogLevel::DEBUG, msg);
    }

    DispatchStats InboundDispatcher::stats() const noexcept {
        DispatchStats s;
        s.frames = frames_.load(std::memory_order_relaxed);
        s.delivered = delivered_.load(std::memory_order_relaxed);
        s.unroutable = unroutable_.load(std::memory_order_relaxed);
        s.dropped_no_snapshot = dropped_no_snapshot_.load(std::memory_order_relaxed);
        s.malformed = malformed_.load(std::memory_order_relaxed);
        s.handler_errors = handler_errors_.load(std::memory_order_relaxed);
        return s;
    }
} // namespace pushfeed
