#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "pushfeed/Lifetime.hpp"

namespace pushfeed {
    /**
     * Liveness probe for one Ready connection.
     *
     * Every `interval` the monitor first checks staleness, then sends a probe. The connection is
     * stale when a probe stays unanswered for longer than `timeout`, or when nothing at all was
     * received for longer than `interval + timeout`. Staleness fires `on_stall` once and stops the monitor.
     *
     * Runs on the owner's strand; every method must be called from that strand. An owner that
     * passes its own Lifetime keeps probe and stall callbacks from running once it is gone.
     */
    class HeartbeatMonitor {
    public:
        using clock = std::chrono::steady_clock;
        using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

        /// Sends one probe. Returns false when the transport is already closed.
        using ProbeFn = std::function<bool()>;
        using StallFn = std::function<void()>;

        HeartbeatMonitor(Strand &strand, std::chrono::milliseconds interval, std::chrono::milliseconds timeout,
                         Lifetime lifetime = {});

        ~HeartbeatMonitor();

        HeartbeatMonitor(const HeartbeatMonitor &) = delete;

        HeartbeatMonitor &operator=(const HeartbeatMonitor &) = delete;

        void configure(std::chrono::milliseconds interval, std::chrono::milliseconds timeout);

        void start(ProbeFn probe, StallFn on_stall, clock::time_point now = clock::now());

        void stop();

        /// Any inbound frame.
        void onTraffic(clock::time_point now = clock::now());

        /// Liveness reply (control pong or venue pong frame).
        void onPong(clock::time_point now = clock::now());

        /// Record a probe sent at `now`; a probe already outstanding keeps its original time.
        void onProbeSent(clock::time_point now);

        [[nodiscard]] bool isStale(clock::time_point now) const;

        [[nodiscard]] bool running() const noexcept { return running_; }
        [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
        [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    private:
        void arm_();

        void onTick_();

        Lifetime lifetime_;
        boost::asio::steady_timer timer_;
        std::chrono::milliseconds interval_;
        std::chrono::milliseconds timeout_;

        ProbeFn probe_;
        StallFn on_stall_;

        bool running_{false};
        std::uint64_t gen_{0};

        clock::time_point last_traffic_{};
        std::optional<clock::time_point> outstanding_probe_;
    };
} // namespace pushfeed
