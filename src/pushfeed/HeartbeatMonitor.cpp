#include "pushfeed/HeartbeatMonitor.hpp"

namespace pushfeed {
    HeartbeatMonitor::HeartbeatMonitor(Strand &strand,
                                       std::chrono::milliseconds interval,
                                       std::chrono::milliseconds timeout,
                                       Lifetime lifetime)
        : lifetime_(std::move(lifetime)),
          timer_(strand),
          interval_(interval),
          timeout_(timeout) {
    }

    HeartbeatMonitor::~HeartbeatMonitor() {
        auto lock = lifetime_.expire();
        timer_.cancel();
    }

    void HeartbeatMonitor::configure(std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
        interval_ = interval;
        timeout_ = timeout;
    }

    void HeartbeatMonitor::start(ProbeFn probe, StallFn on_stall, clock::time_point now) {
        stop();

        probe_ = std::move(probe);
        on_stall_ = std::move(on_stall);
        last_traffic_ = now;
        outstanding_probe_.reset();

        if (interval_.count() <= 0) return; // disabled

        running_ = true;
        arm_();
    }

    void HeartbeatMonitor::stop() {
        running_ = false;
        ++gen_;
        timer_.cancel();
        outstanding_probe_.reset();
    }

    void HeartbeatMonitor::onTraffic(clock::time_point now) {
        if (now > last_traffic_) last_traffic_ = now;
    }

    void HeartbeatMonitor::onPong(clock::time_point now) {
        onTraffic(now);
        outstanding_probe_.reset();
    }

    void HeartbeatMonitor::onProbeSent(clock::time_point now) {
        if (!outstanding_probe_) outstanding_probe_ = now;
    }

    bool HeartbeatMonitor::isStale(clock::time_point now) const {
        if (timeout_.count() <= 0) return false;

        if (outstanding_probe_ && now - *outstanding_probe_ > timeout_) return true;
        return now - last_traffic_ > interval_ + timeout_;
    }

    void HeartbeatMonitor::arm_() {
        const std::uint64_t gen = gen_;
        timer_.expires_after(interval_);
        timer_.async_wait(lifetime_.guard([this, gen](const boost::system::error_code &ec) {
            if (ec) return; // canceled
            if (gen != gen_ || !running_) return;
            onTick_();
        }));
    }

    void HeartbeatMonitor::onTick_() {
        const auto now = clock::now();

        if (isStale(now)) {
            running_ = false;
            ++gen_;
            if (on_stall_) on_stall_();
            return;
        }

        if (probe_ && !probe_()) {
            // Transport already closed: the close path owns recovery.
            running_ = false;
            return;
        }

        onProbeSent(now);
        arm_();
    }
} // namespace pushfeed
