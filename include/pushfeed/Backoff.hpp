#pragma once

#include <algorithm>
#include <chrono>

namespace pushfeed {
    /// Exponential reconnect delay: initial, initial*factor, ... capped at max. reset() after a good connection.
    class ExponentialBackoff {
    public:
        ExponentialBackoff() = default;

        ExponentialBackoff(std::chrono::milliseconds initial, double factor, std::chrono::milliseconds max)
            : initial_(initial), max_(max), factor_(factor), next_(initial) {
        }

        std::chrono::milliseconds next() {
            const auto current = std::min(next_, max_);
            const auto grown = std::chrono::milliseconds(
                static_cast<std::chrono::milliseconds::rep>(static_cast<double>(current.count()) * factor_));
            next_ = std::min(std::max(grown, current), max_);
            return current;
        }

        [[nodiscard]] std::chrono::milliseconds peek() const noexcept { return std::min(next_, max_); }

        void reset() noexcept { next_ = initial_; }

    private:
        std::chrono::milliseconds initial_{1000};
        std::chrono::milliseconds max_{30000};
        double factor_{1.7};
        std::chrono::milliseconds next_{1000};
    };
} // namespace pushfeed
