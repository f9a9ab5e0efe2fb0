#pragma once

#include <memory>
#include <mutex>
#include <utility>

namespace pushfeed {
    /**
     * Liveness token for handlers queued by an object that is not shared-owned.
     *
     * A guarded handler runs under the token's lock and only while the owner is alive. The owner
     * calls expire() at the top of its destructor: that waits for a guarded handler already running
     * and turns every later one into a no-op. Guarded handlers must not destroy their owner.
     *
     * Copies share the token.
     */
    class Lifetime {
    public:
        Lifetime() : state_(std::make_shared<State>()) {
        }

        template<class F>
        auto guard(F f) const {
            return [state = state_, f = std::move(f)](auto &&... args) mutable {
                std::lock_guard lock(state->mtx);
                if (!state->alive) return;
                f(std::forward<decltype(args)>(args)...);
            };
        }

        /// The returned lock keeps guarded handlers out until it is released.
        [[nodiscard]] std::unique_lock<std::mutex> expire() {
            std::unique_lock lock(state_->mtx);
            state_->alive = false;
            return lock;
        }

    private:
        struct State {
            std::mutex mtx;
            bool alive{true};
        };

        std::shared_ptr<State> state_;
    };
} // namespace pushfeed
