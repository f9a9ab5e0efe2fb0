#include "pushfeed/SubscriptionRegistry.hpp"

#include <algorithm>

namespace pushfeed {
    UpsertResult SubscriptionRegistry::upsert(Topic topic, std::string key, std::string channel,
                                              MessageHandler handler) {
        std::lock_guard lock(mtx_);

        const auto owner = channel_to_key_.find(channel);
        if (owner != channel_to_key_.end() && owner->second != key) return UpsertResult::ChannelTaken;

        auto it = by_key_.find(key);
        if (it != by_key_.end()) {
            // Re-subscribe: same key, same channel. Only the handler changes; the replayed topic
            // keeps the spelling it was first registered with.
            it->second.handler = std::move(handler);
            it->second.desired = true;
            return UpsertResult::Updated;
        }

        channel_to_key_[channel] = key;

        Subscription sub;
        sub.topic = std::move(topic);
        sub.key = key;
        sub.channel = std::move(channel);
        sub.handler = std::move(handler);
        by_key_.emplace(std::move(key), std::move(sub));
        return UpsertResult::Inserted;
    }

    std::optional<Subscription> SubscriptionRegistry::remove(const std::string &key) {
        std::lock_guard lock(mtx_);

        auto it = by_key_.find(key);
        if (it == by_key_.end()) return std::nullopt;

        Subscription out = std::move(it->second);
        by_key_.erase(it);
        channel_to_key_.erase(out.channel);
        return out;
    }

    bool SubscriptionRegistry::contains(const std::string &key) const {
        std::lock_guard lock(mtx_);
        return by_key_.contains(key);
    }

    std::optional<Topic> SubscriptionRegistry::topicFor(const std::string &key) const {
        std::lock_guard lock(mtx_);
        const auto it = by_key_.find(key);
        if (it == by_key_.end()) return std::nullopt;
        return it->second.topic;
    }

    std::size_t SubscriptionRegistry::size() const {
        std::lock_guard lock(mtx_);
        return by_key_.size();
    }

    std::optional<Route> SubscriptionRegistry::routeFor(std::string_view channel) const {
        std::lock_guard lock(mtx_);

        const auto cit = channel_to_key_.find(std::string(channel));
        if (cit == channel_to_key_.end()) return std::nullopt;

        const auto it = by_key_.find(cit->second);
        if (it == by_key_.end() || !it->second.handler) return std::nullopt;

        return Route{it->first, it->second.handler};
    }

    std::vector<Topic> SubscriptionRegistry::desiredTopics() const {
        std::lock_guard lock(mtx_);

        std::vector<Topic> out;
        out.reserve(by_key_.size());
        for (const auto &[key, sub]: by_key_) {
            if (sub.desired) out.push_back(sub.topic);
        }
        return out;
    }

    std::vector<std::vector<Topic> > SubscriptionRegistry::replayBatches(std::size_t batch_size) const {
        const std::vector<Topic> topics = desiredTopics();
        const std::size_t n = std::max<std::size_t>(batch_size, 1);

        std::vector<std::vector<Topic> > batches;
        for (std::size_t i = 0; i < topics.size(); i += n) {
            const std::size_t end = std::min(topics.size(), i + n);
            batches.emplace_back(topics.begin() + static_cast<std::ptrdiff_t>(i),
                                 topics.begin() + static_cast<std::ptrdiff_t>(end));
        }
        return batches;
    }

    void SubscriptionRegistry::markActive(const std::vector<std::string> &channels, bool active) {
        std::lock_guard lock(mtx_);

        for (const auto &ch: channels) {
            const auto cit = channel_to_key_.find(ch);
            if (cit == channel_to_key_.end()) continue;
            const auto it = by_key_.find(cit->second);
            if (it != by_key_.end()) it->second.active = active;
        }
    }

    void SubscriptionRegistry::markAllInactive() {
        std::lock_guard lock(mtx_);
        for (auto &[key, sub]: by_key_) sub.active = false;
    }

    bool SubscriptionRegistry::isActive(const std::string &key) const {
        std::lock_guard lock(mtx_);
        const auto it = by_key_.find(key);
        return it != by_key_.end() && it->second.active;
    }

    void SubscriptionRegistry::setDefaultHandler(MessageHandler handler) {
        std::lock_guard lock(mtx_);
        default_handler_ = std::move(handler);
    }

    MessageHandler SubscriptionRegistry::defaultHandler() const {
        std::lock_guard lock(mtx_);
        return default_handler_;
    }
} // namespace pushfeed
