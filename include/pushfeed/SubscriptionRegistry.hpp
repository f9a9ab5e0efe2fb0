#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "abstract/StreamClient.hpp"
#include "pushfeed/Topic.hpp"

namespace pushfeed {
    struct Subscription {
        Topic topic;
        std::string key; ///< normalized topic key, unique in the registry
        std::string channel; ///< venue wire name inbound frames are routed by
        MessageHandler handler;
        bool desired{true};
        bool active{false}; ///< acknowledged on the current connection
    };

    /// Handler lookup result, copied out so the handler runs without the registry lock held.
    struct Route {
        std::string key;
        MessageHandler handler;
    };

    enum class UpsertResult : std::uint8_t {
        Inserted,
        Updated, // key known: handler replaced, stored topic and acknowledgement kept
        ChannelTaken // another key already routes this channel; nothing changed
    };

    /**
     * Durable set of desired topics and their handlers. Outlives any single connection.
     *
     * Thread-safe: subscribe/unsubscribe from application threads race with replay and
     * routing on the connection strand.
     *
     * Keys and channels are one-to-one: a channel is owned by exactly one key.
     */
    class SubscriptionRegistry {
    public:
        /// Insert `key`, or replace its handler if known. Refused if `channel` belongs to another key.
        UpsertResult upsert(Topic topic, std::string key, std::string channel, MessageHandler handler);

        /// Remove `key`. Returns the removed subscription, nullopt if it was absent.
        std::optional<Subscription> remove(const std::string &key);

        [[nodiscard]] bool contains(const std::string &key) const;

        /// The topic as first subscribed under `key`.
        [[nodiscard]] std::optional<Topic> topicFor(const std::string &key) const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const { return size() == 0; }

        [[nodiscard]] std::optional<Route> routeFor(std::string_view channel) const;

        /// Desired topics in stable (key) order.
        [[nodiscard]] std::vector<Topic> desiredTopics() const;

        /// Desired topics split into groups of at most `batch_size`.
        [[nodiscard]] std::vector<std::vector<Topic> > replayBatches(std::size_t batch_size) const;

        void markActive(const std::vector<std::string> &channels, bool active);

        void markAllInactive();

        [[nodiscard]] bool isActive(const std::string &key) const;

        void setDefaultHandler(MessageHandler handler);

        [[nodiscard]] MessageHandler defaultHandler() const;

    private:
        mutable std::mutex mtx_;
        std::map<std::string, Subscription> by_key_;
        std::unordered_map<std::string, std::string> channel_to_key_;
        MessageHandler default_handler_;
    };
} // namespace pushfeed
