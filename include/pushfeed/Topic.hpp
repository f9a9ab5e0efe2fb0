#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>

namespace pushfeed {
    /**
     * A subscribable feed: a feed kind, an optional symbol and optional extra parameters.
     *
     *   Topic{"orderbook", "BTCUSDT", {{"depth", "50"}}}
     *   Topic{"position"}                      // account-wide
     */
    struct Topic {
        std::string kind;
        std::string symbol; ///< empty for account-wide topics
        std::map<std::string, std::string> params; ///< ordered, so keys are order-independent

        [[nodiscard]] std::string param(const std::string &name, std::string fallback = {}) const {
            const auto it = params.find(name);
            return it == params.end() ? fallback : it->second;
        }

        bool operator==(const Topic &) const = default;
    };

    /**
     * Normalized topic key, case-independent in kind and symbol.
     *  - account-wide topics : "<kind>"                      e.g. "position"
     *  - symbol-scoped       : "<kind>:<lowercase symbol>"   e.g. "orderbook:btcusdt"
     *  - parameters (sorted) : appended as ",k=v"            e.g. "orderbook:btcusdt,depth=50"
     *
     * Parameter values are taken as given; adapters fold the ones their venue treats
     * case-insensitively before the key is built.
     */
    inline std::string makeTopicKey(const Topic &t) {
        std::string key = boost::algorithm::to_lower_copy(t.kind);
        if (!t.symbol.empty()) {
            key += ':';
            key += boost::algorithm::to_lower_copy(t.symbol);
        }
        for (const auto &[k, v]: t.params) {
            key += ',';
            key += k;
            key += '=';
            key += v;
        }
        return key;
    }

    /**
     * Parse the CLI form "kind[:SYMBOL][:k=v[,k=v...]]".
     * Returns nullopt for an empty kind or a parameter without '='.
     */
    inline std::optional<Topic> parseTopic(std::string_view text) {
        Topic t;

        const auto first = text.find(':');
        t.kind = std::string(text.substr(0, first));
        if (t.kind.empty()) return std::nullopt;
        if (first == std::string_view::npos) return t;

        std::string_view rest = text.substr(first + 1);
        const auto second = rest.find(':');
        const std::string_view head = rest.substr(0, second);

        std::string_view params;
        if (head.find('=') != std::string_view::npos) {
            // "kind:k=v" form, no symbol
            params = rest;
        } else {
            t.symbol = std::string(head);
            if (second != std::string_view::npos) params = rest.substr(second + 1);
        }

        while (!params.empty()) {
            const auto comma = params.find(',');
            const std::string_view kv = params.substr(0, comma);
            const auto eq = kv.find('=');
            if (eq == std::string_view::npos || eq == 0) return std::nullopt;
            t.params[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
            if (comma == std::string_view::npos) break;
            params.remove_prefix(comma + 1);
        }

        return t;
    }
} // namespace pushfeed
