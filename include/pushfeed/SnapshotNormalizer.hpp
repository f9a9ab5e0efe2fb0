#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace pushfeed {
    enum class PayloadShape : std::uint8_t {
        Full, // standalone payload, passed through untouched
        Snapshot, // replaces the maintained state wholesale
        Delta // merged into the maintained state
    };

    inline const char *to_string(PayloadShape s) {
        switch (s) {
            case PayloadShape::Full: return "full";
            case PayloadShape::Snapshot: return "snapshot";
            case PayloadShape::Delta: return "delta";
            default: return "?";
        }
    }

    /// A list-of-levels field inside a delta payload, e.g. "b": [["100.5","2.0"], ...].
    struct LevelField {
        std::string name;
        bool descending{false}; ///< bids: best (highest) first
        std::size_t price_index{0};
        std::size_t size_index{1};
    };

    /**
     * Per-channel merge policy.
     * Configured level fields keep their sort order on insert. Any other array-of-arrays field is
     * patched the same way with price at [0] and size at [1], new levels appended.
     * Every other field is overwritten.
     */
    struct DeltaSpec {
        std::vector<LevelField> level_fields;

        [[nodiscard]] const LevelField *find(const std::string &name) const {
            for (const auto &f: level_fields) {
                if (f.name == name) return &f;
            }
            return nullptr;
        }
    };

    /**
     * Maintains the merged state of delta-style feeds, keyed by topic key.
     *
     * A state only exists after a Snapshot was applied; Delta payloads for a key without state
     * are dropped. Merges run on a copy that replaces the state only if the whole delta applied,
     * so a malformed delta never leaves a half-patched book behind.
     *
     * Not thread-safe; owned by the connection strand.
     */
    class SnapshotNormalizer {
    public:
        enum class Outcome : std::uint8_t {
            Passed, // Full payload, no state involved
            Replaced, // Snapshot stored
            Merged, // Delta merged
            DroppedNoSnapshot, // Delta before any snapshot
            Malformed // Delta could not be applied; state kept as before
        };

        struct Result {
            Outcome outcome{Outcome::Passed};
            std::optional<nlohmann::json> view; ///< what the handler sees; empty when dropped
        };

        Result apply(const std::string &key, PayloadShape shape, const nlohmann::json &payload,
                     const DeltaSpec &spec);

        [[nodiscard]] bool hasSnapshot(const std::string &key) const { return state_.contains(key); }

        [[nodiscard]] const nlohmann::json *state(const std::string &key) const;

        void discard(const std::string &key) { state_.erase(key); }

        void clear() { state_.clear(); }

        [[nodiscard]] std::size_t size() const noexcept { return state_.size(); }

        /// Merge `delta` into `state` in place. Returns false (state partially modified) on malformed input.
        static bool mergeDelta(nlohmann::json &state, const nlohmann::json &delta, const DeltaSpec &spec);

        /// Patch one level list: zero size removes, unseen price inserts, known price updates.
        static bool patchLevels(nlohmann::json &levels, const nlohmann::json &updates, const LevelField &field,
                                bool keep_sorted);

    private:
        std::unordered_map<std::string, nlohmann::json> state_;
    };
} // namespace pushfeed
