#include "pushfeed/SnapshotNormalizer.hpp"

#include <stdexcept>

namespace pushfeed {
    using json = nlohmann::json;

    namespace {
        // Venues send prices/sizes either as strings ("100.5") or as numbers.
        bool levelNumber(const json &v, double &out) noexcept {
            try {
                if (v.is_number()) {
                    out = v.get<double>();
                    return true;
                }
                if (v.is_string()) {
                    std::size_t used = 0;
                    const auto &s = v.get_ref<const std::string &>();
                    out = std::stod(s, &used);
                    return used == s.size();
                }
            } catch (const std::exception &) {
            }
            return false;
        }

        bool isLevelList(const json &v) {
            if (!v.is_array()) return false;
            for (const auto &e: v) {
                if (!e.is_array()) return false;
            }
            return true;
        }

        bool levelPrice(const json &level, const LevelField &field, double &out) {
            if (!level.is_array() || level.size() <= field.price_index) return false;
            return levelNumber(level[field.price_index], out);
        }
    }

    const json *SnapshotNormalizer::state(const std::string &key) const {
        const auto it = state_.find(key);
        return it == state_.end() ? nullptr : &it->second;
    }

    SnapshotNormalizer::Result SnapshotNormalizer::apply(const std::string &key, PayloadShape shape,
                                                         const json &payload, const DeltaSpec &spec) {
        switch (shape) {
            case PayloadShape::Full:
                return Result{Outcome::Passed, payload};

            case PayloadShape::Snapshot: {
                state_[key] = payload;
                return Result{Outcome::Replaced, payload};
            }

            case PayloadShape::Delta: {
                const auto it = state_.find(key);
                if (it == state_.end()) return Result{Outcome::DroppedNoSnapshot, std::nullopt};

                json next = it->second;
                if (!mergeDelta(next, payload, spec)) return Result{Outcome::Malformed, std::nullopt};

                it->second = std::move(next);
                return Result{Outcome::Merged, it->second};
            }
        }
        return Result{Outcome::Malformed, std::nullopt};
    }

    bool SnapshotNormalizer::mergeDelta(json &state, const json &delta, const DeltaSpec &spec) {
        if (!delta.is_object()) return false;
        if (!state.is_object()) return false;

        for (const auto &[name, value]: delta.items()) {
            const LevelField *configured = spec.find(name);

            if (configured) {
                if (!value.is_array()) return false;
                json &levels = state[name];
                if (levels.is_null()) levels = json::array();
                if (!patchLevels(levels, value, *configured, true)) return false;
                continue;
            }

            if (isLevelList(value) && !value.empty()) {
                json &levels = state[name];
                if (levels.is_null()) levels = json::array();
                if (!levels.is_array()) return false;
                LevelField generic;
                generic.name = name;
                if (!patchLevels(levels, value, generic, false)) return false;
                continue;
            }

            // Scalar (or non-level) field: overwrite.
            state[name] = value;
        }
        return true;
    }

    bool SnapshotNormalizer::patchLevels(json &levels, const json &updates, const LevelField &field,
                                         bool keep_sorted) {
        if (!levels.is_array() || !updates.is_array()) return false;

        for (const auto &upd: updates) {
            double price = 0.0;
            if (!levelPrice(upd, field, price)) return false;
            if (upd.size() <= field.size_index) return false;

            double size = 0.0;
            if (!levelNumber(upd[field.size_index], size)) return false;

            // 1) Locate an existing level at this price.
            std::size_t idx = levels.size();
            for (std::size_t i = 0; i < levels.size(); ++i) {
                double p = 0.0;
                if (levelPrice(levels[i], field, p) && p == price) {
                    idx = i;
                    break;
                }
            }

            // 2) Zero size: remove (absent price is a no-op).
            if (size == 0.0) {
                if (idx < levels.size()) levels.erase(idx);
                continue;
            }

            // 3) Known price: update in place.
            if (idx < levels.size()) {
                levels[idx] = upd;
                continue;
            }

            // 4) Unseen price: insert.
            if (!keep_sorted) {
                levels.push_back(upd);
                continue;
            }

            std::size_t pos = levels.size();
            for (std::size_t i = 0; i < levels.size(); ++i) {
                double p = 0.0;
                if (!levelPrice(levels[i], field, p)) continue;
                if (field.descending ? (price > p) : (price < p)) {
                    pos = i;
                    break;
                }
            }
            levels.insert(levels.begin() + static_cast<std::ptrdiff_t>(pos), upd);
        }
        return true;
    }
} // namespace pushfeed
