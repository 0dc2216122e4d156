#pragma once

#include "common_types.hpp"
#include <map>
#include <optional>
#include <string>

namespace strategy_engine {

    // Minimal memory a strategy carries between bars: the last above/below relation of
    // every tracked indicator pair and the last regime of regime-based strategies.
    // Owned by the pipeline and passed into each evaluate() call.
    class CrossingState {
    public:
        // Record whether lhs is above rhs on this bar and return the edge relative to the
        // previous observation. The first observation of a pair never produces an edge.
        CrossEdge observe(const std::string& pair_key, double lhs, double rhs);

        // Pair values unavailable on this bar: the relation is kept, the edge cleared
        void markUnavailable(const std::string& pair_key);

        // Edge produced by the latest observation (None if never observed)
        CrossEdge edge(const std::string& pair_key) const;

        std::optional<bool> isAbove(const std::string& pair_key) const;

        // Store the regime for `key` and return the previous one (nullopt on first observation)
        std::optional<int> observeRegime(const std::string& key, int regime);

        void clear();

        bool operator==(const CrossingState& other) const;

    private:
        struct PairState {
            bool above = false;
            CrossEdge last_edge = CrossEdge::None;
            bool operator==(const PairState& other) const {
                return above == other.above && last_edge == other.last_edge;
            }
        };
        std::map<std::string, PairState> pairs_;
        std::map<std::string, int> regimes_;
    };

    // Canonical key of an ordered indicator pair ("ma_short|ma_long")
    std::string pairKey(const std::string& lhs, const std::string& rhs);

    // One tracked relation: `first` against indicator `second`, or against a fixed `level`
    struct CrossPair {
        std::string first;
        std::string second;
        std::optional<double> level;

        // "ma_short|ma_long", "rsi|30"
        std::string key() const;

        bool operator==(const CrossPair& other) const {
            return first == other.first && second == other.second && level == other.level;
        }
    };

} // namespace strategy_engine
