#include "crossing_state.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    std::string pairKey(const std::string& lhs, const std::string& rhs) {
        return lhs + "|" + rhs;
    }

    std::string CrossPair::key() const {
        return level ? pairKey(first, fmt::format("{:g}", *level)) : pairKey(first, second);
    }

    CrossEdge CrossingState::observe(const std::string& pair_key, double lhs, double rhs) {
        const bool now_above = lhs > rhs;
        auto it = pairs_.find(pair_key);
        if (it == pairs_.end()) {
            pairs_[pair_key] = PairState{now_above, CrossEdge::None};
            return CrossEdge::None;
        }

        PairState& state = it->second;
        if (!state.above && now_above) {
            state.last_edge = CrossEdge::CrossedAbove;
        } else if (state.above && !now_above) {
            state.last_edge = CrossEdge::CrossedBelow;
        } else {
            state.last_edge = CrossEdge::None;
        }
        state.above = now_above;
        return state.last_edge;
    }

    void CrossingState::markUnavailable(const std::string& pair_key) {
        auto it = pairs_.find(pair_key);
        if (it != pairs_.end()) {
            it->second.last_edge = CrossEdge::None;
        }
    }

    CrossEdge CrossingState::edge(const std::string& pair_key) const {
        auto it = pairs_.find(pair_key);
        return it == pairs_.end() ? CrossEdge::None : it->second.last_edge;
    }

    std::optional<bool> CrossingState::isAbove(const std::string& pair_key) const {
        auto it = pairs_.find(pair_key);
        if (it == pairs_.end()) return std::nullopt;
        return it->second.above;
    }

    std::optional<int> CrossingState::observeRegime(const std::string& key, int regime) {
        auto it = regimes_.find(key);
        if (it == regimes_.end()) {
            regimes_[key] = regime;
            return std::nullopt;
        }
        int previous = it->second;
        it->second = regime;
        return previous;
    }

    void CrossingState::clear() {
        pairs_.clear();
        regimes_.clear();
    }

    bool CrossingState::operator==(const CrossingState& other) const {
        return pairs_ == other.pairs_ && regimes_ == other.regimes_;
    }

} // namespace strategy_engine
