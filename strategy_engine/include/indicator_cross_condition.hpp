#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include "crossing_state.hpp"
#include <string>

namespace strategy_engine {

    // True only on the bar where indicator1 crosses indicator2 (or a fixed level) in the
    // given direction. Reads the edge from the CrossingState; the owning strategy refreshes
    // that state once per bar for every pair returned by getCrossPair().
    class IndicatorCrossCondition : public ICondition {
    public:
        IndicatorCrossCondition(std::string indicator1_name,
                                CrossDirection direction,
                                std::string indicator2_name);

        // Crossing of a fixed level, e.g. RSI climbing back above 30
        IndicatorCrossCondition(std::string indicator_name, CrossDirection direction, double level);

        virtual ~IndicatorCrossCondition() override = default;

        bool evaluate(const EvaluationContext& context) const override;
        std::string describe() const override;

        const CrossPair& getCrossPair() const { return pair_; }
        std::string getPairKey() const { return pair_.key(); }

    private:
        CrossPair pair_;
        CrossDirection direction_;
    };

} // namespace strategy_engine
