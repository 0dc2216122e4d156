#include "indicator_cross_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

IndicatorCrossCondition::IndicatorCrossCondition(std::string indicator1_name,
                                                 CrossDirection direction,
                                                 std::string indicator2_name)
    : pair_{std::move(indicator1_name), std::move(indicator2_name), std::nullopt},
      direction_(direction)
{
    if (pair_.first.empty() || pair_.second.empty()) {
        throw std::invalid_argument("Indicator names cannot be empty for IndicatorCrossCondition.");
    }
    if (pair_.first == pair_.second) {
        throw std::invalid_argument("Cannot check cross condition for the same indicator.");
    }
}

IndicatorCrossCondition::IndicatorCrossCondition(std::string indicator_name, CrossDirection direction, double level)
    : pair_{std::move(indicator_name), std::string(), level},
      direction_(direction)
{
    if (pair_.first.empty()) {
        throw std::invalid_argument("Indicator name cannot be empty for IndicatorCrossCondition.");
    }
    if (!std::isfinite(level)) {
        throw std::invalid_argument("Cross level must be finite.");
    }
}

bool IndicatorCrossCondition::evaluate(const EvaluationContext& context) const {
    CrossEdge edge = context.crossings.edge(getPairKey());
    if (direction_ == CrossDirection::Above) {
        return edge == CrossEdge::CrossedAbove;
    }
    return edge == CrossEdge::CrossedBelow;
}

std::string IndicatorCrossCondition::describe() const {
    return fmt::format("{} crosses {} {}",
                       pair_.first,
                       direction_ == CrossDirection::Above ? "above" : "below",
                       pair_.level ? fmt::format("{:g}", *pair_.level) : pair_.second);
}

} // namespace strategy_engine
