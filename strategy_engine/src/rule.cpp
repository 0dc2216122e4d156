#include "rule.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

Rule::Rule(std::string rule_name,
           std::unique_ptr<ICondition> condition,
           core::SignalDirection direction_on_true,
           double strength)
    : name_(std::move(rule_name)),
      condition_(std::move(condition)),
      direction_(direction_on_true),
      strength_(strength)
{
    if (name_.empty()) {
        throw std::invalid_argument("Rule name cannot be empty.");
    }
    if (!condition_) {
        throw std::invalid_argument(fmt::format("Condition cannot be null for Rule '{}'.", name_));
    }
    if (direction_ == core::SignalDirection::Hold) {
        throw std::invalid_argument(fmt::format("Direction cannot be 'Hold' for Rule '{}'.", name_));
    }
    if (strength_ < 0.0 || strength_ > 1.0) {
        throw std::invalid_argument(fmt::format("Strength {} of Rule '{}' is outside [0, 1].", strength_, name_));
    }
}

core::SignalDirection Rule::evaluate(const EvaluationContext& context) const {
    bool condition_result = condition_->evaluate(context);

    core::logging::getLogger()->trace("Rule '{}' evaluated condition '{}' -> {}",
                                      name_, condition_->describe(), condition_result);

    return condition_result ? direction_ : core::SignalDirection::Hold;
}

std::string Rule::describe() const {
    return fmt::format("Rule('{}'): IF ({}) THEN {} @ {:.2f}",
                       name_, condition_->describe(), core::toString(direction_), strength_);
}

} // namespace strategy_engine
