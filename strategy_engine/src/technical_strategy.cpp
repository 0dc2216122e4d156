#include "technical_strategy.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace strategy_engine {

TechnicalStrategy::TechnicalStrategy(std::string name,
                                     std::vector<std::unique_ptr<IRule>> rules,
                                     std::vector<CrossPair> cross_pairs)
    : name_(std::move(name)),
      rules_(std::move(rules)),
      cross_pairs_(std::move(cross_pairs))
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (rules_.empty()) throw std::invalid_argument("Strategy must have at least one rule.");
    for (const auto& rule : rules_) {
        if (!rule) throw std::invalid_argument("Strategy cannot hold a null rule.");
    }

    auto logger = core::logging::getLogger();
    logger->debug("TechnicalStrategy '{}' created with {} rules, {} tracked cross pairs.",
                  name_, rules_.size(), cross_pairs_.size());
    for (const auto& rule : rules_) {
        logger->debug("  {}", rule->describe());
    }
}

std::string TechnicalStrategy::getName() const { return name_; }

void TechnicalStrategy::refreshCrossings(const indicators::IndicatorSnapshot& snapshot, CrossingState& state) const {
    for (const auto& pair : cross_pairs_) {
        const std::string key = pair.key();
        auto lhs = snapshot.get(pair.first);
        auto rhs = pair.level ? pair.level : snapshot.get(pair.second);
        if (lhs && rhs) {
            state.observe(key, *lhs, *rhs);
        } else {
            state.markUnavailable(key);
        }
    }
}

core::Signal TechnicalStrategy::evaluate(const indicators::IndicatorSnapshot& snapshot,
                                         const std::vector<indicators::IndicatorSnapshot>& recent,
                                         CrossingState& state) const {
    auto logger = core::logging::getLogger();

    refreshCrossings(snapshot, state);

    core::Signal signal;
    signal.timestamp = snapshot.timestamp;
    signal.strategy_tag = name_;

    const EvaluationContext context{snapshot, recent, state};
    for (const auto& rule : rules_) {
        core::SignalDirection direction = rule->evaluate(context);
        if (direction == core::SignalDirection::Hold) {
            continue;
        }
        signal.direction = direction;
        signal.strength = rule->getStrength();
        signal.reason = rule->getName();
        logger->debug("Strategy '{}': rule '{}' fired {} (strength {:.2f}) at {}",
                      name_, rule->getName(), core::toString(direction), signal.strength,
                      core::utils::timestampToString(snapshot.timestamp));
        return signal; // First matching rule wins
    }

    logger->trace("Strategy '{}': no rule fired at bar {}", name_, snapshot.bar_index);
    return signal;
}

} // namespace strategy_engine
