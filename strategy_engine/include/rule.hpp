#pragma once

#include "interfaces.hpp"
#include <string>
#include <memory> // For std::unique_ptr

namespace strategy_engine {

    // --- Rule Class ---
    // A named condition and the signal it proposes (direction + strength) when it holds.
    class Rule : public IRule {
    public:
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             core::SignalDirection direction_on_true,
             double strength);

        virtual ~Rule() override = default;

        core::SignalDirection evaluate(const EvaluationContext& context) const override;
        double getStrength() const override { return strength_; }
        std::string describe() const override;
        std::string getName() const override { return name_; }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::SignalDirection direction_;
        double strength_;
    };

} // namespace strategy_engine
