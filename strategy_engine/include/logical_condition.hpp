#pragma once

#include "interfaces.hpp"
#include <memory>
#include <string>
#include <vector>

namespace strategy_engine {

    // Owns a non-empty list of sub-conditions joined by one boolean operator.
    // Sub-conditions are evaluated left to right and evaluation stops as soon as the result is known.
    class LogicalCondition : public ICondition {
    public:
        virtual ~LogicalCondition() override = default;

        std::string describe() const override;
        size_t size() const { return conditions_.size(); }

    protected:
        // `keyword` is "AND" / "OR"; throws std::invalid_argument for an empty list or a null entry
        LogicalCondition(std::vector<std::unique_ptr<ICondition>> conditions, std::string keyword);

        std::vector<std::unique_ptr<ICondition>> conditions_;

    private:
        std::string keyword_;
    };

    // True when every sub-condition holds
    class AndCondition : public LogicalCondition {
    public:
        explicit AndCondition(std::vector<std::unique_ptr<ICondition>> conditions);
        bool evaluate(const EvaluationContext& context) const override;
    };

    // True when at least one sub-condition holds
    class OrCondition : public LogicalCondition {
    public:
        explicit OrCondition(std::vector<std::unique_ptr<ICondition>> conditions);
        bool evaluate(const EvaluationContext& context) const override;
    };

} // namespace strategy_engine
