#include "logical_condition.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

LogicalCondition::LogicalCondition(std::vector<std::unique_ptr<ICondition>> conditions, std::string keyword)
    : conditions_(std::move(conditions)), keyword_(std::move(keyword))
{
    if (conditions_.empty()) {
        throw std::invalid_argument(fmt::format("{} condition needs at least one sub-condition.", keyword_));
    }
    const bool has_null = std::any_of(conditions_.begin(), conditions_.end(),
                                      [](const std::unique_ptr<ICondition>& c) { return !c; });
    if (has_null) {
        throw std::invalid_argument(fmt::format("{} condition cannot hold a null sub-condition.", keyword_));
    }
}

std::string LogicalCondition::describe() const {
    std::vector<std::string> parts;
    parts.reserve(conditions_.size());
    for (const auto& condition : conditions_) {
        parts.push_back(condition->describe());
    }
    return fmt::format("({})", fmt::join(parts, " " + keyword_ + " "));
}

AndCondition::AndCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : LogicalCondition(std::move(conditions), "AND") {}

bool AndCondition::evaluate(const EvaluationContext& context) const {
    return std::all_of(conditions_.begin(), conditions_.end(),
                       [&context](const std::unique_ptr<ICondition>& c) { return c->evaluate(context); });
}

OrCondition::OrCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : LogicalCondition(std::move(conditions), "OR") {}

bool OrCondition::evaluate(const EvaluationContext& context) const {
    return std::any_of(conditions_.begin(), conditions_.end(),
                       [&context](const std::unique_ptr<ICondition>& c) { return c->evaluate(context); });
}

} // namespace strategy_engine
