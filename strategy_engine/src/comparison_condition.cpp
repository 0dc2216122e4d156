#include "comparison_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

Operand Operand::constant(double value) {
    return Operand(value);
}

Operand Operand::indicator(std::string key) {
    if (key.empty()) {
        throw std::invalid_argument("Indicator key of a comparison cannot be empty.");
    }
    return Operand(std::move(key));
}

Operand Operand::price(PriceField field) {
    return Operand(field);
}

std::optional<double> Operand::resolve(const indicators::IndicatorSnapshot& snapshot) const {
    if (const double* value = std::get_if<double>(&source_)) {
        return *value;
    }
    if (const PriceField* field = std::get_if<PriceField>(&source_)) {
        return priceOf(snapshot.bar, *field);
    }
    return snapshot.get(std::get<std::string>(source_));
}

std::string Operand::describe() const {
    if (const double* value = std::get_if<double>(&source_)) {
        return fmt::format("{}", *value);
    }
    if (const PriceField* field = std::get_if<PriceField>(&source_)) {
        return toString(*field);
    }
    return std::get<std::string>(source_);
}

ComparisonCondition::ComparisonCondition(Operand lhs, ComparisonOp op, Operand rhs)
    : lhs_(std::move(lhs)), op_(op), rhs_(std::move(rhs))
{
    if (lhs_.sameSourceAs(rhs_)) {
        throw std::invalid_argument(fmt::format("Comparison of '{}' with itself is always constant.", lhs_.describe()));
    }
}

bool ComparisonCondition::evaluate(const EvaluationContext& context) const {
    const std::optional<double> lhs = lhs_.resolve(context.current);
    const std::optional<double> rhs = rhs_.resolve(context.current);
    if (!lhs || !rhs) {
        core::logging::getLogger()->trace("'{}' undefined on this bar", describe());
        return false;
    }
    return compare(*lhs, op_, *rhs);
}

std::string ComparisonCondition::describe() const {
    return fmt::format("{} {} {}", lhs_.describe(), toString(op_), rhs_.describe());
}

IndicatorCondition::IndicatorCondition(const std::string& indicator, ComparisonOp op, double value)
    : ComparisonCondition(Operand::indicator(indicator), op, Operand::constant(value)) {}

IndicatorCondition::IndicatorCondition(const std::string& indicator, ComparisonOp op, const std::string& other_indicator)
    : ComparisonCondition(Operand::indicator(indicator), op, Operand::indicator(other_indicator)) {}

PriceIndicatorCondition::PriceIndicatorCondition(PriceField field, ComparisonOp op, const std::string& indicator)
    : ComparisonCondition(Operand::price(field), op, Operand::indicator(indicator)) {}

} // namespace strategy_engine
