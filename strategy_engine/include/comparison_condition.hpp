#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace strategy_engine {

    // One side of a comparison: a constant, an indicator key or a field of the current bar
    class Operand {
    public:
        static Operand constant(double value);
        static Operand indicator(std::string key);   // Throws std::invalid_argument for an empty key
        static Operand price(PriceField field);

        // std::nullopt when the indicator is undefined on this bar
        std::optional<double> resolve(const indicators::IndicatorSnapshot& snapshot) const;
        std::string describe() const;

        bool sameSourceAs(const Operand& other) const { return source_ == other.source_; }

    private:
        explicit Operand(std::variant<double, std::string, PriceField> source) : source_(std::move(source)) {}

        std::variant<double, std::string, PriceField> source_;
    };

    // lhs <op> rhs on the current bar. False whenever either side is undefined.
    class ComparisonCondition : public ICondition {
    public:
        ComparisonCondition(Operand lhs, ComparisonOp op, Operand rhs);

        virtual ~ComparisonCondition() override = default;

        bool evaluate(const EvaluationContext& context) const override;
        std::string describe() const override;

    private:
        Operand lhs_;
        ComparisonOp op_;
        Operand rhs_;
    };

    // Config "Indicator": indicator against a constant ("rsi < 70") or another indicator ("macd > macd_signal")
    class IndicatorCondition : public ComparisonCondition {
    public:
        IndicatorCondition(const std::string& indicator, ComparisonOp op, double value);
        IndicatorCondition(const std::string& indicator, ComparisonOp op, const std::string& other_indicator);
    };

    // Config "PriceIndicator": bar price against an indicator ("close <= bb_lower")
    class PriceIndicatorCondition : public ComparisonCondition {
    public:
        PriceIndicatorCondition(PriceField field, ComparisonOp op, const std::string& indicator);
    };

} // namespace strategy_engine
