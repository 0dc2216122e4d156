#include "common_types.hpp"
#include "utils.hpp"
#include <cmath>

namespace strategy_engine {

    bool compare(double lhs, ComparisonOp op, double rhs) {
        switch (op) {
            case ComparisonOp::GT:  return lhs > rhs;
            case ComparisonOp::LT:  return lhs < rhs;
            case ComparisonOp::GTE: return lhs >= rhs;
            case ComparisonOp::LTE: return lhs <= rhs;
            case ComparisonOp::EQ:  return std::fabs(lhs - rhs) < core::utils::kEpsilon;
        }
        return false;
    }

    std::string toString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT:  return ">";
            case ComparisonOp::LT:  return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ:  return "==";
        }
        return "InvalidOp";
    }

    std::string toString(PriceField field) {
        switch (field) {
            case PriceField::Open:  return "open";
            case PriceField::High:  return "high";
            case PriceField::Low:   return "low";
            case PriceField::Close: return "close";
        }
        return "InvalidField";
    }

    double priceOf(const core::Bar& bar, PriceField field) {
        switch (field) {
            case PriceField::Open:  return bar.open;
            case PriceField::High:  return bar.high;
            case PriceField::Low:   return bar.low;
            case PriceField::Close: return bar.close;
        }
        return bar.close;
    }

} // namespace strategy_engine
