#pragma once
#include "datatypes.hpp"

namespace strategy_engine {

    // Which bar field a price condition reads
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    enum class ComparisonOp {
        GT,  // >
        LT,  // <
        GTE, // >=
        LTE, // <=
        EQ   // ==
    };

    enum class CrossDirection {
        Above,
        Below
    };

    // Edge produced by the latest observation of an indicator pair
    enum class CrossEdge {
        None,
        CrossedAbove,
        CrossedBelow
    };

    bool compare(double lhs, ComparisonOp op, double rhs);
    std::string toString(ComparisonOp op);
    std::string toString(PriceField field);
    double priceOf(const core::Bar& bar, PriceField field);

} // namespace strategy_engine
