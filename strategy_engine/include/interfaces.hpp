#pragma once

#include <vector>
#include <string>
#include <memory>

#include "datatypes.hpp"       // Signal, SignalDirection
#include "indicators.hpp"      // IndicatorSnapshot
#include "crossing_state.hpp"

namespace strategy_engine {

    // Everything a condition may look at for one bar
    struct EvaluationContext {
        const indicators::IndicatorSnapshot& current;
        // Prior snapshots, oldest first; never contains bars after `current`
        const std::vector<indicators::IndicatorSnapshot>& recent;
        const CrossingState& crossings;
    };

    // --- Condition Interface ---
    // A single logical condition (e.g., rsi < 70, ma_short crosses above ma_long)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        virtual bool evaluate(const EvaluationContext& context) const = 0;
        virtual std::string describe() const = 0;
    };

    // --- Rule Interface ---
    // A named condition that, when true, proposes a direction with a strength
    class IRule {
    public:
        virtual ~IRule() = default;
        // Direction if triggered, Hold otherwise
        virtual core::SignalDirection evaluate(const EvaluationContext& context) const = 0;
        virtual double getStrength() const = 0;
        virtual std::string describe() const = 0;
        virtual std::string getName() const = 0;
    };

    // --- Strategy Interface ---
    // One variant of the signal generator. Implementations hold no per-bar state of their
    // own; the crossing memory lives in the CrossingState passed alongside each call.
    class ISignalStrategy {
    public:
        virtual ~ISignalStrategy() = default;

        virtual std::string getName() const = 0;

        // Produce exactly one signal (Hold when nothing fires) for `snapshot`
        virtual core::Signal evaluate(const indicators::IndicatorSnapshot& snapshot,
                                      const std::vector<indicators::IndicatorSnapshot>& recent,
                                      CrossingState& state) const = 0;
    };

} // namespace strategy_engine
