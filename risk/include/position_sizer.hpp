#pragma once

#include "config.hpp"
#include "datatypes.hpp"
#include "indicators.hpp"
#include "portfolio.hpp"

namespace risk {

    // Turns a buy signal into a share quantity using the configured sizing method.
    // Quantities are whole lots and never cost more than the available cash.
    class PositionSizer {
    public:
        PositionSizer(const core::RiskConfig& risk_config, const core::ExecutionConfig& execution_config);

        // Returns 0 when the method cannot produce a size (e.g. ATR not yet available)
        long long buyQuantity(const core::Signal& signal,
                              double price,
                              const portfolio::Portfolio& portfolio,
                              const indicators::IndicatorSnapshot& snapshot) const;

        // Quantity to sell for a strategy sell signal
        long long sellQuantity(const core::Signal& signal, long long position) const;

        // Money the configured method wants to commit, before lot rounding and affordability
        double targetAmount(const core::Signal& signal,
                            double price,
                            const portfolio::Portfolio& portfolio,
                            const indicators::IndicatorSnapshot& snapshot) const;

        // Kelly fraction of equity in [0, max_single_position]
        double kellyFraction(const core::Signal& signal, const portfolio::Portfolio& portfolio) const;

        long long affordableQuantity(double price, double cash) const;
        long long roundToLot(double quantity) const;

    private:
        core::RiskConfig config_;
        core::ExecutionConfig execution_;
    };

} // namespace risk
