#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // Price/volume momentum. The regime is +1 while the N-bar price change and the volume
    // surge both exceed their thresholds, -1 while the price change is below -threshold,
    // 0 otherwise. A signal fires only on the bar that enters the +1 or -1 regime.
    class MomentumStrategy : public ISignalStrategy {
    public:
        MomentumStrategy(std::string name, double price_change_threshold, double volume_change_threshold);

        virtual ~MomentumStrategy() override = default;

        std::string getName() const override;
        core::Signal evaluate(const indicators::IndicatorSnapshot& snapshot,
                              const std::vector<indicators::IndicatorSnapshot>& recent,
                              CrossingState& state) const override;

        static constexpr double kStrongStrength = 0.8;
        static constexpr double kNormalStrength = 0.6;

    private:
        std::string name_;
        double price_change_threshold_;
        double volume_change_threshold_;
    };

} // namespace strategy_engine
