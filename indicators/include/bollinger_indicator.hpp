#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Bollinger bands: SMA(period) +/- stddev_multiplier * population standard deviation
class BollingerIndicator : public IIndicator {
public:
    BollingerIndicator(int period, double stddev_multiplier);

    virtual ~BollingerIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const std::vector<std::string>& getOutputKeys() const override;
    const core::TimeSeries<double>& getResult(size_t output = 0) const override;

private:
    const int period_;
    const double stddev_multiplier_;
    int lookback_;
    std::string name_;
    std::vector<std::string> output_keys_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
