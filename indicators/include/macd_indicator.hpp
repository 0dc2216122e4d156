#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// MACD line (fast EMA - slow EMA), its EMA signal line and the histogram
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const std::vector<std::string>& getOutputKeys() const override;
    const core::TimeSeries<double>& getResult(size_t output = 0) const override;

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    std::vector<std::string> output_keys_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
