#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Wilder RSI over closing prices
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const std::vector<std::string>& getOutputKeys() const override;
    const core::TimeSeries<double>& getResult(size_t output = 0) const override;

private:
    const int period_;
    int lookback_;
    std::string name_;          // e.g., "RSI(14)"
    std::vector<std::string> output_keys_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
