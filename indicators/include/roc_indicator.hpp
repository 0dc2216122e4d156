#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Price rate of change over `period` bars as a fraction: (close - close[n]) / close[n]
class RocIndicator : public IIndicator {
public:
    explicit RocIndicator(int period);

    virtual ~RocIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const std::vector<std::string>& getOutputKeys() const override;
    const core::TimeSeries<double>& getResult(size_t output = 0) const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    std::vector<std::string> output_keys_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
