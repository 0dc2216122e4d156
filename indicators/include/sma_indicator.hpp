#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

// Which bar field the moving average runs over
enum class PriceSource {
    Close,
    Volume
};

class SmaIndicator : public IIndicator {
public:
    // Simple moving average of `source`, published under `output_key`
    SmaIndicator(int period, std::string output_key, PriceSource source = PriceSource::Close);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const std::vector<std::string>& getOutputKeys() const override;
    const core::TimeSeries<double>& getResult(size_t output = 0) const override;

private:
    const int period_;          // SMA period (e.g., 5, 20)
    const PriceSource source_;
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // Indicator name (e.g., "SMA(20)")
    std::vector<std::string> output_keys_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
