#pragma once

#include "datatypes.hpp" // Needs Bar, TimeSeries
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace indicators {

// Snapshot keys published by the engine
namespace keys {
    inline const std::string kMaShort = "ma_short";
    inline const std::string kMaLong = "ma_long";
    inline const std::string kRsi = "rsi";
    inline const std::string kMacd = "macd";
    inline const std::string kMacdSignal = "macd_signal";
    inline const std::string kMacdHist = "macd_hist";
    inline const std::string kBollingerUpper = "bb_upper";
    inline const std::string kBollingerMiddle = "bb_middle";
    inline const std::string kBollingerLower = "bb_lower";
    inline const std::string kVolumeMa = "volume_ma";
    inline const std::string kVolumeRatio = "volume_ratio";
    inline const std::string kAtr = "atr";
    inline const std::string kPriceRoc = "price_roc";
} // namespace keys

// Latest indicator values keyed to the bar that produced them.
// An indicator still inside its lookback is absent, never zero.
struct IndicatorSnapshot {
    core::Timestamp timestamp;
    size_t bar_index = 0;
    core::Bar bar;
    std::map<std::string, double> values;

    bool has(const std::string& key) const { return values.count(key) > 0; }

    std::optional<double> get(const std::string& key) const {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    bool operator==(const IndicatorSnapshot& other) const {
        return timestamp == other.timestamp && bar_index == other.bar_index && values == other.values;
    }
};

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Name including parameters (e.g., "SMA(20)", "MACD(12,26,9)")
    virtual std::string getName() const = 0;

    // Number of initial input bars consumed before the first valid output
    virtual int getLookback() const = 0;

    // Calculate the indicator over the input bars and store the results internally
    virtual void calculate(const core::TimeSeries<core::Bar>& input) = 0;

    // Snapshot keys of the output lines, in the order getResult() indexes them
    virtual const std::vector<std::string>& getOutputKeys() const = 0;

    // Results of one output line. result[j] belongs to input index j + getLookback().
    virtual const core::TimeSeries<double>& getResult(size_t output = 0) const = 0;
};

} // namespace indicators
