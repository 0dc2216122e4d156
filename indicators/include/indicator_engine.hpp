#pragma once

#include "indicators.hpp"
#include "config.hpp"
#include <deque>
#include <memory>
#include <vector>

namespace indicators {

// Computes the configured indicator set one bar at a time.
//
// Only the trailing window (max lookback + 1 + warmup bars) is retained and every
// indicator is recomputed over exactly that window, so the snapshot for a bar is a
// pure function of the window ending at it. Live and replay paths therefore produce
// identical snapshots for identical bars.
class IndicatorEngine {
public:
    explicit IndicatorEngine(const core::IndicatorConfig& config);

    // Append the next bar and return its snapshot.
    // Throws core::DataException if the bar does not strictly follow the previous one in time.
    IndicatorSnapshot update(const core::Bar& bar);

    // Snapshots for a whole series, as a fresh engine would produce them bar by bar
    core::TimeSeries<IndicatorSnapshot> computeAll(const core::TimeSeries<core::Bar>& bars) const;

    void reset();

    int getMaxLookback() const { return max_lookback_; }
    size_t getWindowSize() const { return window_size_; }
    size_t getBarsSeen() const { return bars_seen_; }
    const std::vector<std::unique_ptr<IIndicator>>& getIndicators() const { return indicators_; }

private:
    core::IndicatorConfig config_;
    std::vector<std::unique_ptr<IIndicator>> indicators_;
    int max_lookback_ = 0;
    size_t window_size_ = 0;
    std::deque<core::Bar> window_;
    size_t bars_seen_ = 0;
};

} // namespace indicators
