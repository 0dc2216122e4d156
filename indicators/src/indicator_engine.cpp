#include "indicator_engine.hpp"
#include "sma_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "atr_indicator.hpp"
#include "roc_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace indicators {

IndicatorEngine::IndicatorEngine(const core::IndicatorConfig& config)
    : config_(config)
{
    auto logger = core::logging::getLogger();

    indicators_.push_back(std::make_unique<SmaIndicator>(config_.ma_short, keys::kMaShort));
    indicators_.push_back(std::make_unique<SmaIndicator>(config_.ma_long, keys::kMaLong));
    indicators_.push_back(std::make_unique<RsiIndicator>(config_.rsi_period));
    indicators_.push_back(std::make_unique<MacdIndicator>(config_.macd.fast, config_.macd.slow, config_.macd.signal));
    indicators_.push_back(std::make_unique<BollingerIndicator>(config_.bollinger.period, config_.bollinger.stddev));
    indicators_.push_back(std::make_unique<SmaIndicator>(config_.volume_ma, keys::kVolumeMa, PriceSource::Volume));
    indicators_.push_back(std::make_unique<AtrIndicator>(config_.atr_period));
    indicators_.push_back(std::make_unique<RocIndicator>(config_.momentum_period));

    for (const auto& indicator : indicators_) {
        max_lookback_ = std::max(max_lookback_, indicator->getLookback());
    }
    window_size_ = static_cast<size_t>(max_lookback_) + 1 + static_cast<size_t>(config_.warmup_bars);

    logger->info("IndicatorEngine initialized with {} indicators. Max lookback: {}, window: {} bars",
                 indicators_.size(), max_lookback_, window_size_);
}

void IndicatorEngine::reset() {
    window_.clear();
    bars_seen_ = 0;
}

IndicatorSnapshot IndicatorEngine::update(const core::Bar& bar) {
    auto logger = core::logging::getLogger();

    if (!window_.empty() && bar.timestamp <= window_.back().timestamp) {
        throw core::DataException(fmt::format("Bar at {} does not follow previous bar at {}",
                                              core::utils::timestampToString(bar.timestamp),
                                              core::utils::timestampToString(window_.back().timestamp)));
    }

    window_.push_back(bar);
    if (window_.size() > window_size_) {
        window_.pop_front();
    }

    IndicatorSnapshot snapshot;
    snapshot.timestamp = bar.timestamp;
    snapshot.bar_index = bars_seen_;
    snapshot.bar = bar;
    ++bars_seen_;

    const core::TimeSeries<core::Bar> window(window_.begin(), window_.end());
    for (const auto& indicator : indicators_) {
        if (window.size() <= static_cast<size_t>(indicator->getLookback())) {
            continue; // Still inside this indicator's lookback
        }
        indicator->calculate(window);

        const auto& output_keys = indicator->getOutputKeys();
        for (size_t k = 0; k < output_keys.size(); ++k) {
            const auto& result = indicator->getResult(k);
            if (!result.empty()) {
                snapshot.values[output_keys[k]] = result.back();
            }
        }
    }

    // Derived value: current volume relative to its moving average
    auto volume_ma = snapshot.get(keys::kVolumeMa);
    if (volume_ma && *volume_ma > core::utils::kEpsilon) {
        snapshot.values[keys::kVolumeRatio] = static_cast<double>(bar.volume) / *volume_ma;
    }

    logger->trace("Snapshot {} at {}: {} values", snapshot.bar_index,
                  core::utils::timestampToString(snapshot.timestamp), snapshot.values.size());
    return snapshot;
}

core::TimeSeries<IndicatorSnapshot> IndicatorEngine::computeAll(const core::TimeSeries<core::Bar>& bars) const {
    IndicatorEngine replay(config_);
    core::TimeSeries<IndicatorSnapshot> snapshots;
    snapshots.reserve(bars.size());
    for (const auto& bar : bars) {
        snapshots.push_back(replay.update(bar));
    }
    return snapshots;
}

} // namespace indicators
