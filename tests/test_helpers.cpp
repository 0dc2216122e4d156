#include "test_helpers.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>

namespace test_support {

core::Timestamp dayStamp(int day) {
  static const core::Timestamp base = core::utils::stringToTimestamp("2024-01-02T15:00:00+08:00");
  return base + std::chrono::hours(24 * day);
}

core::Bar makeBar(int day, double open, double high, double low, double close, long long volume) {
  core::Bar bar;
  bar.timestamp = dayStamp(day);
  bar.open = open;
  bar.high = high;
  bar.low = low;
  bar.close = close;
  bar.volume = volume;
  return bar;
}

core::TimeSeries<core::Bar> barsFromCloses(const std::vector<double>& closes, long long volume) {
  core::TimeSeries<core::Bar> bars;
  bars.reserve(closes.size());
  for (size_t i = 0; i < closes.size(); ++i) {
    const double open = i == 0 ? closes[0] : closes[i - 1];
    const double close = closes[i];
    bars.push_back(makeBar(static_cast<int>(i), open, std::max(open, close) + 0.05,
                           std::min(open, close) - 0.05, close, volume));
  }
  return bars;
}

core::EngineConfig makeConfig() {
  core::EngineConfig config;
  config.instrument = kInstrument;
  return config;
}

std::vector<double> crossoverCloses() {
  std::vector<double> closes;
  for (int i = 0; i <= 20; ++i) {
    const double swing = i % 2 == 0 ? 0.15 : -0.15;
    closes.push_back(std::round((10.0 + swing - 0.03 * i) * 100.0) / 100.0);
  }
  closes.push_back(11.20);
  for (int i = 22; i < 30; ++i) {
    closes.push_back(i % 2 == 0 ? 11.05 : 11.35);
  }
  return closes;
}

core::Fill makeFill(core::OrderSide side, long long quantity, double price, double commission, int day) {
  core::Fill fill;
  fill.intent.side = side;
  fill.intent.quantity = quantity;
  fill.intent.reference_price = price;
  fill.timestamp = dayStamp(day);
  fill.price = price;
  fill.quantity = quantity;
  fill.commission = commission;
  fill.order_id = "T-" + std::to_string(day);
  return fill;
}

indicators::IndicatorSnapshot makeSnapshot(int day, std::initializer_list<std::pair<const std::string, double>> values) {
  indicators::IndicatorSnapshot snapshot;
  snapshot.timestamp = dayStamp(day);
  snapshot.bar_index = static_cast<size_t>(day);
  snapshot.bar = makeBar(day, 10.0, 10.05, 9.95, 10.0);
  snapshot.values = values;
  return snapshot;
}

} // namespace test_support
