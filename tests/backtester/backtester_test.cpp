// =============================================================================
// backtester_test.cpp
// =============================================================================
// Tests for backtester::Backtester: input checks, date-range loading from the
// store and deterministic replay.
// =============================================================================

#include "backtester.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace test_support;
using backtester::RunStatus;

class BacktesterTest : public ::testing::Test {
 protected:
  core::EngineConfig config = makeConfig();
  core::TimeSeries<core::Bar> bars = barsFromCloses(crossoverCloses());
};

TEST_F(BacktesterTest, ReplaysInMemorySeries) {
  backtester::Backtester runner(config);
  backtester::BacktestReport report = runner.run(kInstrument, bars);

  EXPECT_EQ(report.status, RunStatus::Completed);
  EXPECT_EQ(report.instrument, kInstrument);
  EXPECT_EQ(report.bars_processed, 30u);
  ASSERT_EQ(report.fills.size(), 1u);
  EXPECT_EQ(report.fills[0].quantity, 2100);
  EXPECT_TRUE(report.trades.empty());
  EXPECT_EQ(report.open_position, 2100);
  EXPECT_NEAR(report.open_average_cost, (23520.0 + 7.06) / 2100.0, 1e-9);
  EXPECT_EQ(report.equity_curve.size(), 30u);
  EXPECT_EQ(report.metrics.total_executions, 1);
  EXPECT_EQ(report.metrics.round_trip_trades, 0);
  EXPECT_NEAR(report.metrics.final_equity, 76472.94 + 2100 * 11.35, 1e-6);
}

TEST_F(BacktesterTest, IdenticalInputsGiveIdenticalReports) {
  backtester::Backtester runner(config);
  auto first = runner.run(kInstrument, bars);
  auto second = runner.run(kInstrument, bars);

  EXPECT_TRUE(first.metrics == second.metrics);
  ASSERT_EQ(first.fills.size(), second.fills.size());
  for (size_t i = 0; i < first.fills.size(); ++i) {
    EXPECT_EQ(first.fills[i].timestamp, second.fills[i].timestamp);
    EXPECT_EQ(first.fills[i].quantity, second.fills[i].quantity);
    EXPECT_DOUBLE_EQ(first.fills[i].price, second.fills[i].price);
    EXPECT_EQ(first.fills[i].order_id, second.fills[i].order_id);
  }
  EXPECT_EQ(first.signals.size(), second.signals.size());
}

TEST_F(BacktesterTest, CapitalOverride) {
  backtester::Backtester runner(config);
  auto report = runner.run(kInstrument, bars, 200000.0);
  EXPECT_DOUBLE_EQ(report.metrics.initial_capital, 200000.0);
  ASSERT_EQ(report.fills.size(), 1u);
  EXPECT_EQ(report.fills[0].quantity, 4200);  // 200000 * 0.3 * 0.8 / 11.20 -> 4285 -> lot 4200

  EXPECT_THROW(runner.run(kInstrument, bars, 0.0), core::BacktestException);
  EXPECT_THROW(runner.run(kInstrument, bars, -1.0), core::BacktestException);
}

TEST_F(BacktesterTest, TooFewBarsRejected) {
  backtester::Backtester runner(config);
  core::TimeSeries<core::Bar> short_series(bars.begin(), bars.begin() + 19);
  EXPECT_THROW(runner.run(kInstrument, short_series), core::BacktestException);
}

TEST_F(BacktesterTest, DateRangeNeedsDatabase) {
  backtester::Backtester runner(config);
  EXPECT_THROW(runner.run(kInstrument, "2024-01-02", "2024-01-31"), core::BacktestException);
}

TEST_F(BacktesterTest, LoadsDateRangeFromStore) {
  data::DatabaseManager db(":memory:");
  ASSERT_TRUE(db.connect());
  ASSERT_TRUE(db.initializeSchema());
  ASSERT_TRUE(db.saveBars(bars, kInstrument, config.interval));

  config.backtest.persist_audit = true;
  backtester::Backtester runner(config, &db);
  auto report = runner.run(kInstrument, "2024-01-02", "2024-01-31");
  EXPECT_EQ(report.status, RunStatus::Completed);
  EXPECT_EQ(report.bars_processed, 30u);
  ASSERT_EQ(report.fills.size(), 1u);
  EXPECT_EQ(report.fills[0].timestamp, dayStamp(21));
  EXPECT_EQ(db.countRows("fills", kInstrument), 1);

  // Nine stored days are below the 20-bar minimum
  EXPECT_THROW(runner.run(kInstrument, "2024-01-02", "2024-01-10"), core::BacktestException);
  EXPECT_THROW(runner.run(kInstrument, "2024-01-31", "2024-01-02"), core::BacktestException);
}

TEST_F(BacktesterTest, WithoutPersistAuditNothingIsWritten) {
  data::DatabaseManager db(":memory:");
  ASSERT_TRUE(db.connect());
  ASSERT_TRUE(db.initializeSchema());
  ASSERT_TRUE(db.saveBars(bars, kInstrument, config.interval));

  backtester::Backtester runner(config, &db);
  auto report = runner.run(kInstrument, "2024-01-02", "2024-01-31");
  EXPECT_EQ(report.fills.size(), 1u);
  EXPECT_EQ(db.countRows("fills", kInstrument), 0);
}

TEST_F(BacktesterTest, InvalidConfigRejected) {
  config.indicators.ma_short = 30;
  config.indicators.ma_long = 20;
  EXPECT_THROW(backtester::Backtester runner(config), core::ConfigException);
}
