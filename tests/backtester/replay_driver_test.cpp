// =============================================================================
// replay_driver_test.cpp
// =============================================================================
// Tests for backtester::ReplayDriver over a 30-bar series whose 5/20 SMA pair
// crosses above exactly once (bar 21, close 11.20).
//
// Validates:
//   - End-to-end decision, fill and cash accounting with the default config
//   - Fill timing (decision bar close vs. next bar open) and partial fills
//   - Halting on malformed or out-of-order bars
//   - Execution failures leave the portfolio untouched
//   - Invariant violations abort the run
//   - Bootstrapped history is equivalent to replaying it
//   - Risk vetoes inside a run are recorded and persisted
//   - A stop requested mid-run completes the in-flight bar
// =============================================================================

#include "replay_driver.hpp"
#include "bar_source.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "simulated_execution.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace test_support;
using backtester::RunStatus;

namespace {

// Broker that rejects every order
class RejectingExecution : public backtester::IExecutionAdapter {
 public:
  std::string getName() const override { return "rejecting"; }
  core::Fill execute(const core::OrderIntent&, const core::Bar&) override {
    ++calls;
    throw core::ExecutionException("order rejected");
  }
  int calls = 0;
};

// Broker that reports more shares than were ordered
class OverfillingExecution : public backtester::IExecutionAdapter {
 public:
  std::string getName() const override { return "overfilling"; }
  core::Fill execute(const core::OrderIntent& intent, const core::Bar& bar) override {
    core::Fill fill;
    fill.intent = intent;
    fill.timestamp = bar.timestamp;
    fill.price = bar.close;
    fill.quantity = intent.quantity + 100;
    fill.order_id = "OVER-1";
    return fill;
  }
};

// Requests a stop on the driver while handing out bar `stop_at`
class StoppingBarSource : public backtester::IBarSource {
 public:
  StoppingBarSource(core::TimeSeries<core::Bar> bars, size_t stop_at)
      : inner_(std::move(bars), kInstrument), stop_at_(stop_at) {}

  std::optional<core::Bar> nextBar() override {
    if (driver && emitted_ == stop_at_) {
      driver->requestStop();
    }
    ++emitted_;
    return inner_.nextBar();
  }
  std::string describe() const override { return "stopping"; }
  size_t remaining() const { return inner_.remaining(); }

  backtester::ReplayDriver* driver = nullptr;

 private:
  backtester::HistoricalBarSource inner_;
  size_t stop_at_;
  size_t emitted_ = 0;
};

}  // namespace

class ReplayDriverTest : public ::testing::Test {
 protected:
  RunStatus replay(const core::TimeSeries<core::Bar>& series, backtester::IExecutionAdapter& execution,
                   data::DatabaseManager* audit = nullptr) {
    backtester::HistoricalBarSource source(series, kInstrument);
    backtester::ReplayDriver driver(config, source, execution, book, audit);
    RunStatus status = driver.run();
    failure_reason = driver.getFailureReason();
    bars_processed = driver.getBarsProcessed();
    failed_executions = driver.getFailedExecutions();
    signals = driver.getSignals();
    return status;
  }

  core::EngineConfig config = makeConfig();
  core::TimeSeries<core::Bar> bars = barsFromCloses(crossoverCloses());
  portfolio::Portfolio book{100000.0};

  std::string failure_reason;
  size_t bars_processed = 0;
  int failed_executions = 0;
  std::vector<core::Signal> signals;
};

TEST_F(ReplayDriverTest, SingleCrossoverBuysOnce) {
  backtester::SimulatedExecution execution(config.execution);
  ASSERT_EQ(replay(bars, execution), RunStatus::Completed);
  EXPECT_EQ(bars_processed, 30u);

  ASSERT_EQ(book.getFills().size(), 1u);
  const core::Fill& fill = book.getFills()[0];
  EXPECT_EQ(fill.intent.side, core::OrderSide::Buy);
  EXPECT_EQ(fill.timestamp, dayStamp(21));
  EXPECT_EQ(fill.quantity, 2100);
  EXPECT_DOUBLE_EQ(fill.price, 11.20);
  EXPECT_DOUBLE_EQ(fill.commission, 7.06);
  EXPECT_NEAR(book.getCash(), 76472.94, 1e-6);
  EXPECT_EQ(book.getPositionQuantity(), 2100);
  EXPECT_TRUE(book.getTradeLog().empty());
  EXPECT_EQ(book.getEquityCurve().size(), 30u);

  const bool buy_signal_on_cross = std::any_of(signals.begin(), signals.end(), [](const core::Signal& s) {
    return s.direction == core::SignalDirection::Buy && s.timestamp == dayStamp(21);
  });
  EXPECT_TRUE(buy_signal_on_cross);
  for (const auto& s : signals) {
    EXPECT_NE(s.direction, core::SignalDirection::Hold);
  }
}

TEST_F(ReplayDriverTest, NextOpenFillsOnFollowingBar) {
  config.execution.fill_price = core::FillPriceMode::NextOpen;
  backtester::SimulatedExecution execution(config.execution);
  ASSERT_EQ(replay(bars, execution), RunStatus::Completed);

  ASSERT_EQ(book.getFills().size(), 1u);
  const core::Fill& fill = book.getFills()[0];
  EXPECT_EQ(fill.timestamp, dayStamp(22));
  EXPECT_DOUBLE_EQ(fill.price, bars[22].open);
  EXPECT_DOUBLE_EQ(fill.price, 11.20);
  EXPECT_EQ(fill.quantity, 2100);
}

TEST_F(ReplayDriverTest, ParticipationCapFillsPartially) {
  config.execution.max_volume_participation = 0.1;
  backtester::SimulatedExecution execution(config.execution);
  ASSERT_EQ(replay(bars, execution), RunStatus::Completed);

  ASSERT_EQ(book.getFills().size(), 1u);
  EXPECT_EQ(book.getFills()[0].quantity, 1000);
  EXPECT_EQ(book.getPositionQuantity(), 1000);
}

TEST_F(ReplayDriverTest, MalformedBarFailsRun) {
  bars[5].high = bars[5].close - 0.5;
  backtester::SimulatedExecution execution(config.execution);
  EXPECT_EQ(replay(bars, execution), RunStatus::Failed);
  EXPECT_EQ(bars_processed, 5u);
  EXPECT_FALSE(failure_reason.empty());
}

TEST_F(ReplayDriverTest, NonIncreasingTimestampFailsRun) {
  bars[10].timestamp = bars[9].timestamp;
  backtester::SimulatedExecution execution(config.execution);
  EXPECT_EQ(replay(bars, execution), RunStatus::Failed);
  EXPECT_EQ(bars_processed, 10u);
  EXPECT_NE(failure_reason.find("not after"), std::string::npos);
}

TEST_F(ReplayDriverTest, RejectedOrderLeavesPortfolioUntouched) {
  RejectingExecution execution;
  data::DatabaseManager db(":memory:");
  ASSERT_TRUE(db.connect());
  ASSERT_TRUE(db.initializeSchema());

  ASSERT_EQ(replay(bars, execution, &db), RunStatus::Completed);
  EXPECT_EQ(execution.calls, 1);
  EXPECT_EQ(failed_executions, 1);
  EXPECT_TRUE(book.getFills().empty());
  EXPECT_DOUBLE_EQ(book.getCash(), 100000.0);
  EXPECT_EQ(book.getPositionQuantity(), 0);
  EXPECT_EQ(db.countRows("fills", kInstrument), 0);
  EXPECT_EQ(db.countRows("risk_events", kInstrument), 1);
}

TEST_F(ReplayDriverTest, OverfillAbortsRun) {
  OverfillingExecution execution;
  backtester::HistoricalBarSource source(bars, kInstrument);
  backtester::ReplayDriver driver(config, source, execution, book);

  EXPECT_THROW(driver.run(), core::InvariantViolation);
  EXPECT_EQ(driver.getStatus(), RunStatus::Failed);
  EXPECT_FALSE(driver.getFailureReason().empty());
  EXPECT_TRUE(book.getFills().empty());
}

TEST_F(ReplayDriverTest, AuditTrailIsPersisted) {
  data::DatabaseManager db(":memory:");
  ASSERT_TRUE(db.connect());
  ASSERT_TRUE(db.initializeSchema());
  backtester::SimulatedExecution execution(config.execution);

  ASSERT_EQ(replay(bars, execution, &db), RunStatus::Completed);
  EXPECT_EQ(db.countRows("fills", kInstrument), 1);
  EXPECT_EQ(db.countRows("portfolio_snapshots", kInstrument), 30);
  EXPECT_EQ(db.countRows("signals", kInstrument), static_cast<long long>(signals.size()));

  auto stored = db.queryFills(kInstrument);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].order_id, "SIM-000001");
  EXPECT_EQ(stored[0].quantity, 2100);
}

TEST_F(ReplayDriverTest, BootstrapMatchesFullReplay) {
  core::TimeSeries<core::Bar> history(bars.begin(), bars.begin() + 15);
  core::TimeSeries<core::Bar> rest(bars.begin() + 15, bars.end());

  backtester::SimulatedExecution execution(config.execution);
  backtester::HistoricalBarSource source(rest, kInstrument);
  backtester::ReplayDriver driver(config, source, execution, book);
  driver.bootstrap(history);
  ASSERT_EQ(driver.run(), RunStatus::Completed);
  EXPECT_EQ(driver.getBarsProcessed(), 15u);

  ASSERT_EQ(book.getFills().size(), 1u);
  EXPECT_EQ(book.getFills()[0].timestamp, dayStamp(21));
  EXPECT_EQ(book.getFills()[0].quantity, 2100);
  EXPECT_NEAR(book.getCash(), 76472.94, 1e-6);

  // A bootstrapped bar may not be replayed again
  EXPECT_THROW(driver.bootstrap(history), core::BacktestException);
}

TEST_F(ReplayDriverTest, StopBeforeRunProcessesNothing) {
  backtester::SimulatedExecution execution(config.execution);
  backtester::HistoricalBarSource source(bars, kInstrument);
  backtester::ReplayDriver driver(config, source, execution, book);
  driver.requestStop();

  EXPECT_EQ(driver.run(), RunStatus::Completed);
  EXPECT_EQ(driver.getBarsProcessed(), 0u);
  EXPECT_EQ(source.remaining(), 30u);
  EXPECT_THROW(driver.run(), core::BacktestException);
}

TEST(HistoricalBarSourceTest, ValidatesBars) {
  core::Bar good = makeBar(0, 10.0, 10.5, 9.5, 10.2);
  EXPECT_NO_THROW(backtester::validateBar(good));

  core::Bar zero_price = good;
  zero_price.low = 0.0;
  EXPECT_THROW(backtester::validateBar(zero_price), core::DataException);

  core::Bar negative_volume = good;
  negative_volume.volume = -1;
  EXPECT_THROW(backtester::validateBar(negative_volume), core::DataException);

  core::Bar low_above_open = good;
  low_above_open.low = 10.1;
  EXPECT_THROW(backtester::validateBar(low_above_open), core::DataException);
}

TEST_F(ReplayDriverTest, DrawdownBreakerVetoesCrossoverBuy) {
  // An earlier losing round trip leaves equity 11% below its peak
  core::Fill entry = makeFill(core::OrderSide::Buy, 4000, 10.0, 0.0, -5);
  book.apply(entry);
  core::Fill exit = makeFill(core::OrderSide::Sell, 4000, 7.25, 0.0, -4);
  book.apply(exit);
  ASSERT_NEAR(book.getCash(), 89000.0, 1e-6);

  data::DatabaseManager db(":memory:");
  ASSERT_TRUE(db.connect());
  ASSERT_TRUE(db.initializeSchema());
  backtester::SimulatedExecution execution(config.execution);
  backtester::HistoricalBarSource source(bars, kInstrument);
  backtester::ReplayDriver driver(config, source, execution, book, &db);

  ASSERT_EQ(driver.run(), RunStatus::Completed);
  EXPECT_EQ(driver.getBarsProcessed(), 30u);
  EXPECT_EQ(book.getFills().size(), 2u);
  EXPECT_EQ(book.getPositionQuantity(), 0);

  ASSERT_EQ(driver.getVetoes().size(), 1u);
  const backtester::VetoRecord& veto = driver.getVetoes()[0];
  EXPECT_EQ(veto.reason, risk::VetoReason::DrawdownBreaker);
  EXPECT_EQ(veto.timestamp, dayStamp(21));
  EXPECT_EQ(veto.detail, "drawdown 11.00% >= limit 10.00%");
  EXPECT_EQ(db.countRows("risk_events", kInstrument), 1);
}

TEST_F(ReplayDriverTest, SizeRangeVetoKeepsRunGoing) {
  // The crossover buy sizes to 2100 shares, 23520.00 notional
  config.risk.min_trade_amount = 30000.0;
  backtester::SimulatedExecution execution(config.execution);
  backtester::HistoricalBarSource source(bars, kInstrument);
  backtester::ReplayDriver driver(config, source, execution, book);

  ASSERT_EQ(driver.run(), RunStatus::Completed);
  EXPECT_EQ(driver.getBarsProcessed(), 30u);
  EXPECT_TRUE(book.getFills().empty());
  ASSERT_EQ(driver.getVetoes().size(), 1u);
  EXPECT_EQ(driver.getVetoes()[0].reason, risk::VetoReason::SizeOutOfRange);
  EXPECT_NE(driver.getVetoes()[0].detail.find("notional 23520.00"), std::string::npos);
  EXPECT_NEAR(book.getCash(), 100000.0, 1e-9);
}

TEST_F(ReplayDriverTest, StopMidRunCompletesInFlightBar) {
  backtester::SimulatedExecution execution(config.execution);
  StoppingBarSource source(bars, 21);
  backtester::ReplayDriver driver(config, source, execution, book);
  source.driver = &driver;

  ASSERT_EQ(driver.run(), RunStatus::Completed);
  // Bar 21 was requested after the stop and still fully processed
  EXPECT_EQ(driver.getBarsProcessed(), 22u);
  EXPECT_EQ(source.remaining(), 8u);
  ASSERT_EQ(book.getFills().size(), 1u);
  EXPECT_EQ(book.getFills()[0].timestamp, dayStamp(21));
  EXPECT_EQ(book.getPositionQuantity(), 2100);
  EXPECT_EQ(book.getEquityCurve().size(), 22u);
}
