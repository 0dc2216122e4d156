// =============================================================================
// live_adapters_test.cpp
// =============================================================================
// Tests for the live adapters: interval parsing, forming-bar filtering,
// cancellation of the bar feed, and order timeouts against a scripted gateway.
// =============================================================================

#include "live_bar_feed.hpp"
#include "live_execution.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {
// Nothing listens on port 1; requests fail fast with a transport error
const char* kUnreachable = "http://127.0.0.1:1";

// Gateway with canned replies; no I/O
class ScriptedBroker : public data::BrokerClient {
 public:
  ScriptedBroker() : data::BrokerClient(kUnreachable, "token", 200) {}

  core::TimeSeries<core::Bar> fetchBars(const std::string&, const std::string&,
                                        core::Timestamp, core::Timestamp) override {
    ++fetch_calls;
    return bars;
  }

  std::string submitOrder(const std::string&, core::OrderSide, long long,
                          core::PriceType, double) override {
    return "ORD-1";
  }

  data::OrderReport queryOrder(const std::string& order_id) override {
    data::OrderReport report = cancel_calls > 0 ? after_cancel : working;
    report.order_id = order_id;
    return report;
  }

  bool cancelOrder(const std::string&) override {
    ++cancel_calls;
    return cancel_result;
  }

  core::TimeSeries<core::Bar> bars;
  data::OrderReport working;
  data::OrderReport after_cancel;
  bool cancel_result = true;
  int fetch_calls = 0;
  int cancel_calls = 0;
};

core::Bar barEndingAt(core::Timestamp start, double close) {
  core::Bar bar = test_support::makeBar(0, close, close + 0.05, close - 0.05, close);
  bar.timestamp = start;
  return bar;
}

core::OrderIntent buyIntent(long long quantity) {
  core::OrderIntent intent;
  intent.side = core::OrderSide::Buy;
  intent.quantity = quantity;
  intent.reference_price = 10.0;
  return intent;
}

core::LiveConfig shortTimeout() {
  core::LiveConfig config;
  config.order_timeout_ms = 50;
  return config;
}
}

TEST(IntervalDurationTest, KnownIntervals) {
  EXPECT_EQ(live::intervalDuration("minute"), 60s);
  EXPECT_EQ(live::intervalDuration("30minute"), 30min);
  EXPECT_EQ(live::intervalDuration("5min"), 5min);
  EXPECT_EQ(live::intervalDuration("hour"), 1h);
  EXPECT_EQ(live::intervalDuration("4Hour"), 4h);
  EXPECT_EQ(live::intervalDuration("day"), 24h);
  EXPECT_EQ(live::intervalDuration("week"), 168h);
}

TEST(IntervalDurationTest, RejectsUnknownIntervals) {
  EXPECT_THROW(live::intervalDuration("fortnight"), core::ConfigException);
  EXPECT_THROW(live::intervalDuration("0day"), core::ConfigException);
  EXPECT_THROW(live::intervalDuration(""), core::ConfigException);
}

TEST(CompletedBarsTest, DropsBarStillForming) {
  const core::Timestamp now = core::utils::stringToTimestamp("2024-01-02T10:30:20+08:00");
  const core::Timestamp minute0 = core::utils::stringToTimestamp("2024-01-02T10:28:00+08:00");
  core::TimeSeries<core::Bar> bars = {
      barEndingAt(minute0, 10.0),
      barEndingAt(minute0 + 1min, 10.1),  // Ends at 10:30:00
      barEndingAt(minute0 + 2min, 10.2),  // Forming until 10:31:00
  };

  core::TimeSeries<core::Bar> completed = live::completedBars(bars, 60s, now);
  ASSERT_EQ(completed.size(), 2u);
  EXPECT_EQ(completed.back().timestamp, minute0 + 1min);

  EXPECT_EQ(live::completedBars(bars, 60s, minute0 + 3min).size(), 3u);
  EXPECT_TRUE(live::completedBars(bars, 60s, minute0).empty());
}

TEST(LiveBarFeedTest, FormingBarIsNeverEmitted) {
  ScriptedBroker broker;
  const core::Timestamp now = std::chrono::system_clock::now();
  broker.bars = {barEndingAt(now - 150s, 10.0), barEndingAt(now - 30s, 11.0)};
  live::LiveBarFeed feed(broker, test_support::kInstrument, "minute", 20);

  std::optional<core::Bar> first = feed.nextBar();
  ASSERT_TRUE(first.has_value());
  EXPECT_DOUBLE_EQ(first->close, 10.0);

  std::thread canceller([&feed] {
    std::this_thread::sleep_for(200ms);
    feed.cancel();
  });
  // Only the forming bar is left; the feed keeps polling until cancelled
  std::optional<core::Bar> second = feed.nextBar();
  canceller.join();
  EXPECT_FALSE(second.has_value());
  EXPECT_GT(broker.fetch_calls, 1);
}

TEST(LiveBarFeedTest, DescribeAndValidation) {
  data::BrokerClient client(kUnreachable, "", 200);
  live::LiveBarFeed feed(client, test_support::kInstrument, "day", 1000);
  EXPECT_EQ(feed.describe(), "live:TEST.SH:day");
  EXPECT_FALSE(feed.isCancelled());

  EXPECT_THROW(live::LiveBarFeed(client, test_support::kInstrument, "day", 0), std::invalid_argument);
  EXPECT_THROW(live::LiveBarFeed(client, test_support::kInstrument, "tick", 1000), core::ConfigException);
}

TEST(LiveBarFeedTest, CancelledFeedEndsStream) {
  data::BrokerClient client(kUnreachable, "", 200);
  live::LiveBarFeed feed(client, test_support::kInstrument, "day", 1000);
  feed.cancel();
  EXPECT_TRUE(feed.isCancelled());
  EXPECT_FALSE(feed.nextBar().has_value());
}

TEST(LiveBarFeedTest, CancelInterruptsPollingAfterGatewayErrors) {
  data::BrokerClient client(kUnreachable, "", 200);
  live::LiveBarFeed feed(client, test_support::kInstrument, "minute", 100);

  std::thread canceller([&feed] {
    std::this_thread::sleep_for(300ms);
    feed.cancel();
  });
  // Transport errors are logged and retried until the cancel arrives
  std::optional<core::Bar> bar = feed.nextBar();
  canceller.join();
  EXPECT_FALSE(bar.has_value());
}

TEST(LiveExecutionTest, SubmissionFailureBecomesExecutionException) {
  data::BrokerClient client(kUnreachable, "", 200);
  core::LiveConfig config;
  config.order_timeout_ms = 500;
  live::LiveExecution execution(client, test_support::kInstrument, config);
  EXPECT_EQ(execution.getName(), "live");
  EXPECT_FALSE(execution.fillsOnNextBar());

  core::OrderIntent intent;
  intent.side = core::OrderSide::Buy;
  intent.quantity = 100;
  intent.reference_price = 10.0;
  core::Bar bar = test_support::makeBar(0, 10.0, 10.1, 9.9, 10.0);
  EXPECT_THROW(execution.execute(intent, bar), core::ExecutionException);

  intent.quantity = 0;
  EXPECT_THROW(execution.execute(intent, bar), core::ExecutionException);
}

TEST(LiveExecutionTest, RejectsNonPositiveTimeout) {
  data::BrokerClient client(kUnreachable, "", 200);
  core::LiveConfig config;
  config.order_timeout_ms = 0;
  EXPECT_THROW(live::LiveExecution(client, test_support::kInstrument, config), std::invalid_argument);
}

TEST(LiveExecutionTest, TimeoutWithoutFillBecomesExecutionException) {
  ScriptedBroker broker;
  broker.working.status = data::OrderStatus::Pending;
  broker.after_cancel.status = data::OrderStatus::Cancelled;
  live::LiveExecution execution(broker, test_support::kInstrument, shortTimeout());

  core::Bar bar = test_support::makeBar(0, 10.0, 10.1, 9.9, 10.0);
  EXPECT_THROW(execution.execute(buyIntent(500), bar), core::ExecutionException);
  EXPECT_EQ(broker.cancel_calls, 1);
}

TEST(LiveExecutionTest, TimeoutKeepsPartialFill) {
  ScriptedBroker broker;
  broker.working.status = data::OrderStatus::PartiallyFilled;
  broker.working.filled_quantity = 300;
  broker.working.average_price = 10.02;
  broker.after_cancel = broker.working;
  broker.after_cancel.status = data::OrderStatus::Cancelled;
  broker.after_cancel.commission = 0.9;
  live::LiveExecution execution(broker, test_support::kInstrument, shortTimeout());

  core::Bar bar = test_support::makeBar(0, 10.0, 10.1, 9.9, 10.0);
  core::Fill fill = execution.execute(buyIntent(500), bar);
  EXPECT_EQ(fill.quantity, 300);
  EXPECT_DOUBLE_EQ(fill.price, 10.02);
  EXPECT_DOUBLE_EQ(fill.commission, 0.9);
  EXPECT_EQ(fill.order_id, "ORD-1");
  EXPECT_EQ(fill.timestamp, bar.timestamp);
}

TEST(LiveExecutionTest, FailedCancelOfWorkingOrderIsFatal) {
  ScriptedBroker broker;
  broker.working.status = data::OrderStatus::Pending;
  broker.after_cancel = broker.working;
  broker.cancel_result = false;
  live::LiveExecution execution(broker, test_support::kInstrument, shortTimeout());

  core::Bar bar = test_support::makeBar(0, 10.0, 10.1, 9.9, 10.0);
  EXPECT_THROW(execution.execute(buyIntent(500), bar), core::InvariantViolation);
}

TEST(LiveExecutionTest, OrderFilledWhileCancelFailsIsKept) {
  ScriptedBroker broker;
  broker.working.status = data::OrderStatus::Pending;
  broker.after_cancel.status = data::OrderStatus::Filled;
  broker.after_cancel.filled_quantity = 500;
  broker.after_cancel.average_price = 10.0;
  broker.cancel_result = false;
  live::LiveExecution execution(broker, test_support::kInstrument, shortTimeout());

  core::Bar bar = test_support::makeBar(0, 10.0, 10.1, 9.9, 10.0);
  EXPECT_EQ(execution.execute(buyIntent(500), bar).quantity, 500);
}
