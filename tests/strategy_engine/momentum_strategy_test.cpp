// =============================================================================
// momentum_strategy_test.cpp
// =============================================================================
// Regime entry signals of the price/volume momentum strategy.
// =============================================================================

#include "momentum_strategy.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace strategy_engine;
using namespace test_support;

class MomentumStrategyTest : public ::testing::Test {
 protected:
  core::Signal feed(int day, double price_roc, double volume_ratio) {
    auto snapshot = makeSnapshot(day, {{"price_roc", price_roc}, {"volume_ratio", volume_ratio}});
    return strategy.evaluate(snapshot, recent, state);
  }

  MomentumStrategy strategy{"momentum", 0.01, 0.5};
  CrossingState state;
  std::vector<indicators::IndicatorSnapshot> recent;
};

TEST_F(MomentumStrategyTest, FiresOnlyWhenEnteringARegime) {
  EXPECT_EQ(feed(0, 0.0, 1.0).direction, core::SignalDirection::Hold);  // First observation

  core::Signal up = feed(1, 0.015, 1.8);
  EXPECT_EQ(up.direction, core::SignalDirection::Buy);
  EXPECT_DOUBLE_EQ(up.strength, MomentumStrategy::kNormalStrength);
  EXPECT_EQ(up.reason, "momentum_up");

  EXPECT_EQ(feed(2, 0.03, 2.0).direction, core::SignalDirection::Hold);  // Still in the up regime

  core::Signal down = feed(3, -0.025, 0.9);
  EXPECT_EQ(down.direction, core::SignalDirection::Sell);
  EXPECT_DOUBLE_EQ(down.strength, MomentumStrategy::kStrongStrength);

  EXPECT_EQ(feed(4, 0.0, 1.0).direction, core::SignalDirection::Hold);  // Neutral never signals
  EXPECT_EQ(feed(5, -0.02, 1.0).direction, core::SignalDirection::Sell);
}

TEST_F(MomentumStrategyTest, PriceMoveWithoutVolumeIsNotAnUpRegime) {
  feed(0, 0.0, 1.0);
  EXPECT_EQ(feed(1, 0.05, 1.2).direction, core::SignalDirection::Hold);
  EXPECT_EQ(feed(2, 0.05, 1.6).direction, core::SignalDirection::Buy);
}

TEST_F(MomentumStrategyTest, MissingInputsLeaveRegimeMemoryUntouched) {
  feed(0, 0.0, 1.0);
  auto snapshot = makeSnapshot(1, {{"price_roc", 0.05}});
  EXPECT_EQ(strategy.evaluate(snapshot, recent, state).direction, core::SignalDirection::Hold);
  EXPECT_EQ(feed(2, 0.05, 2.0).direction, core::SignalDirection::Buy);
}

TEST(MomentumStrategyConstructionTest, RejectsBadThresholds) {
  EXPECT_THROW(MomentumStrategy("m", 0.0, 0.5), std::invalid_argument);
  EXPECT_THROW(MomentumStrategy("m", 0.01, -0.1), std::invalid_argument);
  EXPECT_THROW(MomentumStrategy("", 0.01, 0.5), std::invalid_argument);
}
