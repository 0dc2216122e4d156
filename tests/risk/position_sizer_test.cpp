// =============================================================================
// position_sizer_test.cpp
// =============================================================================
// Sizing methods, lot rounding, affordability and scale-out.
// =============================================================================

#include "position_sizer.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace test_support;

namespace {

core::Signal buySignal(double strength) {
  core::Signal signal;
  signal.timestamp = dayStamp(0);
  signal.direction = core::SignalDirection::Buy;
  signal.strength = strength;
  return signal;
}

}  // namespace

class PositionSizerTest : public ::testing::Test {
 protected:
  risk::PositionSizer sizer(core::SizingMethod method) {
    risk_config.sizing_method = method;
    return risk::PositionSizer(risk_config, execution_config);
  }

  core::RiskConfig risk_config;
  core::ExecutionConfig execution_config;
  portfolio::Portfolio book{100000.0};
  indicators::IndicatorSnapshot snapshot = makeSnapshot(0, {});
};

TEST_F(PositionSizerTest, FixedAmountCappedByCash) {
  risk_config.trade_amount = 20000.0;
  EXPECT_EQ(sizer(core::SizingMethod::FixedAmount).buyQuantity(buySignal(0.5), 10.0, book, snapshot), 2000);

  portfolio::Portfolio small(10000.0);
  // 95% of 10000 cash at 10.0 -> 950 shares -> 900 in lots
  EXPECT_EQ(sizer(core::SizingMethod::FixedAmount).buyQuantity(buySignal(0.5), 10.0, small, snapshot), 900);
}

TEST_F(PositionSizerTest, FixedFractionScalesWithStrength) {
  auto fixed_fraction = sizer(core::SizingMethod::FixedFraction);
  // 100000 * 0.3 * 0.8 = 24000 at 11.20 -> 2142 -> 2100
  EXPECT_EQ(fixed_fraction.buyQuantity(buySignal(0.8), 11.20, book, snapshot), 2100);

  risk_config.scale_by_strength = false;
  EXPECT_EQ(sizer(core::SizingMethod::FixedFraction).buyQuantity(buySignal(0.8), 10.0, book, snapshot), 3000);
}

TEST_F(PositionSizerTest, KellyUsesPriorWithoutHistory) {
  auto kelly = sizer(core::SizingMethod::Kelly);
  // p = 0.55 + 0.15 = 0.7, b = 0.03 / 0.02 = 1.5 -> f* = 0.5, half Kelly = 0.25
  EXPECT_NEAR(kelly.kellyFraction(buySignal(1.0), book), 0.25, 1e-9);
  EXPECT_EQ(kelly.buyQuantity(buySignal(1.0), 10.0, book, snapshot), 2500);

  risk_config.max_single_position = 0.1;
  EXPECT_NEAR(sizer(core::SizingMethod::Kelly).kellyFraction(buySignal(1.0), book), 0.1, 1e-9);
}

TEST_F(PositionSizerTest, KellyUsesRecentRoundTrips) {
  risk_config.kelly_min_trades = 2;
  auto kelly = sizer(core::SizingMethod::Kelly);
  // One +10% and one -5% round trip: p = 0.5, b = 2 -> f* = 0.25, half Kelly = 0.125
  book.apply(makeFill(core::OrderSide::Buy, 1000, 10.0, 0.0, 0));
  book.apply(makeFill(core::OrderSide::Sell, 1000, 11.0, 0.0, 1));
  book.apply(makeFill(core::OrderSide::Buy, 1000, 10.0, 0.0, 2));
  book.apply(makeFill(core::OrderSide::Sell, 1000, 9.5, 0.0, 3));
  EXPECT_NEAR(kelly.kellyFraction(buySignal(0.5), book), 0.125, 1e-9);
}

TEST_F(PositionSizerTest, AtrRisksFixedFractionOfEquity) {
  auto atr = sizer(core::SizingMethod::Atr);
  // 100000 * 0.01 / (0.5 * 2) = 1000 shares
  auto with_atr = makeSnapshot(0, {{"atr", 0.5}});
  EXPECT_EQ(atr.buyQuantity(buySignal(0.5), 10.0, book, with_atr), 1000);
  EXPECT_EQ(atr.buyQuantity(buySignal(0.5), 10.0, book, snapshot), 0);
}

TEST_F(PositionSizerTest, AffordabilityIncludesMinimumCommission) {
  execution_config.commission_rate = 0.0;
  execution_config.min_commission = 10.0;
  auto fixed = sizer(core::SizingMethod::FixedAmount);
  EXPECT_EQ(fixed.affordableQuantity(10.0, 1005.0), 0);
  EXPECT_EQ(fixed.affordableQuantity(10.0, 1010.0), 100);
  EXPECT_EQ(fixed.roundToLot(199.0), 100);
  EXPECT_EQ(fixed.roundToLot(-5.0), 0);
}

TEST_F(PositionSizerTest, SellQuantityScaleOut) {
  auto full = sizer(core::SizingMethod::FixedFraction);
  core::Signal sell = buySignal(0.3);
  sell.direction = core::SignalDirection::Sell;
  EXPECT_EQ(full.sellQuantity(sell, 1000), 1000);
  EXPECT_EQ(full.sellQuantity(sell, 0), 0);

  risk_config.scale_out_by_strength = true;
  auto scaled = sizer(core::SizingMethod::FixedFraction);
  sell.strength = 0.9;
  EXPECT_EQ(scaled.sellQuantity(sell, 1000), 1000);
  sell.strength = 0.6;
  EXPECT_EQ(scaled.sellQuantity(sell, 1000), 500);
  sell.strength = 0.3;
  EXPECT_EQ(scaled.sellQuantity(sell, 1000), 300);
  EXPECT_EQ(scaled.sellQuantity(sell, 50), 50);  // Odd lot sold whole
}
