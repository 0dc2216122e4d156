// =============================================================================
// portfolio_test.cpp
// =============================================================================
// Cash/holdings accounting, equity curve and round-trip trade log.
// =============================================================================

#include "portfolio.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace test_support;
using core::OrderSide;

TEST(PortfolioTest, BuyAndSellAccounting) {
  portfolio::Portfolio book(100000.0);

  double realized = book.apply(makeFill(OrderSide::Buy, 1000, 10.0, 3.0, 0));
  EXPECT_DOUBLE_EQ(realized, 0.0);
  EXPECT_DOUBLE_EQ(book.getCash(), 89997.0);
  EXPECT_EQ(book.getPositionQuantity(), 1000);
  EXPECT_NEAR(book.getAverageCost(), 10.003, 1e-9);  // Commission is part of the cost basis

  book.markToMarket(dayStamp(1), 11.0);
  EXPECT_NEAR(book.getCurrentEquity(), 100997.0, 1e-6);
  EXPECT_NEAR(book.getUnrealizedPnl(11.0), 997.0, 1e-6);

  realized = book.apply(makeFill(OrderSide::Sell, 1000, 11.0, 3.3, 2));
  EXPECT_NEAR(realized, 993.7, 1e-6);
  EXPECT_NEAR(book.getCash(), 100993.7, 1e-6);
  EXPECT_EQ(book.getPositionQuantity(), 0);
  EXPECT_DOUBLE_EQ(book.getAverageCost(), 0.0);
  EXPECT_NEAR(book.getRealizedPnl(), 993.7, 1e-6);
  EXPECT_EQ(book.getTotalExecutions(), 2);

  ASSERT_EQ(book.getTradeLog().size(), 1u);
  const core::Trade& trade = book.getTradeLog().front();
  EXPECT_EQ(trade.entry_time, dayStamp(0));
  EXPECT_EQ(trade.exit_time, dayStamp(2));
  EXPECT_EQ(trade.quantity, 1000);
  EXPECT_DOUBLE_EQ(trade.entry_price, 10.0);
  EXPECT_DOUBLE_EQ(trade.exit_price, 11.0);
  EXPECT_NEAR(trade.commission, 6.3, 1e-9);
  EXPECT_NEAR(trade.pnl, 993.7, 1e-6);
  EXPECT_NEAR(trade.return_pct, 993.7 / 10000.0, 1e-9);
}

TEST(PortfolioTest, EquityIsCashPlusMarkedHoldings) {
  portfolio::Portfolio book(50000.0);
  book.apply(makeFill(OrderSide::Buy, 2000, 10.0, 6.0, 0));
  for (int day = 1; day <= 5; ++day) {
    const double price = 10.0 + 0.25 * day;
    book.markToMarket(dayStamp(day), price);
    const auto& point = book.getEquityCurve().back();
    EXPECT_NEAR(point.total_equity, point.cash + 2000 * price, 1e-9);
    EXPECT_DOUBLE_EQ(point.market_price, price);
    EXPECT_EQ(point.position, 2000);
  }
}

TEST(PortfolioTest, PartialSellsCloseRoundTripOnlyWhenFlat) {
  portfolio::Portfolio book(100000.0);
  book.apply(makeFill(OrderSide::Buy, 1000, 10.0, 0.0, 0));
  book.apply(makeFill(OrderSide::Buy, 1000, 12.0, 0.0, 1));
  EXPECT_NEAR(book.getAverageCost(), 11.0, 1e-9);

  double realized = book.apply(makeFill(OrderSide::Sell, 500, 12.0, 0.0, 2));
  EXPECT_NEAR(realized, 500.0, 1e-9);
  EXPECT_TRUE(book.getTradeLog().empty());
  EXPECT_NEAR(book.getAverageCost(), 11.0, 1e-9);  // Selling does not move the cost basis

  book.apply(makeFill(OrderSide::Sell, 1500, 10.0, 0.0, 3));
  ASSERT_EQ(book.getTradeLog().size(), 1u);
  const core::Trade& trade = book.getTradeLog().front();
  EXPECT_EQ(trade.quantity, 2000);
  EXPECT_NEAR(trade.entry_price, 11.0, 1e-9);
  EXPECT_NEAR(trade.exit_price, 10.5, 1e-9);
  EXPECT_NEAR(trade.pnl, -1000.0, 1e-9);
}

TEST(PortfolioTest, DrawdownTracksPeak) {
  portfolio::Portfolio book(100000.0);
  book.apply(makeFill(OrderSide::Buy, 5000, 10.0, 0.0, 0));
  book.markToMarket(dayStamp(1), 12.0);  // Equity 110000
  book.markToMarket(dayStamp(2), 9.8);   // Equity  99000
  EXPECT_NEAR(book.getPeakEquity(), 110000.0, 1e-6);
  EXPECT_NEAR(book.getCurrentDrawdown(), 0.1, 1e-9);
  book.markToMarket(dayStamp(3), 11.0);
  EXPECT_NEAR(book.getMaxDrawdown(), 0.1, 1e-9);
  EXPECT_LT(book.getCurrentDrawdown(), 0.1);
}

TEST(PortfolioTest, SameTimestampMarkReplacesPoint) {
  portfolio::Portfolio book(100000.0);
  book.markToMarket(dayStamp(0), 10.0);
  book.apply(makeFill(OrderSide::Buy, 100, 10.0, 1.0, 0));
  book.markToMarket(dayStamp(0), 10.0);
  book.markToMarket(dayStamp(1), 10.5);
  ASSERT_EQ(book.getEquityCurve().size(), 2u);
  EXPECT_EQ(book.getEquityCurve()[0].position, 100);
}

TEST(PortfolioTest, RejectsContractViolations) {
  portfolio::Portfolio book(10000.0);
  EXPECT_THROW(book.apply(makeFill(OrderSide::Sell, 100, 10.0, 0.0, 0)), core::InvariantViolation);
  EXPECT_THROW(book.apply(makeFill(OrderSide::Buy, 1000, 10.0, 1.0, 0)), core::InvariantViolation);
  EXPECT_THROW(book.apply(makeFill(OrderSide::Buy, 0, 10.0, 0.0, 0)), core::InvariantViolation);
  EXPECT_THROW(book.apply(makeFill(OrderSide::Buy, 100, -1.0, 0.0, 0)), core::InvariantViolation);
  EXPECT_THROW(book.markToMarket(dayStamp(0), 0.0), core::DataException);
  EXPECT_THROW(portfolio::Portfolio(0.0), std::invalid_argument);

  // Failed fills leave the book untouched
  EXPECT_DOUBLE_EQ(book.getCash(), 10000.0);
  EXPECT_EQ(book.getPositionQuantity(), 0);
  EXPECT_EQ(book.getTotalExecutions(), 0);
}
