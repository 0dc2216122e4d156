// =============================================================================
// broker_client_test.cpp
// =============================================================================
// Unit tests for data::BrokerClient response decoding and construction.
// Network calls are only exercised against an unreachable endpoint.
// =============================================================================

#include "broker_client.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>

using json = nlohmann::json;
using data::BrokerClient;
using data::OrderStatus;

TEST(BrokerClientTest, ParsesBarRows) {
  json payload = json::parse(R"({
    "bars": [
      ["2024-01-02T15:00:00+08:00", 10.0, 10.5, 9.8, 10.2, 12000],
      ["2024-01-03T15:00:00+08:00", 10.2, 10.6, 10.1, 10.5, 9000]
    ]
  })");
  auto bars = BrokerClient::parseBars(payload);
  ASSERT_EQ(bars.size(), 2u);
  EXPECT_EQ(bars[0].timestamp, core::utils::stringToTimestamp("2024-01-02T07:00:00Z"));
  EXPECT_DOUBLE_EQ(bars[0].open, 10.0);
  EXPECT_DOUBLE_EQ(bars[1].close, 10.5);
  EXPECT_EQ(bars[1].volume, 9000);
}

TEST(BrokerClientTest, RejectsMalformedBars) {
  EXPECT_THROW(BrokerClient::parseBars(json::object()), core::ApiRequestException);
  EXPECT_THROW(BrokerClient::parseBars(json::parse(R"({"bars": [["2024-01-02T15:00:00+08:00", 10.0]]})")),
               core::ApiRequestException);
  EXPECT_THROW(BrokerClient::parseBars(json::parse(R"({"bars": [["not a time", 1, 1, 1, 1, 1]]})")),
               core::ApiRequestException);
  EXPECT_THROW(BrokerClient::parseBars(json::parse(R"({"bars": [["2024-01-02T15:00:00+08:00", "x", 1, 1, 1, 1]]})")),
               core::ApiRequestException);
}

TEST(BrokerClientTest, MapsOrderStatuses) {
  EXPECT_EQ(BrokerClient::parseOrderStatus("pending"), OrderStatus::Pending);
  EXPECT_EQ(BrokerClient::parseOrderStatus("submitted"), OrderStatus::Pending);
  EXPECT_EQ(BrokerClient::parseOrderStatus("partially_filled"), OrderStatus::PartiallyFilled);
  EXPECT_EQ(BrokerClient::parseOrderStatus("filled"), OrderStatus::Filled);
  EXPECT_EQ(BrokerClient::parseOrderStatus("canceled"), OrderStatus::Cancelled);
  EXPECT_EQ(BrokerClient::parseOrderStatus("cancelled"), OrderStatus::Cancelled);
  EXPECT_EQ(BrokerClient::parseOrderStatus("rejected"), OrderStatus::Rejected);
  EXPECT_THROW(BrokerClient::parseOrderStatus("exploded"), core::ApiRequestException);
}

TEST(BrokerClientTest, ParsesOrderReport) {
  json payload = json::parse(R"({
    "order_id": "B-42",
    "status": "partially_filled",
    "filled_quantity": 300,
    "average_price": 11.21,
    "commission": 1.01,
    "updated_at": "2024-01-02T15:00:05+08:00"
  })");
  auto report = BrokerClient::parseOrderReport(payload);
  EXPECT_EQ(report.order_id, "B-42");
  EXPECT_EQ(report.status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(report.filled_quantity, 300);
  EXPECT_DOUBLE_EQ(report.average_price, 11.21);
  EXPECT_DOUBLE_EQ(report.commission, 1.01);
  ASSERT_TRUE(report.updated_at.has_value());
  EXPECT_TRUE(report.message.empty());

  EXPECT_THROW(BrokerClient::parseOrderReport(json::parse(R"({"status": "filled"})")), core::ApiRequestException);
}

TEST(BrokerClientTest, ParsesPositionWithDefaults) {
  auto position = BrokerClient::parsePosition(json::parse(R"({"quantity": 500, "average_cost": 10.4})"), "TEST.SH");
  EXPECT_EQ(position.instrument_key, "TEST.SH");
  EXPECT_EQ(position.quantity, 500);
  EXPECT_DOUBLE_EQ(position.average_cost, 10.4);

  auto flat = BrokerClient::parsePosition(json::object(), "TEST.SH");
  EXPECT_EQ(flat.quantity, 0);
}

TEST(BrokerClientTest, StatusNames) {
  EXPECT_EQ(data::toString(OrderStatus::PartiallyFilled), "partially_filled");
  EXPECT_EQ(data::toString(OrderStatus::Cancelled), "cancelled");
}

TEST(BrokerClientTest, ConstructorRejectsBadSettings) {
  EXPECT_THROW(BrokerClient("", "token", 1000), std::invalid_argument);
  EXPECT_THROW(BrokerClient("http://127.0.0.1:1", "token", 0), std::invalid_argument);
  EXPECT_NO_THROW(BrokerClient("http://127.0.0.1:1", "", 1000));
}

TEST(BrokerClientTest, UnreachableGatewayThrows) {
  BrokerClient client("http://127.0.0.1:1", "token", 500);
  const auto now = std::chrono::system_clock::now();
  EXPECT_THROW(client.fetchBars("TEST.SH", "day", now - std::chrono::hours(24), now), core::ApiRequestException);
  EXPECT_THROW(client.queryOrder("B-1"), core::ApiRequestException);
  EXPECT_FALSE(client.cancelOrder("B-1"));
}
