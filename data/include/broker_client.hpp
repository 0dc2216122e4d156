#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "config.hpp"

namespace data {

    enum class OrderStatus {
        Pending,
        PartiallyFilled,
        Filled,
        Cancelled,
        Rejected
    };

    std::string toString(OrderStatus status);

    struct OrderReport {
        std::string order_id;
        OrderStatus status = OrderStatus::Pending;
        long long filled_quantity = 0;
        double average_price = 0.0;
        double commission = 0.0;
        std::optional<core::Timestamp> updated_at;
        std::string message;
    };

    struct PositionReport {
        std::string instrument_key;
        long long quantity = 0;
        double average_cost = 0.0;
    };

    // HTTP/JSON client of the brokerage gateway.
    // Every call is bounded by the configured request timeout and throws
    // core::ApiRequestException on transport errors, non-2xx replies or malformed payloads.
    // Gateway calls are virtual so the live adapters can run against a scripted gateway.
    class BrokerClient {
    public:
        BrokerClient(std::string base_url, std::string access_token, int request_timeout_ms);
        virtual ~BrokerClient() = default;

        // Token is read from the environment variable named in the live config
        static BrokerClient fromConfig(const core::LiveConfig& config);

        virtual core::TimeSeries<core::Bar> fetchBars(const std::string& instrument_key,
                                              const std::string& interval,
                                              core::Timestamp from,
                                              core::Timestamp to);

        // Returns the broker order id
        virtual std::string submitOrder(const std::string& instrument_key,
                                core::OrderSide side,
                                long long quantity,
                                core::PriceType price_type,
                                double price);

        virtual OrderReport queryOrder(const std::string& order_id);

        // False when the gateway refused or could not be reached
        virtual bool cancelOrder(const std::string& order_id);

        virtual PositionReport queryPosition(const std::string& instrument_key);

        // --- Response decoding (no I/O) ---
        static core::TimeSeries<core::Bar> parseBars(const nlohmann::json& payload);
        static OrderReport parseOrderReport(const nlohmann::json& payload);
        static PositionReport parsePosition(const nlohmann::json& payload, const std::string& instrument_key);
        static OrderStatus parseOrderStatus(const std::string& status);

    private:
        // Checks transport, HTTP status and the gateway "status" field; returns the "data" member
        nlohmann::json unwrap(int status_code, const std::string& error_message,
                              const std::string& body, const std::string& what) const;

        std::string base_url_;
        std::string access_token_;
        int request_timeout_ms_;
    };

} // namespace data
