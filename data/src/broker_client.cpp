#include "broker_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <spdlog/fmt/fmt.h>
#include <cstdlib>

namespace data {

using json = nlohmann::json;

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending:         return "pending";
        case OrderStatus::PartiallyFilled: return "partially_filled";
        case OrderStatus::Filled:          return "filled";
        case OrderStatus::Cancelled:       return "cancelled";
        case OrderStatus::Rejected:        return "rejected";
    }
    return "unknown";
}

BrokerClient::BrokerClient(std::string base_url, std::string access_token, int request_timeout_ms)
    : base_url_(std::move(base_url)),
      access_token_(std::move(access_token)),
      request_timeout_ms_(request_timeout_ms)
{
    auto logger = core::logging::getLogger();
    if (base_url_.empty()) {
        throw std::invalid_argument("Broker base URL cannot be empty.");
    }
    if (request_timeout_ms_ <= 0) {
        throw std::invalid_argument("Broker request timeout must be positive.");
    }
    if (access_token_.empty()) {
        logger->warn("BrokerClient created without access token.");
    }
    logger->debug("BrokerClient created for {} (timeout {} ms).", base_url_, request_timeout_ms_);
}

BrokerClient BrokerClient::fromConfig(const core::LiveConfig& config) {
    const char* token = std::getenv(config.access_token_env.c_str());
    return BrokerClient(config.base_url, token ? token : "", config.request_timeout_ms);
}

json BrokerClient::unwrap(int status_code, const std::string& error_message,
                          const std::string& body, const std::string& what) const {
    auto logger = core::logging::getLogger();
    if (!error_message.empty()) {
        throw core::ApiRequestException(fmt::format("{} failed (transport): {}", what, error_message));
    }
    if (status_code < 200 || status_code >= 300) {
        if (status_code == 401) {
            logger->critical("Broker returned 401 Unauthorized. Access token may be invalid or expired.");
        }
        throw core::ApiRequestException(fmt::format("{} failed: HTTP {} {}", what, status_code, body.substr(0, 500)));
    }

    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::parse_error& e) {
        throw core::ApiRequestException(fmt::format("{} returned invalid JSON: {}", what, e.what()));
    }
    if (payload.contains("status") && payload["status"] != "success") {
        throw core::ApiRequestException(fmt::format("{} returned status '{}': {}", what,
                                                    payload["status"].dump(), payload.value("message", "")));
    }
    if (!payload.contains("data")) {
        throw core::ApiRequestException(fmt::format("{} response has no 'data' member", what));
    }
    return payload["data"];
}

core::TimeSeries<core::Bar> BrokerClient::parseBars(const json& payload) {
    if (!payload.contains("bars") || !payload["bars"].is_array()) {
        throw core::ApiRequestException("Unexpected JSON structure: 'bars' array not found.");
    }
    core::TimeSeries<core::Bar> bars;
    bars.reserve(payload["bars"].size());
    try {
        // Each entry: [timestamp, open, high, low, close, volume]
        for (const auto& row : payload["bars"]) {
            if (!row.is_array() || row.size() < 6) {
                throw core::ApiRequestException("Bar entry must be [timestamp, open, high, low, close, volume].");
            }
            core::Bar bar;
            bar.timestamp = core::utils::stringToTimestamp(row[0].get<std::string>());
            bar.open = row[1].get<double>();
            bar.high = row[2].get<double>();
            bar.low = row[3].get<double>();
            bar.close = row[4].get<double>();
            bar.volume = row[5].get<long long>();
            bars.push_back(bar);
        }
    } catch (const json::exception& e) {
        throw core::ApiRequestException(fmt::format("Malformed bar entry: {}", e.what()));
    } catch (const core::DataException& e) {
        throw core::ApiRequestException(fmt::format("Malformed bar timestamp: {}", e.what()));
    }
    return bars;
}

OrderStatus BrokerClient::parseOrderStatus(const std::string& status) {
    if (status == "pending" || status == "submitted" || status == "reported") return OrderStatus::Pending;
    if (status == "partially_filled") return OrderStatus::PartiallyFilled;
    if (status == "filled") return OrderStatus::Filled;
    if (status == "cancelled" || status == "canceled") return OrderStatus::Cancelled;
    if (status == "rejected" || status == "failed") return OrderStatus::Rejected;
    throw core::ApiRequestException("Unknown order status: " + status);
}

OrderReport BrokerClient::parseOrderReport(const json& payload) {
    OrderReport report;
    try {
        report.order_id = payload.at("order_id").get<std::string>();
        report.status = parseOrderStatus(payload.at("status").get<std::string>());
        report.filled_quantity = payload.value("filled_quantity", 0LL);
        report.average_price = payload.value("average_price", 0.0);
        report.commission = payload.value("commission", 0.0);
        report.message = payload.value("message", "");
        if (payload.contains("updated_at") && payload["updated_at"].is_string()) {
            report.updated_at = core::utils::stringToTimestamp(payload["updated_at"].get<std::string>());
        }
    } catch (const json::exception& e) {
        throw core::ApiRequestException(fmt::format("Malformed order report: {}", e.what()));
    } catch (const core::DataException& e) {
        throw core::ApiRequestException(fmt::format("Malformed order timestamp: {}", e.what()));
    }
    return report;
}

PositionReport BrokerClient::parsePosition(const json& payload, const std::string& instrument_key) {
    PositionReport report;
    report.instrument_key = instrument_key;
    try {
        report.quantity = payload.value("quantity", 0LL);
        report.average_cost = payload.value("average_cost", 0.0);
    } catch (const json::exception& e) {
        throw core::ApiRequestException(fmt::format("Malformed position report: {}", e.what()));
    }
    return report;
}

core::TimeSeries<core::Bar> BrokerClient::fetchBars(const std::string& instrument_key,
                                                    const std::string& interval,
                                                    core::Timestamp from,
                                                    core::Timestamp to) {
    auto logger = core::logging::getLogger();
    const std::string url = fmt::format("{}/v1/bars/{}", base_url_, cpr::util::urlEncode(instrument_key));
    logger->debug("Requesting bars: {} ({})", url, interval);

    cpr::Response response = cpr::Get(cpr::Url{url},
                                      cpr::Header{{"Accept", "application/json"},
                                                  {"Authorization", "Bearer " + access_token_}},
                                      cpr::Parameters{{"interval", interval},
                                                      {"from", core::utils::timestampToString(from, 0)},
                                                      {"to", core::utils::timestampToString(to, 0)}},
                                      cpr::Timeout{request_timeout_ms_});

    json data = unwrap(static_cast<int>(response.status_code), response.error.message, response.text, "fetchBars");
    core::TimeSeries<core::Bar> bars = parseBars(data);
    logger->debug("Received {} bars for {}.", bars.size(), instrument_key);
    return bars;
}

std::string BrokerClient::submitOrder(const std::string& instrument_key,
                                      core::OrderSide side,
                                      long long quantity,
                                      core::PriceType price_type,
                                      double price) {
    auto logger = core::logging::getLogger();
    json body = {
        {"instrument", instrument_key},
        {"side", core::toString(side)},
        {"quantity", quantity},
        {"price_type", price_type == core::PriceType::Limit ? "limit" : "market"},
        {"price", price}
    };
    logger->info("Submitting order: {}", body.dump());

    cpr::Response response = cpr::Post(cpr::Url{base_url_ + "/v1/orders"},
                                       cpr::Header{{"Accept", "application/json"},
                                                   {"Content-Type", "application/json"},
                                                   {"Authorization", "Bearer " + access_token_}},
                                       cpr::Body{body.dump()},
                                       cpr::Timeout{request_timeout_ms_});

    json data = unwrap(static_cast<int>(response.status_code), response.error.message, response.text, "submitOrder");
    if (!data.contains("order_id") || !data["order_id"].is_string()) {
        throw core::ApiRequestException("submitOrder response has no 'order_id'.");
    }
    return data["order_id"].get<std::string>();
}

OrderReport BrokerClient::queryOrder(const std::string& order_id) {
    cpr::Response response = cpr::Get(cpr::Url{fmt::format("{}/v1/orders/{}", base_url_, cpr::util::urlEncode(order_id))},
                                      cpr::Header{{"Accept", "application/json"},
                                                  {"Authorization", "Bearer " + access_token_}},
                                      cpr::Timeout{request_timeout_ms_});
    return parseOrderReport(unwrap(static_cast<int>(response.status_code), response.error.message, response.text, "queryOrder"));
}

bool BrokerClient::cancelOrder(const std::string& order_id) {
    auto logger = core::logging::getLogger();
    cpr::Response response = cpr::Delete(cpr::Url{fmt::format("{}/v1/orders/{}", base_url_, cpr::util::urlEncode(order_id))},
                                         cpr::Header{{"Accept", "application/json"},
                                                     {"Authorization", "Bearer " + access_token_}},
                                         cpr::Timeout{request_timeout_ms_});
    try {
        unwrap(static_cast<int>(response.status_code), response.error.message, response.text, "cancelOrder");
    } catch (const core::ApiRequestException& e) {
        logger->error("Cancel of order {} failed: {}", order_id, e.what());
        return false;
    }
    logger->info("Order {} cancelled.", order_id);
    return true;
}

PositionReport BrokerClient::queryPosition(const std::string& instrument_key) {
    cpr::Response response = cpr::Get(cpr::Url{fmt::format("{}/v1/positions/{}", base_url_, cpr::util::urlEncode(instrument_key))},
                                      cpr::Header{{"Accept", "application/json"},
                                                  {"Authorization", "Bearer " + access_token_}},
                                      cpr::Timeout{request_timeout_ms_});
    return parsePosition(unwrap(static_cast<int>(response.status_code), response.error.message, response.text, "queryPosition"),
                         instrument_key);
}

} // namespace data
