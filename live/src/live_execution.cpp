#include "live_execution.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <spdlog/fmt/fmt.h>

namespace live {

LiveExecution::LiveExecution(data::BrokerClient& client, std::string instrument_key, const core::LiveConfig& config)
    : client_(client),
      instrument_key_(std::move(instrument_key)),
      order_timeout_(config.order_timeout_ms),
      status_poll_interval_(std::min(1000, std::max(1, config.order_timeout_ms / 10)))
{
    if (config.order_timeout_ms <= 0) {
        throw std::invalid_argument("Order timeout must be positive.");
    }
}

core::Fill LiveExecution::toFill(const core::OrderIntent& intent, const core::Bar& bar,
                                 const data::OrderReport& report) const {
    if (report.average_price <= 0.0) {
        throw core::ExecutionException(fmt::format("Order {} reported fill without a price", report.order_id));
    }
    core::Fill fill;
    fill.intent = intent;
    // Stamped with the bar the order was executed on so the ledger stays aligned with the replay clock
    fill.timestamp = bar.timestamp;
    fill.price = report.average_price;
    fill.quantity = std::min(report.filled_quantity, intent.quantity);
    fill.commission = core::utils::roundMoney(report.commission);
    fill.order_id = report.order_id;
    return fill;
}

core::Fill LiveExecution::execute(const core::OrderIntent& intent, const core::Bar& bar) {
    auto logger = core::logging::getLogger();
    if (intent.quantity <= 0) {
        throw core::ExecutionException("Refusing to submit an order with non-positive quantity.");
    }

    std::string order_id;
    try {
        order_id = client_.submitOrder(instrument_key_, intent.side, intent.quantity,
                                       intent.price_type, intent.reference_price);
    } catch (const core::ApiRequestException& e) {
        throw core::ExecutionException(fmt::format("Order submission failed: {}", e.what()));
    }
    logger->info("Order {} submitted: {} {} {} @ {:.2f}", order_id, core::toString(intent.side),
                 intent.quantity, instrument_key_, intent.reference_price);

    const auto deadline = std::chrono::steady_clock::now() + order_timeout_;
    data::OrderReport report;
    report.order_id = order_id;
    while (true) {
        try {
            report = client_.queryOrder(order_id);
        } catch (const core::ApiRequestException& e) {
            logger->warn("Status query for order {} failed: {}", order_id, e.what());
        }

        if (report.status == data::OrderStatus::Filled) {
            logger->info("Order {} filled: {} @ {:.2f}", order_id, report.filled_quantity, report.average_price);
            return toFill(intent, bar, report);
        }
        if (report.status == data::OrderStatus::Cancelled || report.status == data::OrderStatus::Rejected) {
            if (report.filled_quantity > 0) {
                logger->warn("Order {} {} after partial fill of {}", order_id,
                             data::toString(report.status), report.filled_quantity);
                return toFill(intent, bar, report);
            }
            throw core::ExecutionException(fmt::format("Order {} {}: {}", order_id,
                                                       data::toString(report.status), report.message));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(status_poll_interval_);
    }

    // Timed out: withdraw the remainder and keep whatever was filled
    logger->error("Order {} not filled within {} ms; cancelling.", order_id, order_timeout_.count());
    const bool cancelled = client_.cancelOrder(order_id);
    bool status_known = false;
    try {
        report = client_.queryOrder(order_id);
        status_known = true;
    } catch (const core::ApiRequestException& e) {
        logger->warn("Final status query for order {} failed: {}", order_id, e.what());
    }
    if (status_known && report.status == data::OrderStatus::Filled) {
        logger->info("Order {} filled while cancelling: {} @ {:.2f}", order_id, report.filled_quantity, report.average_price);
        return toFill(intent, bar, report);
    }
    if (!cancelled) {
        const bool working = !status_known
            || report.status == data::OrderStatus::Pending
            || report.status == data::OrderStatus::PartiallyFilled;
        if (working) {
            // A later broker fill would never reach the portfolio
            throw core::InvariantViolation(fmt::format(
                "Order {} could not be cancelled and may still be working at the broker (status {}, filled {})",
                order_id, status_known ? data::toString(report.status) : std::string("unknown"),
                report.filled_quantity));
        }
    }
    if (report.filled_quantity > 0) {
        return toFill(intent, bar, report);
    }
    throw core::ExecutionException(fmt::format("Order {} timed out after {} ms", order_id, order_timeout_.count()));
}

} // namespace live
