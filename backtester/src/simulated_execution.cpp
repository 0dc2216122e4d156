#include "simulated_execution.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace backtester {

SimulatedExecution::SimulatedExecution(const core::ExecutionConfig& config)
    : config_(config)
{
}

bool SimulatedExecution::fillsOnNextBar() const {
    return config_.fill_price == core::FillPriceMode::NextOpen;
}

double SimulatedExecution::commissionFor(double notional) const {
    return core::utils::roundMoney(std::max(notional * config_.commission_rate, config_.min_commission));
}

core::Fill SimulatedExecution::execute(const core::OrderIntent& intent, const core::Bar& bar) {
    auto logger = core::logging::getLogger();

    if (intent.quantity <= 0) {
        throw core::ExecutionException(fmt::format("Order quantity must be positive, got {}", intent.quantity));
    }

    const double price = config_.fill_price == core::FillPriceMode::NextOpen ? bar.open : bar.close;
    if (intent.price_type == core::PriceType::Limit) {
        const bool marketable = intent.side == core::OrderSide::Buy
            ? price <= intent.reference_price + core::utils::kEpsilon
            : price >= intent.reference_price - core::utils::kEpsilon;
        if (!marketable) {
            throw core::ExecutionException(fmt::format("Limit {} @ {:.2f} not marketable at {:.2f}",
                                                       core::toString(intent.side), intent.reference_price, price));
        }
    }

    long long quantity = intent.quantity;
    if (config_.max_volume_participation > 0.0) {
        const auto available = static_cast<long long>(
            std::floor(config_.max_volume_participation * static_cast<double>(bar.volume)));
        if (available <= 0) {
            throw core::ExecutionException(fmt::format("No simulated liquidity at {} (volume {})",
                                                       core::utils::timestampToString(bar.timestamp), bar.volume));
        }
        if (available < quantity) {
            logger->info("Partial fill: {} of {} (participation cap {:.2f}% of volume {})",
                         available, quantity, config_.max_volume_participation * 100.0, bar.volume);
            quantity = available;
        }
    }

    core::Fill fill;
    fill.intent = intent;
    fill.timestamp = bar.timestamp;
    fill.price = price;
    fill.quantity = quantity;
    fill.commission = commissionFor(static_cast<double>(quantity) * price);
    fill.order_id = fmt::format("SIM-{:06d}", ++order_sequence_);

    logger->debug("Simulated fill {}: {} {} @ {:.2f}, commission {:.2f}",
                  fill.order_id, core::toString(intent.side), quantity, price, fill.commission);
    return fill;
}

} // namespace backtester
