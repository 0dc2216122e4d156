#include "position_sizer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>

namespace risk {

namespace {
    // Prior used by Kelly sizing until enough round trips exist
    constexpr double kPriorWinRateBase = 0.55;
    constexpr double kPriorWinRatePerStrength = 0.15;
    constexpr double kPriorAverageWin = 0.03;
    constexpr double kPriorAverageLoss = 0.02;
    constexpr double kMaxCashUsage = 0.95;
}

PositionSizer::PositionSizer(const core::RiskConfig& risk_config, const core::ExecutionConfig& execution_config)
    : config_(risk_config), execution_(execution_config)
{
}

long long PositionSizer::roundToLot(double quantity) const {
    if (quantity <= 0.0) return 0;
    const long long lots = static_cast<long long>(std::floor(quantity / static_cast<double>(config_.lot_size) + core::utils::kEpsilon));
    return lots * config_.lot_size;
}

long long PositionSizer::affordableQuantity(double price, double cash) const {
    if (price <= 0.0 || cash <= 0.0) return 0;
    long long quantity = roundToLot(cash / (price * (1.0 + execution_.commission_rate)));
    // Minimum commission can still tip the cost over the cash
    while (quantity > 0) {
        const double notional = static_cast<double>(quantity) * price;
        const double commission = std::max(notional * execution_.commission_rate, execution_.min_commission);
        if (core::utils::roundMoney(notional + commission) <= cash + core::utils::kEpsilon) break;
        quantity -= config_.lot_size;
    }
    return std::max(quantity, 0LL);
}

double PositionSizer::kellyFraction(const core::Signal& signal, const portfolio::Portfolio& portfolio) const {
    auto logger = core::logging::getLogger();
    const auto& trades = portfolio.getTradeLog();

    double win_rate = kPriorWinRateBase + kPriorWinRatePerStrength * signal.strength;
    double average_win = kPriorAverageWin;
    double average_loss = kPriorAverageLoss;

    if (static_cast<int>(trades.size()) >= config_.kelly_min_trades) {
        const size_t count = std::min(trades.size(), static_cast<size_t>(config_.kelly_lookback_trades));
        int wins = 0;
        double win_sum = 0.0;
        double loss_sum = 0.0;
        for (size_t i = trades.size() - count; i < trades.size(); ++i) {
            if (trades[i].return_pct > 0.0) {
                ++wins;
                win_sum += trades[i].return_pct;
            } else {
                loss_sum += -trades[i].return_pct;
            }
        }
        const int losses = static_cast<int>(count) - wins;
        if (wins > 0 && losses > 0 && loss_sum > core::utils::kEpsilon) {
            win_rate = static_cast<double>(wins) / static_cast<double>(count);
            average_win = win_sum / wins;
            average_loss = loss_sum / losses;
        } else {
            logger->debug("Kelly: last {} trades are one-sided, using prior statistics", count);
        }
    }

    const double payoff = average_win / average_loss;
    double fraction = (payoff * win_rate - (1.0 - win_rate)) / payoff;
    fraction *= config_.kelly_fraction;
    fraction = std::clamp(fraction, 0.0, config_.max_single_position);
    logger->debug("Kelly: p={:.3f}, b={:.3f}, fraction={:.4f}", win_rate, payoff, fraction);
    return fraction;
}

double PositionSizer::targetAmount(const core::Signal& signal,
                                   double price,
                                   const portfolio::Portfolio& portfolio,
                                   const indicators::IndicatorSnapshot& snapshot) const {
    const double equity = portfolio.getEquityAt(price);
    switch (config_.sizing_method) {
        case core::SizingMethod::FixedAmount:
            return std::min(config_.trade_amount, portfolio.getCash() * kMaxCashUsage);
        case core::SizingMethod::FixedFraction: {
            const double scale = config_.scale_by_strength ? signal.strength : 1.0;
            return equity * config_.position_ratio * scale;
        }
        case core::SizingMethod::Kelly:
            return equity * kellyFraction(signal, portfolio);
        case core::SizingMethod::Atr: {
            auto atr = snapshot.get(indicators::keys::kAtr);
            if (!atr || *atr <= core::utils::kEpsilon) {
                return 0.0;
            }
            const double shares = equity * config_.risk_per_trade / (*atr * config_.atr_multiplier);
            return shares * price;
        }
    }
    return 0.0;
}

long long PositionSizer::buyQuantity(const core::Signal& signal,
                                     double price,
                                     const portfolio::Portfolio& portfolio,
                                     const indicators::IndicatorSnapshot& snapshot) const {
    if (price <= 0.0) return 0;
    const double amount = targetAmount(signal, price, portfolio, snapshot);
    const long long wanted = roundToLot(amount / price);
    const long long affordable = affordableQuantity(price, portfolio.getCash());
    const long long quantity = std::min(wanted, affordable);

    core::logging::getLogger()->debug("Sizing ({}): amount={:.2f}, wanted={}, affordable={}, quantity={}",
                                      core::config::toString(config_.sizing_method), amount, wanted, affordable, quantity);
    return quantity;
}

long long PositionSizer::sellQuantity(const core::Signal& signal, long long position) const {
    if (position <= 0) return 0;
    if (!config_.scale_out_by_strength) return position;

    double fraction = 1.0 / 3.0;
    if (signal.strength >= 0.8) {
        fraction = 1.0;
    } else if (signal.strength >= 0.5) {
        fraction = 0.5;
    }
    const long long quantity = roundToLot(static_cast<double>(position) * fraction);
    // Odd lots are sold whole
    return quantity == 0 ? position : std::min(quantity, position);
}

} // namespace risk
