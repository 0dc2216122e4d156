#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace portfolio {

    Portfolio::Portfolio(double initial_capital)
        : initial_capital_(initial_capital), cash_(initial_capital), peak_equity_(initial_capital) {
        if (initial_capital <= 0) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
    }

    double Portfolio::getEquityAt(double price) const {
        return cash_ + static_cast<double>(position_) * price;
    }

    double Portfolio::getCurrentEquity() const {
        return getEquityAt(last_price_);
    }

    double Portfolio::getUnrealizedPnl(double price) const {
        return static_cast<double>(position_) * (price - average_cost_);
    }

    double Portfolio::getCurrentDrawdown() const {
        if (peak_equity_ <= core::utils::kEpsilon) return 0.0;
        return std::max(0.0, (peak_equity_ - getCurrentEquity()) / peak_equity_);
    }

    PortfolioState Portfolio::getCurrentState(core::Timestamp timestamp) const {
        PortfolioState state;
        state.timestamp = timestamp;
        state.cash = cash_;
        state.position = position_;
        state.average_cost = average_cost_;
        state.market_price = last_price_;
        state.positions_value = static_cast<double>(position_) * last_price_;
        state.total_equity = state.cash + state.positions_value;
        state.peak_equity = peak_equity_;
        state.drawdown = getCurrentDrawdown();
        return state;
    }

    void Portfolio::recordPoint(core::Timestamp timestamp) {
        peak_equity_ = std::max(peak_equity_, getCurrentEquity());
        PortfolioState state = getCurrentState(timestamp);
        max_drawdown_ = std::max(max_drawdown_, state.drawdown);

        if (!equity_curve_.empty() && equity_curve_.back().timestamp == timestamp) {
            equity_curve_.back() = state;
        } else {
            equity_curve_.push_back(state);
        }
    }

    void Portfolio::markToMarket(core::Timestamp timestamp, double price) {
        if (price <= 0.0) {
            throw core::DataException(fmt::format("Cannot mark portfolio at non-positive price {}", price));
        }
        last_price_ = price;
        recordPoint(timestamp);
    }

    double Portfolio::apply(const core::Fill& fill) {
        auto logger = core::logging::getLogger();

        if (fill.quantity <= 0 || fill.price <= 0.0 || fill.commission < 0.0) {
            throw core::InvariantViolation(fmt::format("Malformed fill: qty={}, price={}, commission={}",
                                                       fill.quantity, fill.price, fill.commission));
        }
        if (!fills_.empty() && fill.timestamp < fills_.back().timestamp) {
            throw core::InvariantViolation("Fill timestamp precedes the previous fill.");
        }

        const double notional = static_cast<double>(fill.quantity) * fill.price;
        double realized = 0.0;

        if (fill.intent.side == core::OrderSide::Buy) {
            const double cost = core::utils::roundMoney(notional + fill.commission);
            if (cost > cash_ + core::utils::kEpsilon) {
                throw core::InvariantViolation(fmt::format("Buy fill costs {:.2f} but only {:.2f} cash is available",
                                                           cost, cash_));
            }
            if (position_ == 0) {
                open_trade_ = OpenTradeInfo{};
                open_trade_.entry_time = fill.timestamp;
            }
            const long long new_position = position_ + fill.quantity;
            average_cost_ = (average_cost_ * static_cast<double>(position_) + notional + fill.commission)
                            / static_cast<double>(new_position);
            position_ = new_position;
            cash_ = core::utils::roundMoney(cash_ - cost);

            open_trade_.bought += fill.quantity;
            open_trade_.buy_value += notional;
            open_trade_.commission += fill.commission;
        } else {
            if (fill.quantity > position_) {
                throw core::InvariantViolation(fmt::format("Sell fill of {} exceeds held quantity {}",
                                                           fill.quantity, position_));
            }
            realized = static_cast<double>(fill.quantity) * (fill.price - average_cost_) - fill.commission;
            realized_pnl_ += realized;
            cash_ = core::utils::roundMoney(cash_ + core::utils::roundMoney(notional - fill.commission));
            position_ -= fill.quantity;

            open_trade_.sold += fill.quantity;
            open_trade_.sell_value += notional;
            open_trade_.commission += fill.commission;

            if (position_ == 0) {
                average_cost_ = 0.0;

                core::Trade trade;
                trade.entry_time = open_trade_.entry_time;
                trade.exit_time = fill.timestamp;
                trade.quantity = open_trade_.bought;
                trade.entry_price = open_trade_.buy_value / static_cast<double>(open_trade_.bought);
                trade.exit_price = open_trade_.sell_value / static_cast<double>(open_trade_.sold);
                trade.commission = open_trade_.commission;
                trade.pnl = open_trade_.sell_value - open_trade_.buy_value - open_trade_.commission;
                trade.return_pct = open_trade_.buy_value > 0.0 ? trade.pnl / open_trade_.buy_value : 0.0;
                trade_log_.push_back(trade);
                logger->debug("Round trip closed: qty={}, entry={:.4f}, exit={:.4f}, PnL={:.2f}",
                              trade.quantity, trade.entry_price, trade.exit_price, trade.pnl);
                open_trade_ = OpenTradeInfo{};
            }
        }

        fills_.push_back(fill);
        last_price_ = fill.price;
        recordPoint(fill.timestamp);

        logger->info("Fill applied: Time={}, Side={}, Qty={}, Price={:.2f}, Comm={:.2f}, NewCash={:.2f}, NewPosQty={}",
                     core::utils::timestampToString(fill.timestamp),
                     core::toString(fill.intent.side),
                     fill.quantity,
                     fill.price,
                     fill.commission,
                     cash_,
                     position_);
        return realized;
    }

} // namespace portfolio
