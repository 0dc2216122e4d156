#include "risk_controller.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace risk {

RiskController::RiskController(const core::RiskConfig& risk_config,
                               const core::ExecutionConfig& execution_config,
                               int utc_offset_minutes)
    : config_(risk_config),
      utc_offset_minutes_(utc_offset_minutes),
      sizer_(risk_config, execution_config)
{
    core::logging::getLogger()->info(
        "RiskController: sizing={}, trade range=[{:.0f}, {:.0f}], SL={:.2f}%, TP={:.2f}%, trailing={:.2f}%, "
        "max DD={:.2f}%, max daily loss={:.2f}%, max daily trades={}, max position={:.2f}%",
        core::config::toString(config_.sizing_method), config_.min_trade_amount, config_.max_trade_amount,
        config_.stop_loss * 100.0, config_.take_profit * 100.0, config_.trailing_stop * 100.0,
        config_.max_drawdown * 100.0, config_.max_daily_loss * 100.0, config_.max_daily_trades,
        config_.max_single_position * 100.0);
}

void RiskController::resetRun(RiskLimitState& state, const portfolio::Portfolio& portfolio) const {
    state = RiskLimitState{};
    state.day_start_equity = portfolio.getCurrentEquity();
    if (portfolio.getPositionQuantity() > 0) {
        state.highest_close_since_entry = portfolio.getLastPrice();
    }
}

void RiskController::rollover(const core::Bar& bar, const portfolio::Portfolio& portfolio, RiskLimitState& state) const {
    const long long day = core::utils::dayIndex(bar.timestamp, utc_offset_minutes_);
    if (state.current_day && *state.current_day == day) {
        return;
    }
    if (state.current_day) {
        core::logging::getLogger()->debug("New trading day {}: resetting daily counters (trades={}, realized pnl={:.2f})",
                                          core::utils::timestampToString(bar.timestamp, utc_offset_minutes_),
                                          state.daily_trade_count, state.daily_realized_pnl);
    }
    state.current_day = day;
    state.daily_trade_count = 0;
    state.daily_realized_pnl = 0.0;
    state.day_start_equity = portfolio.getCurrentEquity();
}

RiskDecision RiskController::veto(VetoReason reason, std::string detail) const {
    core::logging::getLogger()->info("Signal vetoed [{}]: {}", toString(reason), detail);
    RiskDecision decision;
    decision.veto = reason;
    decision.detail = std::move(detail);
    return decision;
}

std::optional<core::OrderIntent> RiskController::checkProtectiveExit(const core::Signal& signal,
                                                                     const portfolio::Portfolio& portfolio,
                                                                     RiskLimitState& state,
                                                                     const core::Bar& bar) const {
    const long long position = portfolio.getPositionQuantity();
    if (position <= 0) {
        return std::nullopt;
    }

    // Trailing stop ratchets up with the highest close and never retreats
    state.highest_close_since_entry = std::max(state.highest_close_since_entry, bar.close);
    if (config_.trailing_stop > 0.0) {
        state.trailing_stop_price = std::max(state.trailing_stop_price,
                                             state.highest_close_since_entry * (1.0 - config_.trailing_stop));
    }

    const double average_cost = portfolio.getAverageCost();
    const double change = (bar.close - average_cost) / average_cost;

    core::ExitReason reason = core::ExitReason::None;
    if (change <= -config_.stop_loss + core::utils::kEpsilon) {
        reason = core::ExitReason::StopLoss;
    } else if (change >= config_.take_profit - core::utils::kEpsilon) {
        reason = core::ExitReason::TakeProfit;
    } else if (config_.trailing_stop > 0.0 && bar.close <= state.trailing_stop_price + core::utils::kEpsilon) {
        reason = core::ExitReason::TrailingStop;
    }
    if (reason == core::ExitReason::None) {
        return std::nullopt;
    }

    core::OrderIntent intent;
    intent.side = core::OrderSide::Sell;
    intent.quantity = position;
    intent.price_type = core::PriceType::Market;
    intent.reference_price = bar.close;
    intent.signal = signal;
    intent.signal.direction = core::SignalDirection::Sell;
    intent.signal.strength = 1.0;
    intent.signal.reason = core::toString(reason);
    intent.exit_reason = reason;

    core::logging::getLogger()->info("Protective exit [{}]: close={:.2f}, avg cost={:.4f}, change={:.2f}%, selling {}",
                                     core::toString(reason), bar.close, average_cost, change * 100.0, position);
    return intent;
}

RiskDecision RiskController::evaluate(const core::Signal& signal,
                                      const portfolio::Portfolio& portfolio,
                                      RiskLimitState& state,
                                      const core::Bar& bar,
                                      const indicators::IndicatorSnapshot& snapshot) const {
    auto logger = core::logging::getLogger();

    const double equity = portfolio.getEquityAt(bar.close);
    const double drawdown = portfolio.getPeakEquity() > core::utils::kEpsilon
        ? std::max(0.0, (portfolio.getPeakEquity() - equity) / portfolio.getPeakEquity())
        : 0.0;
    state.max_drawdown_observed = std::max(state.max_drawdown_observed, drawdown);

    RiskDecision decision;

    // Protective exits take priority over whatever the strategy says
    if (auto exit_intent = checkProtectiveExit(signal, portfolio, state, bar)) {
        decision.intent = std::move(exit_intent);
        decision.detail = decision.intent->signal.reason;
        return decision;
    }

    if (signal.direction == core::SignalDirection::Hold) {
        return decision;
    }

    // Nothing to sell is a no-op, not a veto
    long long sell_quantity = 0;
    if (signal.direction == core::SignalDirection::Sell) {
        sell_quantity = sizer_.sellQuantity(signal, portfolio.getPositionQuantity());
        if (sell_quantity <= 0) {
            logger->debug("Sell signal '{}' ignored: no holdings", signal.reason);
            decision.detail = "no position";
            return decision;
        }
    }

    // 1. Trade-frequency cap
    if (state.daily_trade_count >= config_.max_daily_trades) {
        return veto(VetoReason::FrequencyCap,
                    fmt::format("{} trades today, limit {}", state.daily_trade_count, config_.max_daily_trades));
    }

    if (signal.direction == core::SignalDirection::Sell) {
        core::OrderIntent intent;
        intent.side = core::OrderSide::Sell;
        intent.quantity = sell_quantity;
        intent.reference_price = bar.close;
        intent.signal = signal;
        decision.intent = intent;
        return decision;
    }

    // 2. Drawdown circuit breaker (buys only)
    if (drawdown >= config_.max_drawdown - core::utils::kEpsilon) {
        return veto(VetoReason::DrawdownBreaker,
                    fmt::format("drawdown {:.2f}% >= limit {:.2f}%",
                                drawdown * 100.0, config_.max_drawdown * 100.0));
    }

    // 3. Daily-loss circuit breaker (buys only), on net realized P&L since the day started
    if (state.day_start_equity > core::utils::kEpsilon && state.daily_realized_pnl < 0.0) {
        const double daily_loss = -state.daily_realized_pnl / state.day_start_equity;
        if (daily_loss >= config_.max_daily_loss - core::utils::kEpsilon) {
            return veto(VetoReason::DailyLossBreaker,
                        fmt::format("net realized loss today {:.2f}% >= limit {:.2f}%",
                                    daily_loss * 100.0, config_.max_daily_loss * 100.0));
        }
    }

    // 4. Position sizing
    const long long quantity = sizer_.buyQuantity(signal, bar.close, portfolio, snapshot);
    const double notional = static_cast<double>(quantity) * bar.close;
    if (quantity <= 0 || notional < config_.min_trade_amount - core::utils::kEpsilon
        || notional > config_.max_trade_amount + core::utils::kEpsilon) {
        return veto(VetoReason::SizeOutOfRange,
                    fmt::format("quantity {} (notional {:.2f}) outside [{:.2f}, {:.2f}]",
                                quantity, notional, config_.min_trade_amount, config_.max_trade_amount));
    }

    // 5. Single-position cap
    const double position_value = static_cast<double>(portfolio.getPositionQuantity()) * bar.close + notional;
    if (equity <= core::utils::kEpsilon || position_value / equity > config_.max_single_position + core::utils::kEpsilon) {
        return veto(VetoReason::PositionCap,
                    fmt::format("position would be {:.2f}% of equity, limit {:.2f}%",
                                (equity > 0.0 ? position_value / equity : 1.0) * 100.0,
                                config_.max_single_position * 100.0));
    }

    core::OrderIntent intent;
    intent.side = core::OrderSide::Buy;
    intent.quantity = quantity;
    intent.reference_price = bar.close;
    intent.signal = signal;
    decision.intent = intent;
    logger->debug("Buy approved: {} @ {:.2f} (notional {:.2f})", quantity, bar.close, notional);
    return decision;
}

void RiskController::onFill(const core::Fill& fill,
                            double realized_pnl,
                            const portfolio::Portfolio& portfolio,
                            RiskLimitState& state) const {
    ++state.daily_trade_count;
    state.daily_realized_pnl = core::utils::roundMoney(state.daily_realized_pnl + realized_pnl);

    if (portfolio.getPositionQuantity() == 0) {
        state.highest_close_since_entry = 0.0;
        state.trailing_stop_price = 0.0;
    } else if (fill.intent.side == core::OrderSide::Buy) {
        state.highest_close_since_entry = std::max(state.highest_close_since_entry, fill.price);
        if (config_.trailing_stop > 0.0) {
            state.trailing_stop_price = std::max(state.trailing_stop_price,
                                                 state.highest_close_since_entry * (1.0 - config_.trailing_stop));
        }
    }
}

} // namespace risk
