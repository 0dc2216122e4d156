#include "metrics.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace backtester {

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Initial Capital: {:.2f}", initial_capital);
        logger->info("Final Equity: {:.2f}", final_equity);
        logger->info("Total Return: {:.2f}%", total_return_pct * 100.0);
        logger->info("Annualized Return: {:.2f}%", annualized_return_pct * 100.0);
        logger->info("Total PnL: {:.2f}", total_pnl);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct * 100.0);
        logger->info("Total Executions: {}", total_executions);
        logger->info("Round-Trip Trades: {} ({} won, {} lost)", round_trip_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
        logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
        logger->info("Sharpe Ratio: {:.3f}", sharpe_ratio);
        logger->info("------------------------");
    }

    bool BacktestMetrics::operator==(const BacktestMetrics& other) const {
        return initial_capital == other.initial_capital && final_equity == other.final_equity &&
               total_return_pct == other.total_return_pct && annualized_return_pct == other.annualized_return_pct &&
               max_drawdown_pct == other.max_drawdown_pct && total_pnl == other.total_pnl &&
               total_executions == other.total_executions && round_trip_trades == other.round_trip_trades &&
               winning_trades == other.winning_trades && losing_trades == other.losing_trades &&
               win_rate == other.win_rate && profit_factor == other.profit_factor &&
               avg_win_pnl == other.avg_win_pnl && avg_loss_pnl == other.avg_loss_pnl &&
               sharpe_ratio == other.sharpe_ratio;
    }

    double sharpeRatio(const std::vector<portfolio::PortfolioState>& equity_curve,
                       double risk_free_rate,
                       int periods_per_year) {
        if (equity_curve.size() < 3 || periods_per_year <= 0) {
            return 0.0;
        }
        std::vector<double> returns;
        returns.reserve(equity_curve.size() - 1);
        for (size_t i = 1; i < equity_curve.size(); ++i) {
            const double previous = equity_curve[i - 1].total_equity;
            returns.push_back(previous > core::utils::kEpsilon ? equity_curve[i].total_equity / previous - 1.0 : 0.0);
        }

        const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
        const double sq_sum = std::inner_product(returns.begin(), returns.end(), returns.begin(), 0.0);
        const double variance = std::max(0.0, sq_sum / static_cast<double>(returns.size()) - mean * mean);
        const double std_dev = std::sqrt(variance);
        if (std_dev <= core::utils::kEpsilon) {
            return 0.0;
        }
        const double periods = static_cast<double>(periods_per_year);
        return (mean * periods - risk_free_rate) / (std_dev * std::sqrt(periods));
    }

    BacktestMetrics computeMetrics(const portfolio::Portfolio& portfolio, const core::BacktestConfig& config) {
        BacktestMetrics metrics;
        const auto& equity_curve = portfolio.getEquityCurve();
        const auto& trade_log = portfolio.getTradeLog();

        metrics.initial_capital = portfolio.getInitialCapital();
        metrics.final_equity = equity_curve.empty() ? portfolio.getCash() : equity_curve.back().total_equity;
        metrics.total_executions = portfolio.getTotalExecutions();

        // --- PnL and Return ---
        metrics.total_pnl = metrics.final_equity - metrics.initial_capital;
        metrics.total_return_pct = metrics.total_pnl / metrics.initial_capital;
        if (equity_curve.size() > 1 && config.periods_per_year > 0 && metrics.final_equity > 0.0) {
            const double years = static_cast<double>(equity_curve.size() - 1) / config.periods_per_year;
            metrics.annualized_return_pct = std::pow(metrics.final_equity / metrics.initial_capital, 1.0 / years) - 1.0;
        }

        metrics.max_drawdown_pct = portfolio.getMaxDrawdown();

        // --- Trade-Based Metrics ---
        metrics.round_trip_trades = static_cast<int>(trade_log.size());
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& trade : trade_log) {
            if (trade.pnl > 0) {
                metrics.winning_trades++;
                gross_profit += trade.pnl;
            } else if (trade.pnl < 0) {
                metrics.losing_trades++;
                gross_loss += trade.pnl; // Negative
            }
        }
        if (metrics.round_trip_trades > 0) {
            metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.round_trip_trades;
        }
        if (std::abs(gross_loss) > core::utils::kEpsilon) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > core::utils::kEpsilon) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        }
        metrics.avg_win_pnl = metrics.winning_trades > 0 ? gross_profit / metrics.winning_trades : 0.0;
        metrics.avg_loss_pnl = metrics.losing_trades > 0 ? gross_loss / metrics.losing_trades : 0.0;

        metrics.sharpe_ratio = sharpeRatio(equity_curve, config.risk_free_rate, config.periods_per_year);
        return metrics;
    }

} // namespace backtester
