#pragma once

#include "config.hpp"
#include "portfolio.hpp"

namespace backtester {

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double initial_capital = 0.0;
        double final_equity = 0.0;
        double total_return_pct = 0.0;
        double annualized_return_pct = 0.0;
        double max_drawdown_pct = 0.0;
        double total_pnl = 0.0;
        int total_executions = 0;
        int round_trip_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;        // Based on round trips
        double profit_factor = 0.0;   // Gross Profit / Gross Loss
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;
        double sharpe_ratio = 0.0;

        void logMetrics() const;

        bool operator==(const BacktestMetrics& other) const;
    };

    // Summary of a finished (or failed) run, computed from the portfolio alone
    BacktestMetrics computeMetrics(const portfolio::Portfolio& portfolio, const core::BacktestConfig& config);

    // (mean * periods - risk_free) / (stddev * sqrt(periods)) over per-point equity returns
    double sharpeRatio(const std::vector<portfolio::PortfolioState>& equity_curve,
                       double risk_free_rate,
                       int periods_per_year);

} // namespace backtester
