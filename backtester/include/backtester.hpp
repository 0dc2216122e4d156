#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "datatypes.hpp"
#include "database_manager.hpp"
#include "metrics.hpp"
#include "portfolio.hpp"
#include "replay_driver.hpp"

namespace backtester {

    // What a backtest returns: summary metrics plus the full ledger
    struct BacktestReport {
        std::string instrument;
        RunStatus status = RunStatus::Initialized;
        std::string failure_reason;
        size_t bars_processed = 0;
        BacktestMetrics metrics;
        std::vector<core::Fill> fills;
        std::vector<core::Trade> trades;
        std::vector<core::Signal> signals;
        std::vector<VetoRecord> vetoes;
        std::vector<portfolio::PortfolioState> equity_curve;
        long long open_position = 0;
        double open_average_cost = 0.0;
    };

    class Backtester {
    public:
        explicit Backtester(const core::EngineConfig& config, data::DatabaseManager* db_manager = nullptr);

        // Load [start_date, end_date] (YYYY-MM-DD, local calendar days) from the store and replay it.
        // Throws core::BacktestException when fewer than min_bars bars are available.
        BacktestReport run(const std::string& instrument,
                           const std::string& start_date,
                           const std::string& end_date,
                           std::optional<double> initial_capital = std::nullopt);

        // Replay an in-memory series
        BacktestReport run(const std::string& instrument,
                           const core::TimeSeries<core::Bar>& bars,
                           std::optional<double> initial_capital = std::nullopt);

    private:
        core::EngineConfig config_;
        data::DatabaseManager* db_manager_; // Not owned
    };

} // namespace backtester
