#include "backtester.hpp"
#include "bar_source.hpp"
#include "simulated_execution.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

    Backtester::Backtester(const core::EngineConfig& config, data::DatabaseManager* db_manager)
        : config_(config), db_manager_(db_manager)
    {
        core::config::validate(config_);
    }

    BacktestReport Backtester::run(const std::string& instrument,
                                   const std::string& start_date,
                                   const std::string& end_date,
                                   std::optional<double> initial_capital)
    {
        auto logger = core::logging::getLogger();
        if (!db_manager_) {
            throw core::BacktestException("A database is required to load bars by date range.");
        }
        if (!db_manager_->isConnected() && !db_manager_->connect()) {
            throw core::BacktestException("Failed to connect to the database for backtest data.");
        }

        const core::Timestamp start_ts = core::utils::dateToTimestamp(start_date, config_.utc_offset_minutes);
        const core::Timestamp end_ts = core::utils::dateToTimestamp(end_date, config_.utc_offset_minutes, true);
        if (end_ts < start_ts) {
            throw core::BacktestException(fmt::format("Backtest end {} precedes start {}", end_date, start_date));
        }

        logger->info("Period: {} to {}", start_date, end_date);
        core::TimeSeries<core::Bar> bars = db_manager_->queryBars(instrument, config_.interval, start_ts, end_ts);
        return run(instrument, bars, initial_capital);
    }

    BacktestReport Backtester::run(const std::string& instrument,
                                   const core::TimeSeries<core::Bar>& bars,
                                   std::optional<double> initial_capital)
    {
        auto logger = core::logging::getLogger();

        if (bars.size() < static_cast<size_t>(config_.backtest.min_bars)) {
            throw core::BacktestException(fmt::format("Backtest needs at least {} bars, got {}",
                                                      config_.backtest.min_bars, bars.size()));
        }

        core::EngineConfig run_config = config_;
        run_config.instrument = instrument;
        const double capital = initial_capital.value_or(config_.backtest.initial_capital);
        if (capital <= 0.0) {
            throw core::BacktestException(fmt::format("Initial capital must be positive, got {}", capital));
        }

        logger->info("========================================================");
        logger->info("Starting Backtest Run: {} ({} bars, capital {:.2f})", instrument, bars.size(), capital);
        logger->info("========================================================");

        portfolio::Portfolio portfolio(capital);
        HistoricalBarSource source(bars, instrument);
        SimulatedExecution execution(run_config.execution);
        data::DatabaseManager* audit = run_config.backtest.persist_audit ? db_manager_ : nullptr;
        ReplayDriver driver(run_config, source, execution, portfolio, audit);

        BacktestReport report;
        report.instrument = instrument;
        report.status = driver.run();
        report.failure_reason = driver.getFailureReason();
        report.bars_processed = driver.getBarsProcessed();
        report.metrics = computeMetrics(portfolio, run_config.backtest);
        report.fills = portfolio.getFills();
        report.trades = portfolio.getTradeLog();
        report.signals = driver.getSignals();
        report.vetoes = driver.getVetoes();
        report.equity_curve = portfolio.getEquityCurve();
        report.open_position = portfolio.getPositionQuantity();
        report.open_average_cost = portfolio.getAverageCost();

        report.metrics.logMetrics();
        logger->info("========================================================");
        logger->info("Backtest Run {} for '{}': {} signals, {} fills, {} vetoes, open position {}",
                     toString(report.status), instrument, report.signals.size(), report.fills.size(),
                     report.vetoes.size(), report.open_position);
        logger->info("========================================================");
        return report;
    }

} // namespace backtester
