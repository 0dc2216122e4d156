#include "replay_driver.hpp"
#include "strategy_factory.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <exception>

namespace backtester {

    std::string toString(RunStatus status) {
        switch (status) {
            case RunStatus::Initialized: return "INITIALIZED";
            case RunStatus::Running:     return "RUNNING";
            case RunStatus::Completed:   return "COMPLETED";
            case RunStatus::Failed:      return "FAILED";
        }
        return "UNKNOWN";
    }

    ReplayDriver::ReplayDriver(const core::EngineConfig& config,
                               IBarSource& bar_source,
                               IExecutionAdapter& execution,
                               portfolio::Portfolio& portfolio,
                               data::DatabaseManager* audit)
        : config_(config),
          bar_source_(bar_source),
          execution_(execution),
          portfolio_(portfolio),
          audit_(audit),
          engine_(config.indicators),
          strategy_(strategy_engine::StrategyFactory::create(config)),
          risk_controller_(config.risk, config.execution, config.utc_offset_minutes)
    {
        risk_controller_.resetRun(risk_state_, portfolio_);
        core::logging::getLogger()->debug("ReplayDriver ready: source={}, execution={}, strategy={}",
                                          bar_source_.describe(), execution_.getName(), strategy_->getName());
    }

    template<typename Fn>
    void ReplayDriver::audit(const char* what, Fn&& write) {
        if (!audit_) return;
        try {
            write(*audit_);
        } catch (const core::StorageException& e) {
            // Audit failures never change trading state
            core::logging::getLogger()->warn("Audit write ({}) failed: {}", what, e.what());
        }
    }

    void ReplayDriver::requestStop() {
        stop_requested_.store(true);
    }

    void ReplayDriver::rememberSnapshot(const indicators::IndicatorSnapshot& snapshot) {
        recent_.push_back(snapshot);
        if (recent_.size() > engine_.getWindowSize()) {
            recent_.erase(recent_.begin());
        }
    }

    void ReplayDriver::bootstrap(const core::TimeSeries<core::Bar>& history) {
        auto logger = core::logging::getLogger();
        if (status_ != RunStatus::Initialized) {
            throw core::BacktestException("bootstrap() is only allowed before the run starts.");
        }
        for (const auto& bar : history) {
            validateBar(bar);
            auto snapshot = engine_.update(bar);
            // Evaluated only to carry the crossing memory forward; the signal is discarded
            strategy_->evaluate(snapshot, recent_, crossing_state_);
            rememberSnapshot(snapshot);
            last_bar_time_ = bar.timestamp;
        }
        logger->info("Bootstrapped indicators with {} historical bars", history.size());
    }

    RunStatus ReplayDriver::run() {
        auto logger = core::logging::getLogger();
        if (status_ != RunStatus::Initialized) {
            throw core::BacktestException(fmt::format("run() requires INITIALIZED state, current state is {}",
                                                      toString(status_)));
        }

        status_ = RunStatus::Running;
        logger->info("Run started: instrument={}, source={}, execution={}, strategy={}",
                     config_.instrument, bar_source_.describe(), execution_.getName(), strategy_->getName());

        try {
            while (!stop_requested_.load()) {
                std::optional<core::Bar> bar = bar_source_.nextBar();
                if (!bar) {
                    break; // End of stream
                }
                processBar(*bar);
            }
        } catch (const core::InvariantViolation& e) {
            status_ = RunStatus::Failed;
            failure_reason_ = e.what();
            logger->critical("Invariant violated after {} bars: {}", bars_processed_, e.what());
            throw;
        } catch (const core::DataException& e) {
            status_ = RunStatus::Failed;
            failure_reason_ = e.what();
            logger->error("Run FAILED on bad data after {} bars: {}", bars_processed_, e.what());
            return status_;
        } catch (const core::IndicatorCalculationException& e) {
            status_ = RunStatus::Failed;
            failure_reason_ = e.what();
            logger->error("Run FAILED in indicator calculation after {} bars: {}", bars_processed_, e.what());
            return status_;
        } catch (const core::StrategyException& e) {
            status_ = RunStatus::Failed;
            failure_reason_ = e.what();
            logger->error("Run FAILED in strategy evaluation after {} bars: {}", bars_processed_, e.what());
            return status_;
        } catch (const std::exception& e) {
            status_ = RunStatus::Failed;
            failure_reason_ = e.what();
            logger->critical("Run aborted by unexpected error after {} bars: {}", bars_processed_, e.what());
            throw;
        }

        if (pending_intent_) {
            logger->warn("Stream ended with an unexecuted {} intent for {} shares; dropped",
                         core::toString(pending_intent_->side), pending_intent_->quantity);
            pending_intent_.reset();
        }

        status_ = RunStatus::Completed;
        logger->info("Run {} after {} bars{}", toString(status_), bars_processed_,
                     stop_requested_.load() ? " (stop requested)" : "");
        return status_;
    }

    void ReplayDriver::processBar(const core::Bar& bar) {
        auto logger = core::logging::getLogger();

        validateBar(bar);
        if (last_bar_time_ && bar.timestamp <= *last_bar_time_) {
            throw core::DataException(fmt::format("Bar at {} is not after the previous bar at {}",
                                                  core::utils::timestampToString(bar.timestamp, config_.utc_offset_minutes),
                                                  core::utils::timestampToString(*last_bar_time_, config_.utc_offset_minutes)));
        }
        last_bar_time_ = bar.timestamp;

        risk_controller_.rollover(bar, portfolio_, risk_state_);

        // Intent decided on the previous bar executes at this bar's open
        if (pending_intent_) {
            core::OrderIntent intent = *pending_intent_;
            pending_intent_.reset();
            executeIntent(intent, bar);
        }

        indicators::IndicatorSnapshot snapshot = engine_.update(bar);
        portfolio_.markToMarket(bar.timestamp, bar.close);

        core::Signal signal = strategy_->evaluate(snapshot, recent_, crossing_state_);
        if (signal.timestamp != bar.timestamp) {
            throw core::InvariantViolation("Signal timestamp does not match the bar under evaluation.");
        }
        if (signal.direction != core::SignalDirection::Hold) {
            signals_.push_back(signal);
            audit("signal", [&](data::DatabaseManager& db) { db.appendSignal(config_.instrument, signal); });
        }

        risk::RiskDecision decision = risk_controller_.evaluate(signal, portfolio_, risk_state_, bar, snapshot);
        if (decision.vetoed()) {
            vetoes_.push_back(VetoRecord{bar.timestamp, *decision.veto, decision.detail});
            audit("risk event", [&](data::DatabaseManager& db) {
                db.appendRiskEvent(config_.instrument, bar.timestamp, risk::toString(*decision.veto), decision.detail);
            });
        }
        if (decision.approved()) {
            const core::OrderIntent& intent = *decision.intent;
            if (intent.exit_reason != core::ExitReason::None) {
                audit("risk event", [&](data::DatabaseManager& db) {
                    db.appendRiskEvent(config_.instrument, bar.timestamp, core::toString(intent.exit_reason),
                                       fmt::format("forced sell of {} at {:.2f}", intent.quantity, bar.close));
                });
            }
            if (execution_.fillsOnNextBar()) {
                pending_intent_ = intent;
            } else {
                executeIntent(intent, bar);
            }
        }

        rememberSnapshot(snapshot);
        ++bars_processed_;

        audit("portfolio snapshot", [&](data::DatabaseManager& db) {
            db.appendPortfolioSnapshot(config_.instrument, portfolio_.getCurrentState(bar.timestamp));
        });
    }

    void ReplayDriver::executeIntent(const core::OrderIntent& intent, const core::Bar& bar) {
        auto logger = core::logging::getLogger();
        try {
            core::Fill fill = execution_.execute(intent, bar);
            if (fill.quantity > intent.quantity) {
                throw core::InvariantViolation(fmt::format("Fill quantity {} exceeds order quantity {}",
                                                           fill.quantity, intent.quantity));
            }
            if (fill.intent.side == core::OrderSide::Buy &&
                core::utils::roundMoney(static_cast<double>(fill.quantity) * fill.price + fill.commission)
                    > portfolio_.getCash() + core::utils::kEpsilon) {
                throw core::ExecutionException(fmt::format("Insufficient cash {:.2f} for {} @ {:.2f}",
                                                           portfolio_.getCash(), fill.quantity, fill.price));
            }

            const double realized = portfolio_.apply(fill);
            risk_controller_.onFill(fill, realized, portfolio_, risk_state_);
            audit("fill", [&](data::DatabaseManager& db) { db.appendFill(config_.instrument, fill); });
        } catch (const core::ExecutionException& e) {
            // Portfolio untouched; the next bar is evaluated afresh
            ++failed_executions_;
            logger->error("Execution of {} {} failed: {}", core::toString(intent.side), intent.quantity, e.what());
            audit("risk event", [&](data::DatabaseManager& db) {
                db.appendRiskEvent(config_.instrument, bar.timestamp, "execution-failed", e.what());
            });
        }
    }

} // namespace backtester
