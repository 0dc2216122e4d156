#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "datatypes.hpp"
#include "bar_source.hpp"
#include "execution.hpp"
#include "indicator_engine.hpp"
#include "interfaces.hpp"       // ISignalStrategy, CrossingState
#include "portfolio.hpp"
#include "risk_controller.hpp"

namespace data { class DatabaseManager; }

namespace backtester {

    enum class RunStatus {
        Initialized,
        Running,
        Completed,
        Failed
    };

    std::string toString(RunStatus status);

    struct VetoRecord {
        core::Timestamp timestamp;
        risk::VetoReason reason;
        std::string detail;
    };

    // Runs the pipeline bar by bar:
    // indicators -> signal -> risk gate -> execution -> portfolio.
    // The same loop serves replay and live trading; only the bar source and the execution
    // adapter differ. Each bar is processed completely before the next is requested.
    class ReplayDriver {
    public:
        // `audit` may be null. The portfolio is owned by the caller and must outlive the driver.
        ReplayDriver(const core::EngineConfig& config,
                     IBarSource& bar_source,
                     IExecutionAdapter& execution,
                     portfolio::Portfolio& portfolio,
                     data::DatabaseManager* audit = nullptr);

        // Warm indicators and crossing memory with bars that are not traded
        void bootstrap(const core::TimeSeries<core::Bar>& history);

        // INITIALIZED -> RUNNING -> COMPLETED, or FAILED on a data fault.
        // An InvariantViolation or any unexpected error marks the run FAILED and is rethrown.
        RunStatus run();

        // Finish the in-flight bar, then stop. Safe to call from another thread or a signal handler path.
        void requestStop();

        RunStatus getStatus() const { return status_; }
        const std::string& getFailureReason() const { return failure_reason_; }
        size_t getBarsProcessed() const { return bars_processed_; }
        int getFailedExecutions() const { return failed_executions_; }
        const std::vector<core::Signal>& getSignals() const { return signals_; }
        const std::vector<VetoRecord>& getVetoes() const { return vetoes_; }
        const risk::RiskLimitState& getRiskState() const { return risk_state_; }
        const strategy_engine::CrossingState& getCrossingState() const { return crossing_state_; }
        const std::vector<indicators::IndicatorSnapshot>& getRecentSnapshots() const { return recent_; }
        const strategy_engine::ISignalStrategy& getStrategy() const { return *strategy_; }

    private:
        void processBar(const core::Bar& bar);
        void executeIntent(const core::OrderIntent& intent, const core::Bar& bar);
        void rememberSnapshot(const indicators::IndicatorSnapshot& snapshot);

        template<typename Fn>
        void audit(const char* what, Fn&& write);

        const core::EngineConfig& config_;
        IBarSource& bar_source_;
        IExecutionAdapter& execution_;
        portfolio::Portfolio& portfolio_;
        data::DatabaseManager* audit_;

        indicators::IndicatorEngine engine_;
        std::unique_ptr<strategy_engine::ISignalStrategy> strategy_;
        risk::RiskController risk_controller_;

        strategy_engine::CrossingState crossing_state_;
        risk::RiskLimitState risk_state_;
        std::vector<indicators::IndicatorSnapshot> recent_;
        std::optional<core::OrderIntent> pending_intent_;
        std::optional<core::Timestamp> last_bar_time_;

        RunStatus status_ = RunStatus::Initialized;
        std::string failure_reason_;
        std::atomic<bool> stop_requested_{false};
        size_t bars_processed_ = 0;
        int failed_executions_ = 0;
        std::vector<core::Signal> signals_;
        std::vector<VetoRecord> vetoes_;
    };

} // namespace backtester
