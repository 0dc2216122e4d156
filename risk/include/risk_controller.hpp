#pragma once

#include "config.hpp"
#include "datatypes.hpp"
#include "indicators.hpp"
#include "portfolio.hpp"
#include "position_sizer.hpp"
#include "risk_types.hpp"

namespace risk {

    // Stateless gate between the signal generator and execution. All mutable state lives
    // in the RiskLimitState the caller owns and passes in.
    //
    // Per bar: protective exits (stop-loss, take-profit, trailing stop) are checked first and
    // are never vetoed. A strategy signal then goes through, in order: frequency cap; for buys
    // the drawdown breaker, the daily-loss breaker, sizing (size-out-of-range) and the
    // single-position cap. The first failing check is the reported veto.
    class RiskController {
    public:
        RiskController(const core::RiskConfig& risk_config,
                       const core::ExecutionConfig& execution_config,
                       int utc_offset_minutes);

        // Fresh state for a new run
        void resetRun(RiskLimitState& state, const portfolio::Portfolio& portfolio) const;

        // Reset the daily counters when `bar` opens a new calendar day
        void rollover(const core::Bar& bar, const portfolio::Portfolio& portfolio, RiskLimitState& state) const;

        RiskDecision evaluate(const core::Signal& signal,
                              const portfolio::Portfolio& portfolio,
                              RiskLimitState& state,
                              const core::Bar& bar,
                              const indicators::IndicatorSnapshot& snapshot) const;

        // Record an applied fill; `realized_pnl` is what Portfolio::apply returned
        void onFill(const core::Fill& fill,
                    double realized_pnl,
                    const portfolio::Portfolio& portfolio,
                    RiskLimitState& state) const;

        const PositionSizer& getSizer() const { return sizer_; }

    private:
        std::optional<core::OrderIntent> checkProtectiveExit(const core::Signal& signal,
                                                             const portfolio::Portfolio& portfolio,
                                                             RiskLimitState& state,
                                                             const core::Bar& bar) const;

        RiskDecision veto(VetoReason reason, std::string detail) const;

        core::RiskConfig config_;
        int utc_offset_minutes_;
        PositionSizer sizer_;
    };

} // namespace risk
