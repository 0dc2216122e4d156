#pragma once

#include <optional>
#include <string>

#include "datatypes.hpp"

namespace risk {

    // Why the risk controller blocked a signal. A veto is a normal outcome, not an error.
    enum class VetoReason {
        FrequencyCap,
        DrawdownBreaker,
        DailyLossBreaker,
        SizeOutOfRange,
        PositionCap
    };

    // "frequency-cap", "drawdown-breaker", ...
    std::string toString(VetoReason reason);

    // Counters the risk controller carries between bars. Reset at run start and on
    // every calendar-day boundary (daily fields only).
    struct RiskLimitState {
        int daily_trade_count = 0;
        double daily_realized_pnl = 0.0;      // Net realized P&L since the day started
        double max_drawdown_observed = 0.0;
        std::optional<long long> current_day; // Local calendar day number
        double day_start_equity = 0.0;
        // Protective stop bookkeeping for the open position
        double highest_close_since_entry = 0.0;
        double trailing_stop_price = 0.0;
    };

    // Outcome of one evaluation: an intent, a veto, or neither (hold / nothing to sell)
    struct RiskDecision {
        std::optional<core::OrderIntent> intent;
        std::optional<VetoReason> veto;
        std::string detail;

        bool approved() const { return intent.has_value(); }
        bool vetoed() const { return veto.has_value(); }
    };

} // namespace risk
