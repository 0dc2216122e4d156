#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp" // Fill, Trade, Timestamp

namespace portfolio {

    // --- Portfolio State Struct (one equity-curve point) ---
    struct PortfolioState {
        core::Timestamp timestamp;
        double cash = 0.0;
        long long position = 0;
        double average_cost = 0.0;
        double market_price = 0.0;     // Price the position was valued at
        double positions_value = 0.0;  // position * market_price
        double total_equity = 0.0;     // cash + positions_value
        double peak_equity = 0.0;
        double drawdown = 0.0;         // (peak - equity) / peak
    };

    // --- Portfolio Class Definition ---
    // Cash, holdings and P&L of one instrument. apply() is the only way holdings change;
    // markToMarket() only revalues them.
    class Portfolio {
    public:
        explicit Portfolio(double initial_capital);

        // --- Getters ---
        double getInitialCapital() const { return initial_capital_; }
        double getCash() const { return cash_; }
        long long getPositionQuantity() const { return position_; }
        double getAverageCost() const { return average_cost_; }
        double getLastPrice() const { return last_price_; }
        double getRealizedPnl() const { return realized_pnl_; }
        // Valued at the last fill / mark price
        double getCurrentEquity() const;
        double getEquityAt(double price) const;
        double getUnrealizedPnl(double price) const;
        double getPeakEquity() const { return peak_equity_; }
        double getCurrentDrawdown() const;
        double getMaxDrawdown() const { return max_drawdown_; }
        int getTotalExecutions() const { return static_cast<int>(fills_.size()); }
        const std::vector<PortfolioState>& getEquityCurve() const { return equity_curve_; }
        const std::vector<core::Fill>& getFills() const { return fills_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }
        PortfolioState getCurrentState(core::Timestamp timestamp) const;

        // --- Modifiers ---
        // Apply a confirmed fill and return the realized P&L of the fill (0 for buys).
        // Throws core::InvariantViolation for a malformed fill, an oversell or a buy the cash cannot cover.
        double apply(const core::Fill& fill);

        // Record an equity-curve point at `timestamp` valuing the position at `price`.
        // A second mark for the same timestamp replaces the previous point.
        void markToMarket(core::Timestamp timestamp, double price);

    private:
        void recordPoint(core::Timestamp timestamp);

        // Aggregates of the round trip currently open
        struct OpenTradeInfo {
            core::Timestamp entry_time;
            long long bought = 0;
            long long sold = 0;
            double buy_value = 0.0;
            double sell_value = 0.0;
            double commission = 0.0;
        };

        double initial_capital_;
        double cash_;
        long long position_ = 0;
        double average_cost_ = 0.0;   // Includes buy commissions
        double last_price_ = 0.0;
        double realized_pnl_ = 0.0;
        double peak_equity_;
        double max_drawdown_ = 0.0;
        OpenTradeInfo open_trade_;
        std::vector<PortfolioState> equity_curve_;
        std::vector<core::Fill> fills_;
        std::vector<core::Trade> trade_log_;
    };

} // namespace portfolio
