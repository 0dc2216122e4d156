#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional>

namespace core {

    // Using system_clock for time points (UTC based)
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV record for a fixed interval. Immutable once recorded.
    struct Bar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class SignalDirection {
        Hold,
        Buy,
        Sell
    };

    enum class OrderSide {
        Buy,
        Sell
    };

    // How the order should be priced when it reaches the broker
    enum class PriceType {
        Market,
        Limit
    };

    // Why a sell was forced outside the strategy
    enum class ExitReason {
        None,        // Strategy driven
        StopLoss,
        TakeProfit,
        TrailingStop
    };

    struct Signal {
        Timestamp timestamp;
        SignalDirection direction = SignalDirection::Hold;
        double strength = 0.0;      // In [0, 1]
        std::string strategy_tag;   // Which strategy produced it
        std::string reason;         // Rule / regime that fired
    };

    // A risk approved, not yet executed trade request
    struct OrderIntent {
        OrderSide side = OrderSide::Buy;
        long long quantity = 0;
        PriceType price_type = PriceType::Market;
        double reference_price = 0.0;  // Price the decision was made at (limit price for Limit)
        Signal signal;                 // Originating signal
        ExitReason exit_reason = ExitReason::None;
    };

    // What actually happened for an OrderIntent
    struct Fill {
        OrderIntent intent;
        Timestamp timestamp;
        double price = 0.0;
        long long quantity = 0;
        double commission = 0.0;
        std::string order_id;
    };

    // Completed round trip (flat -> long -> flat)
    struct Trade {
        Timestamp entry_time;
        Timestamp exit_time;
        long long quantity = 0;       // Total quantity bought during the round trip
        double entry_price = 0.0;     // Average buy price
        double exit_price = 0.0;      // Average sell price
        double commission = 0.0;      // Total commission (entry + exit)
        double pnl = 0.0;             // Net profit or loss
        double return_pct = 0.0;      // PnL / entry value
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string toString(SignalDirection direction);
    std::string toString(OrderSide side);
    std::string toString(ExitReason reason);

} // namespace core
