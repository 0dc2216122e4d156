#include "datatypes.hpp"

namespace core {

    std::string toString(SignalDirection direction) {
        switch (direction) {
            case SignalDirection::Hold: return "hold";
            case SignalDirection::Buy:  return "buy";
            case SignalDirection::Sell: return "sell";
        }
        return "unknown";
    }

    std::string toString(OrderSide side) {
        return side == OrderSide::Buy ? "buy" : "sell";
    }

    std::string toString(ExitReason reason) {
        switch (reason) {
            case ExitReason::None:         return "strategy";
            case ExitReason::StopLoss:     return "stop-loss";
            case ExitReason::TakeProfit:   return "take-profit";
            case ExitReason::TrailingStop: return "trailing-stop";
        }
        return "unknown";
    }

} // namespace core
