#include "risk_types.hpp"

namespace risk {

    std::string toString(VetoReason reason) {
        switch (reason) {
            case VetoReason::FrequencyCap:     return "frequency-cap";
            case VetoReason::DrawdownBreaker:  return "drawdown-breaker";
            case VetoReason::DailyLossBreaker: return "daily-loss-breaker";
            case VetoReason::SizeOutOfRange:   return "size-out-of-range";
            case VetoReason::PositionCap:      return "position-cap";
        }
        return "unknown";
    }

} // namespace risk
