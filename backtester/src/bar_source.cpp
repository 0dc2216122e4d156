#include "bar_source.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace backtester {

HistoricalBarSource::HistoricalBarSource(core::TimeSeries<core::Bar> bars, std::string label)
    : bars_(std::move(bars)), label_(std::move(label))
{
}

std::optional<core::Bar> HistoricalBarSource::nextBar() {
    if (position_ >= bars_.size()) {
        return std::nullopt;
    }
    return bars_[position_++];
}

std::string HistoricalBarSource::describe() const {
    return fmt::format("historical[{}] ({} bars)", label_, bars_.size());
}

void validateBar(const core::Bar& bar) {
    const std::string when = core::utils::timestampToString(bar.timestamp);
    for (double value : {bar.open, bar.high, bar.low, bar.close}) {
        if (!std::isfinite(value) || value <= 0.0) {
            throw core::DataException(fmt::format("Bar at {} has a non-positive or non-finite price", when));
        }
    }
    if (bar.high < std::max(bar.open, bar.close) - core::utils::kEpsilon ||
        bar.low > std::min(bar.open, bar.close) + core::utils::kEpsilon) {
        throw core::DataException(fmt::format("Bar at {} is inconsistent: O={} H={} L={} C={}",
                                              when, bar.open, bar.high, bar.low, bar.close));
    }
    if (bar.volume < 0) {
        throw core::DataException(fmt::format("Bar at {} has negative volume {}", when, bar.volume));
    }
}

} // namespace backtester
