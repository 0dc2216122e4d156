#include "macd_indicator.hpp"
#include "talib_support.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0)
{
    if (fast_period_ <= 0 || slow_period_ <= 0 || signal_period_ <= 0) {
        throw std::invalid_argument("MACD periods must be positive.");
    }
    if (fast_period_ >= slow_period_) {
        // TA-Lib would silently swap them
        throw std::invalid_argument("MACD fast period must be less than slow period.");
    }
    talib::ensureInitialized();

    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
        throw std::invalid_argument(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    output_keys_ = {keys::kMacd, keys::kMacdSignal, keys::kMacdHist};
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const { return name_; }
int MacdIndicator::getLookback() const { return lookback_; }
const std::vector<std::string>& MacdIndicator::getOutputKeys() const { return output_keys_; }

const core::TimeSeries<double>& MacdIndicator::getResult(size_t output) const {
    switch (output) {
        case 0: return macd_;
        case 1: return signal_;
        case 2: return histogram_;
        default:
            throw std::out_of_range(fmt::format("{} has no output line {}", name_, output));
    }
}

void MacdIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    macd_.clear();
    signal_.clear();
    histogram_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = talib::closes(input);
    const size_t output_size = close_prices.size() - static_cast<size_t>(lookback_);
    macd_.resize(output_size);
    signal_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd_.data(),
        signal_.data(),
        histogram_.data()
    );
    talib::checkResult(ret_code, "TA_MACD", name_, out_begin_idx, out_nb_element, lookback_,
                       {&macd_, &signal_, &histogram_});
}

} // namespace indicators
