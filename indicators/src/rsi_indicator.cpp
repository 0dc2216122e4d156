#include "rsi_indicator.hpp"
#include "talib_support.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("RSI period must be positive.");
    }
    talib::ensureInitialized();

    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
        throw std::invalid_argument(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    output_keys_.push_back(keys::kRsi);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const std::vector<std::string>& RsiIndicator::getOutputKeys() const {
    return output_keys_;
}

const core::TimeSeries<double>& RsiIndicator::getResult(size_t output) const {
    if (output != 0) {
        throw std::out_of_range(fmt::format("{} has a single output line", name_));
    }
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = talib::closes(input);
    results_.resize(close_prices.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    // TA-Lib seeds with the simple average of the first `period` changes, then applies Wilder smoothing
    TA_RetCode ret_code = TA_RSI(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );
    talib::checkResult(ret_code, "TA_RSI", name_, out_begin_idx, out_nb_element, lookback_, {&results_});
}

} // namespace indicators
