#include "roc_indicator.hpp"
#include "talib_support.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RocIndicator::RocIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("ROC period must be positive.");
    }
    talib::ensureInitialized();

    lookback_ = TA_ROCP_Lookback(period_);
    if (lookback_ < 0) {
        throw std::invalid_argument(fmt::format("TA_ROCP_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ROCP({})", period_);
    output_keys_.push_back(keys::kPriceRoc);
    core::logging::getLogger()->debug("RocIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string RocIndicator::getName() const { return name_; }
int RocIndicator::getLookback() const { return lookback_; }
const std::vector<std::string>& RocIndicator::getOutputKeys() const { return output_keys_; }

const core::TimeSeries<double>& RocIndicator::getResult(size_t output) const {
    if (output != 0) {
        throw std::out_of_range(fmt::format("{} has a single output line", name_));
    }
    return results_;
}

void RocIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = talib::closes(input);
    results_.resize(close_prices.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_ROCP(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );
    talib::checkResult(ret_code, "TA_ROCP", name_, out_begin_idx, out_nb_element, lookback_, {&results_});
}

} // namespace indicators
