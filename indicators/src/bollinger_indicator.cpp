#include "bollinger_indicator.hpp"
#include "talib_support.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerIndicator::BollingerIndicator(int period, double stddev_multiplier)
    : period_(period), stddev_multiplier_(stddev_multiplier), lookback_(0)
{
    if (period_ <= 0) {
        throw std::invalid_argument("Bollinger period must be positive.");
    }
    if (stddev_multiplier_ <= 0.0) {
        throw std::invalid_argument("Bollinger standard deviation multiplier must be positive.");
    }
    talib::ensureInitialized();

    lookback_ = TA_BBANDS_Lookback(period_, stddev_multiplier_, stddev_multiplier_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::invalid_argument(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{})", period_, stddev_multiplier_);
    output_keys_ = {keys::kBollingerUpper, keys::kBollingerMiddle, keys::kBollingerLower};
    core::logging::getLogger()->debug("BollingerIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerIndicator::getName() const { return name_; }
int BollingerIndicator::getLookback() const { return lookback_; }
const std::vector<std::string>& BollingerIndicator::getOutputKeys() const { return output_keys_; }

const core::TimeSeries<double>& BollingerIndicator::getResult(size_t output) const {
    switch (output) {
        case 0: return upper_;
        case 1: return middle_;
        case 2: return lower_;
        default:
            throw std::out_of_range(fmt::format("{} has no output line {}", name_, output));
    }
}

void BollingerIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    upper_.clear();
    middle_.clear();
    lower_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = talib::closes(input);
    const size_t output_size = close_prices.size() - static_cast<size_t>(lookback_);
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        stddev_multiplier_,   // optInNbDevUp
        stddev_multiplier_,   // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );
    talib::checkResult(ret_code, "TA_BBANDS", name_, out_begin_idx, out_nb_element, lookback_,
                       {&upper_, &middle_, &lower_});
}

} // namespace indicators
