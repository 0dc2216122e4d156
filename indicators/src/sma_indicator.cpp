#include "sma_indicator.hpp"
#include "talib_support.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period, std::string output_key, PriceSource source)
    : period_(period), source_(source), lookback_(0)
{
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }
    if (output_key.empty()) {
        throw std::invalid_argument("SMA output key cannot be empty.");
    }
    talib::ensureInitialized();

    // Determine the lookback period required by TA-Lib for this period
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::invalid_argument(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = source_ == PriceSource::Volume ? fmt::format("VolumeSMA({})", period_)
                                           : fmt::format("SMA({})", period_);
    output_keys_.push_back(std::move(output_key));
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Key='{}', Lookback={}",
                                      name_, output_keys_.front(), lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const std::vector<std::string>& SmaIndicator::getOutputKeys() const {
    return output_keys_;
}

const core::TimeSeries<double>& SmaIndicator::getResult(size_t output) const {
    if (output != 0) {
        throw std::out_of_range(fmt::format("{} has a single output line", name_));
    }
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is within lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> values = source_ == PriceSource::Volume ? talib::volumes(input)
                                                                : talib::closes(input);

    // TA-Lib output size = input size - lookback
    results_.resize(values.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_MA(
        0,                                    // startIdx
        static_cast<int>(values.size()) - 1,  // endIdx
        values.data(),
        period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );
    talib::checkResult(ret_code, "TA_MA", name_, out_begin_idx, out_nb_element, lookback_, {&results_});

    logger->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
