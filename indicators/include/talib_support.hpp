#pragma once

#include "datatypes.hpp"
#include "ta_libc.h"
#include <string>
#include <vector>

namespace indicators {
namespace talib {

    // TA_Initialize once per process; safe to call repeatedly
    void ensureInitialized();

    std::vector<double> closes(const core::TimeSeries<core::Bar>& input);
    std::vector<double> highs(const core::TimeSeries<core::Bar>& input);
    std::vector<double> lows(const core::TimeSeries<core::Bar>& input);
    std::vector<double> volumes(const core::TimeSeries<core::Bar>& input);

    // Throws IndicatorCalculationException when TA-Lib reports a failure,
    // trims `outputs` to the element count TA-Lib produced otherwise.
    void checkResult(TA_RetCode ret_code, const std::string& function, const std::string& indicator_name,
                     int out_begin_idx, int out_nb_element, int lookback,
                     std::vector<core::TimeSeries<double>*> outputs);

} // namespace talib
} // namespace indicators
