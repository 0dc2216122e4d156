#include "talib_support.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <mutex>
#include <spdlog/fmt/fmt.h>

namespace indicators {
namespace talib {

    void ensureInitialized() {
        static std::once_flag init_flag;
        std::call_once(init_flag, []() {
            TA_RetCode ret_code = TA_Initialize();
            if (ret_code != TA_SUCCESS) {
                throw core::IndicatorCalculationException(
                    fmt::format("TA_Initialize failed with code {}", static_cast<int>(ret_code)));
            }
        });
    }

    std::vector<double> closes(const core::TimeSeries<core::Bar>& input) {
        std::vector<double> out;
        out.reserve(input.size());
        for (const auto& bar : input) out.push_back(bar.close);
        return out;
    }

    std::vector<double> highs(const core::TimeSeries<core::Bar>& input) {
        std::vector<double> out;
        out.reserve(input.size());
        for (const auto& bar : input) out.push_back(bar.high);
        return out;
    }

    std::vector<double> lows(const core::TimeSeries<core::Bar>& input) {
        std::vector<double> out;
        out.reserve(input.size());
        for (const auto& bar : input) out.push_back(bar.low);
        return out;
    }

    std::vector<double> volumes(const core::TimeSeries<core::Bar>& input) {
        std::vector<double> out;
        out.reserve(input.size());
        for (const auto& bar : input) out.push_back(static_cast<double>(bar.volume));
        return out;
    }

    void checkResult(TA_RetCode ret_code, const std::string& function, const std::string& indicator_name,
                     int out_begin_idx, int out_nb_element, int lookback,
                     std::vector<core::TimeSeries<double>*> outputs)
    {
        if (ret_code != TA_SUCCESS) {
            for (auto* output : outputs) output->clear();
            throw core::IndicatorCalculationException(
                fmt::format("TA-Lib {} failed for {} with error code: {}", function, indicator_name,
                            static_cast<int>(ret_code)));
        }

        // Results are aligned by lookback; a different begin index would misalign every value
        if (out_nb_element > 0 && out_begin_idx != lookback) {
            for (auto* output : outputs) output->clear();
            throw core::IndicatorCalculationException(
                fmt::format("TA-Lib {} out_begin_idx ({}) does not match lookback ({}) for {}",
                            function, out_begin_idx, lookback, indicator_name));
        }

        for (auto* output : outputs) {
            if (static_cast<int>(output->size()) != out_nb_element) {
                core::logging::getLogger()->trace("{} produced {} elements (buffer {}). Resizing.",
                                                  indicator_name, out_nb_element, output->size());
                output->resize(static_cast<size_t>(out_nb_element));
            }
        }
    }

} // namespace talib
} // namespace indicators
