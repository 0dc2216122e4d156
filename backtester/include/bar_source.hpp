#pragma once

#include <optional>
#include <string>
#include "datatypes.hpp"

namespace backtester {

    // Ordered stream of bars. Historical replay iterates a fixed series; the live feed blocks
    // until the next bar arrives. std::nullopt means end of stream.
    class IBarSource {
    public:
        virtual ~IBarSource() = default;
        virtual std::optional<core::Bar> nextBar() = 0;
        virtual std::string describe() const = 0;
    };

    class HistoricalBarSource : public IBarSource {
    public:
        HistoricalBarSource(core::TimeSeries<core::Bar> bars, std::string label);

        virtual ~HistoricalBarSource() override = default;

        std::optional<core::Bar> nextBar() override;
        std::string describe() const override;

        size_t size() const { return bars_.size(); }
        size_t remaining() const { return bars_.size() - position_; }

    private:
        core::TimeSeries<core::Bar> bars_;
        std::string label_;
        size_t position_ = 0;
    };

    // Throws core::DataException for non-positive or inconsistent prices and negative volume
    void validateBar(const core::Bar& bar);

} // namespace backtester
