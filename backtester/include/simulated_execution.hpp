#pragma once

#include "execution.hpp"
#include "config.hpp"

namespace backtester {

    // Deterministic fills synthesized from the bar under replay
    class SimulatedExecution : public IExecutionAdapter {
    public:
        explicit SimulatedExecution(const core::ExecutionConfig& config);

        virtual ~SimulatedExecution() override = default;

        std::string getName() const override { return "simulated"; }
        core::Fill execute(const core::OrderIntent& intent, const core::Bar& bar) override;
        bool fillsOnNextBar() const override;

        // max(notional * rate, min_commission), rounded to cents
        double commissionFor(double notional) const;

    private:
        core::ExecutionConfig config_;
        long long order_sequence_ = 0;
    };

} // namespace backtester
