#pragma once

#include "execution.hpp"
#include "broker_client.hpp"
#include "config.hpp"

namespace live {

    // Sends approved intents to the broker and waits for the outcome.
    // A partially filled order that is cancelled or times out yields a Fill for the filled part.
    class LiveExecution : public backtester::IExecutionAdapter {
    public:
        LiveExecution(data::BrokerClient& client, std::string instrument_key, const core::LiveConfig& config);

        virtual ~LiveExecution() override = default;

        std::string getName() const override { return "live"; }

        // Throws core::ExecutionException on rejection, broker failure or order_timeout_ms without a fill.
        // Throws core::InvariantViolation when a timed-out order cannot be cancelled and is still working.
        core::Fill execute(const core::OrderIntent& intent, const core::Bar& bar) override;

    private:
        core::Fill toFill(const core::OrderIntent& intent, const core::Bar& bar, const data::OrderReport& report) const;

        data::BrokerClient& client_;
        std::string instrument_key_;
        std::chrono::milliseconds order_timeout_;
        std::chrono::milliseconds status_poll_interval_;
    };

} // namespace live
