#pragma once

#include <memory>

#include "config.hpp"
#include "broker_client.hpp"
#include "database_manager.hpp"
#include "live_bar_feed.hpp"
#include "live_execution.hpp"
#include "portfolio.hpp"
#include "replay_driver.hpp"

namespace live {

    // Live session: warms the pipeline with recent history, then drives the replay loop
    // from the broker feed until stop() is called.
    class LiveTrader {
    public:
        // `audit` may be null; the client and store must outlive the trader
        LiveTrader(const core::EngineConfig& config, data::BrokerClient& client,
                   data::DatabaseManager* audit = nullptr);

        backtester::RunStatus run();

        // Completes the in-flight bar, then returns from run()
        void stop();

        const portfolio::Portfolio& getPortfolio() const { return portfolio_; }
        const backtester::ReplayDriver& getDriver() const { return *driver_; }

    private:
        void bootstrap();

        core::EngineConfig config_;
        data::BrokerClient& client_;
        data::DatabaseManager* audit_;
        portfolio::Portfolio portfolio_;
        LiveBarFeed feed_;
        LiveExecution execution_;
        std::unique_ptr<backtester::ReplayDriver> driver_;
    };

} // namespace live
