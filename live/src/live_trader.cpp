#include "live_trader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace live {

LiveTrader::LiveTrader(const core::EngineConfig& config, data::BrokerClient& client, data::DatabaseManager* audit)
    : config_(config),
      client_(client),
      audit_(audit),
      portfolio_(config.backtest.initial_capital),
      feed_(client, config.instrument, config.interval, config.live.poll_interval_ms),
      execution_(client, config.instrument, config.live)
{
    core::config::validate(config_);
    if (config_.instrument.empty()) {
        throw core::ConfigException("Live trading requires an instrument.");
    }
    driver_ = std::make_unique<backtester::ReplayDriver>(config_, feed_, execution_, portfolio_, audit_);
}

void LiveTrader::bootstrap() {
    auto logger = core::logging::getLogger();
    if (config_.live.bootstrap_bars <= 0) {
        logger->info("Bootstrap disabled; indicators warm up on live bars.");
        return;
    }

    // Ask for twice the span to cover non-trading days
    const core::Timestamp now = std::chrono::system_clock::now();
    const core::Timestamp from = now - intervalDuration(config_.interval) * (config_.live.bootstrap_bars * 2);
    core::TimeSeries<core::Bar> history;
    try {
        history = client_.fetchBars(config_.instrument, config_.interval, from, now);
    } catch (const core::ApiRequestException& e) {
        throw core::DataException(fmt::format("Bootstrap history request failed: {}", e.what()));
    }
    history = completedBars(history, intervalDuration(config_.interval), now);
    std::sort(history.begin(), history.end());
    if (history.size() > static_cast<size_t>(config_.live.bootstrap_bars)) {
        history.erase(history.begin(), history.end() - config_.live.bootstrap_bars);
    }
    if (history.empty()) {
        logger->warn("No bootstrap history returned for {}", config_.instrument);
        return;
    }

    driver_->bootstrap(history);
    feed_.setLastEmitted(history.back().timestamp);
    logger->info("Bootstrap complete: {} bars up to {}", history.size(),
                 core::utils::timestampToString(history.back().timestamp, config_.utc_offset_minutes));
}

backtester::RunStatus LiveTrader::run() {
    auto logger = core::logging::getLogger();
    logger->info("========================================================");
    logger->info("Starting live session: {} ({}) via {}", config_.instrument, config_.interval, config_.live.base_url);
    logger->info("========================================================");

    try {
        const data::PositionReport position = client_.queryPosition(config_.instrument);
        if (position.quantity != 0) {
            // The session portfolio only tracks what this run trades
            logger->warn("Broker already holds {} {} @ {:.2f}; not managed by this session.",
                         position.quantity, config_.instrument, position.average_cost);
        }
    } catch (const core::ApiRequestException& e) {
        logger->warn("Could not query broker position: {}", e.what());
    }

    bootstrap();
    const backtester::RunStatus status = driver_->run();

    logger->info("Live session ended {}: {} bars, equity {:.2f}, position {}",
                 backtester::toString(status), driver_->getBarsProcessed(),
                 portfolio_.getCurrentEquity(), portfolio_.getPositionQuantity());
    return status;
}

void LiveTrader::stop() {
    core::logging::getLogger()->info("Stop requested for live session.");
    driver_->requestStop();
    feed_.cancel();
}

} // namespace live
