#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <optional>
#include <string>

#include "bar_source.hpp"
#include "broker_client.hpp"

namespace live {

    // Length of one bar for an interval name ("day", "week", "hour", "minute", "30minute", ...).
    // Throws core::ConfigException for unknown names.
    std::chrono::seconds intervalDuration(const std::string& interval);

    // Bars whose interval has fully elapsed at `now` (timestamp + bar_length <= now).
    // The gateway may include the still-forming bar; it must never reach the pipeline.
    core::TimeSeries<core::Bar> completedBars(const core::TimeSeries<core::Bar>& bars,
                                              std::chrono::seconds bar_length,
                                              core::Timestamp now);

    // Bar source backed by the broker. Polls fetchBars() and hands out only completed bars
    // newer than the last one emitted, in timestamp order. Blocks between polls.
    class LiveBarFeed : public backtester::IBarSource {
    public:
        LiveBarFeed(data::BrokerClient& client,
                    std::string instrument_key,
                    std::string interval,
                    int poll_interval_ms);

        virtual ~LiveBarFeed() override = default;

        // Returns std::nullopt once cancel() has been called
        std::optional<core::Bar> nextBar() override;
        std::string describe() const override;

        // Bars at or before `timestamp` are never emitted (used after bootstrapping)
        void setLastEmitted(core::Timestamp timestamp);

        // Safe from any thread; interrupts the wait between polls
        void cancel();
        bool isCancelled() const { return cancelled_.load(); }

    private:
        void poll();
        // Sleeps in short slices; false when cancelled during the wait
        bool waitForNextPoll();

        data::BrokerClient& client_;
        std::string instrument_key_;
        std::string interval_;
        std::chrono::milliseconds poll_interval_;
        std::chrono::seconds bar_length_;
        std::optional<core::Timestamp> last_emitted_;
        std::deque<core::Bar> pending_;
        std::atomic<bool> cancelled_{false};
    };

} // namespace live
