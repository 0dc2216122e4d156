#include "live_bar_feed.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <thread>
#include <spdlog/fmt/fmt.h>

namespace live {

namespace {
    constexpr std::chrono::milliseconds kWaitSlice{200};
    // How many intervals back each poll asks for
    constexpr int kPollLookbackBars = 5;
}

std::chrono::seconds intervalDuration(const std::string& interval) {
    std::string name = interval;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

    // Optional numeric prefix: "30minute", "4hour"
    size_t digits = 0;
    while (digits < name.size() && std::isdigit(static_cast<unsigned char>(name[digits]))) {
        ++digits;
    }
    long long count = 1;
    if (digits > 0) {
        count = std::stoll(name.substr(0, digits));
        if (count <= 0) {
            throw core::ConfigException("Interval multiplier must be positive: " + interval);
        }
    }
    const std::string unit = name.substr(digits);

    if (unit == "minute" || unit == "min") return std::chrono::seconds(60 * count);
    if (unit == "hour") return std::chrono::seconds(3600 * count);
    if (unit == "day") return std::chrono::seconds(86400 * count);
    if (unit == "week") return std::chrono::seconds(7 * 86400 * count);
    throw core::ConfigException("Unsupported bar interval: " + interval);
}

core::TimeSeries<core::Bar> completedBars(const core::TimeSeries<core::Bar>& bars,
                                          std::chrono::seconds bar_length,
                                          core::Timestamp now) {
    core::TimeSeries<core::Bar> completed;
    completed.reserve(bars.size());
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(completed),
                 [&](const core::Bar& bar) { return bar.timestamp + bar_length <= now; });
    return completed;
}

LiveBarFeed::LiveBarFeed(data::BrokerClient& client,
                         std::string instrument_key,
                         std::string interval,
                         int poll_interval_ms)
    : client_(client),
      instrument_key_(std::move(instrument_key)),
      interval_(std::move(interval)),
      poll_interval_(poll_interval_ms),
      bar_length_(intervalDuration(interval_))
{
    if (poll_interval_ms <= 0) {
        throw std::invalid_argument("Poll interval must be positive.");
    }
}

std::string LiveBarFeed::describe() const {
    return fmt::format("live:{}:{}", instrument_key_, interval_);
}

void LiveBarFeed::setLastEmitted(core::Timestamp timestamp) {
    last_emitted_ = timestamp;
}

void LiveBarFeed::cancel() {
    cancelled_.store(true);
}

bool LiveBarFeed::waitForNextPoll() {
    auto remaining = poll_interval_;
    while (remaining.count() > 0) {
        if (cancelled_.load()) return false;
        const auto slice = std::min(remaining, kWaitSlice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !cancelled_.load();
}

void LiveBarFeed::poll() {
    auto logger = core::logging::getLogger();
    const core::Timestamp now = std::chrono::system_clock::now();
    core::Timestamp from = now - bar_length_ * kPollLookbackBars;
    if (last_emitted_ && *last_emitted_ < from) {
        from = *last_emitted_;
    }

    core::TimeSeries<core::Bar> bars;
    try {
        bars = client_.fetchBars(instrument_key_, interval_, from, now);
    } catch (const core::ApiRequestException& e) {
        // Transient gateway problems must not end the session
        logger->error("Bar poll for {} failed: {}", instrument_key_, e.what());
        return;
    }

    const size_t received = bars.size();
    bars = completedBars(bars, bar_length_, now);
    if (bars.size() < received) {
        logger->trace("Skipped {} forming bar(s) for {}", received - bars.size(), instrument_key_);
    }

    std::sort(bars.begin(), bars.end());
    size_t queued = 0;
    for (const auto& bar : bars) {
        const core::Timestamp newest = pending_.empty() ? last_emitted_.value_or(core::Timestamp::min())
                                                        : pending_.back().timestamp;
        if (bar.timestamp > newest) {
            pending_.push_back(bar);
            ++queued;
        }
    }
    if (queued > 0) {
        logger->debug("Queued {} new bar(s) for {}", queued, instrument_key_);
    }
}

std::optional<core::Bar> LiveBarFeed::nextBar() {
    while (!cancelled_.load()) {
        if (pending_.empty()) {
            poll();
        }
        if (!pending_.empty()) {
            core::Bar bar = pending_.front();
            pending_.pop_front();
            last_emitted_ = bar.timestamp;
            return bar;
        }
        if (!waitForNextPoll()) break;
    }
    core::logging::getLogger()->info("Live bar feed for {} cancelled.", instrument_key_);
    return std::nullopt;
}

} // namespace live
