#include "momentum_strategy.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

namespace {
    const std::string kRegimeKey = "momentum_regime";
}

MomentumStrategy::MomentumStrategy(std::string name, double price_change_threshold, double volume_change_threshold)
    : name_(std::move(name)),
      price_change_threshold_(price_change_threshold),
      volume_change_threshold_(volume_change_threshold)
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (price_change_threshold_ <= 0.0) throw std::invalid_argument("Price change threshold must be positive.");
    if (volume_change_threshold_ < 0.0) throw std::invalid_argument("Volume change threshold cannot be negative.");

    core::logging::getLogger()->debug("MomentumStrategy '{}' created: price threshold {:.4f}, volume threshold {:.4f}",
                                      name_, price_change_threshold_, volume_change_threshold_);
}

std::string MomentumStrategy::getName() const { return name_; }

core::Signal MomentumStrategy::evaluate(const indicators::IndicatorSnapshot& snapshot,
                                        const std::vector<indicators::IndicatorSnapshot>& /*recent*/,
                                        CrossingState& state) const {
    auto logger = core::logging::getLogger();

    core::Signal signal;
    signal.timestamp = snapshot.timestamp;
    signal.strategy_tag = name_;

    auto price_change = snapshot.get(indicators::keys::kPriceRoc);
    auto volume_ratio = snapshot.get(indicators::keys::kVolumeRatio);
    if (!price_change || !volume_ratio) {
        return signal; // Not warmed up yet; regime memory untouched
    }

    const double volume_change = *volume_ratio - 1.0;
    int regime = 0;
    if (*price_change > price_change_threshold_ && volume_change > volume_change_threshold_) {
        regime = 1;
    } else if (*price_change < -price_change_threshold_) {
        regime = -1;
    }

    std::optional<int> previous = state.observeRegime(kRegimeKey, regime);
    if (!previous || *previous == regime || regime == 0) {
        return signal;
    }

    signal.direction = regime > 0 ? core::SignalDirection::Buy : core::SignalDirection::Sell;
    signal.strength = std::fabs(*price_change) > 2.0 * price_change_threshold_ ? kStrongStrength : kNormalStrength;
    signal.reason = regime > 0 ? "momentum_up" : "momentum_down";

    logger->debug("Strategy '{}': {} on price change {:.4f}, volume change {:.4f} at {}",
                  name_, signal.reason, *price_change, volume_change,
                  core::utils::timestampToString(snapshot.timestamp));
    return signal;
}

} // namespace strategy_engine
