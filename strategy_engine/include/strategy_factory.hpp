#pragma once

#include <string>
#include <vector>
#include <memory> // For std::unique_ptr
#include <set>
#include <utility>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"
#include "crossing_state.hpp"
#include "config.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    class StrategyFactory {
    public:
        // Build the configured strategy variant. Throws core::ConfigException on invalid rules.
        static std::unique_ptr<ISignalStrategy> create(const core::EngineConfig& config);

        // Rule set used by the technical strategy when the configuration supplies none
        static json defaultRules(double rsi_oversold, double rsi_overbought);

    private:
        static std::unique_ptr<ICondition> parseCondition(const json& condition_config,
                                                          std::vector<CrossPair>& cross_pairs);
        static std::unique_ptr<IRule> parseRule(const json& rule_config,
                                                std::vector<CrossPair>& cross_pairs);
        // Recursive: every indicator key a condition tree references
        static void collectIndicatorNames(const json& condition_config, std::set<std::string>& names);
    };

} // namespace strategy_engine
