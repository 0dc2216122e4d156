#include "strategy_factory.hpp"
#include "technical_strategy.hpp"
#include "momentum_strategy.hpp"
#include "rule.hpp"
#include "comparison_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "logical_condition.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "common_types.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace strategy_engine {

    namespace { // File-local helpers

        core::SignalDirection stringToDirection(const std::string& action_str) {
            std::string lower_str = action_str;
            std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower_str == "buy") return core::SignalDirection::Buy;
            if (lower_str == "sell") return core::SignalDirection::Sell;
            throw std::invalid_argument("Unknown rule action string: " + action_str);
        }

        ComparisonOp stringToCompOp(const std::string& op_str) {
            if (op_str == ">" || op_str == "GT") return ComparisonOp::GT;
            if (op_str == "<" || op_str == "LT") return ComparisonOp::LT;
            if (op_str == ">=" || op_str == "GTE") return ComparisonOp::GTE;
            if (op_str == "<=" || op_str == "LTE") return ComparisonOp::LTE;
            if (op_str == "==" || op_str == "EQ") return ComparisonOp::EQ;
            throw std::invalid_argument("Unknown comparison operator string: " + op_str);
        }

        PriceField stringToPriceField(const std::string& field_str) {
            std::string lower_str = field_str;
            std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower_str == "open") return PriceField::Open;
            if (lower_str == "high") return PriceField::High;
            if (lower_str == "low") return PriceField::Low;
            if (lower_str == "close") return PriceField::Close;
            throw std::invalid_argument("Unknown price field string: " + field_str);
        }

        CrossDirection stringToCrossDirection(const std::string& direction_str) {
            if (direction_str == "above") return CrossDirection::Above;
            if (direction_str == "below") return CrossDirection::Below;
            throw std::invalid_argument("Unknown cross direction string: " + direction_str);
        }

        const std::set<std::string>& knownIndicatorKeys() {
            static const std::set<std::string> known = {
                indicators::keys::kMaShort, indicators::keys::kMaLong, indicators::keys::kRsi,
                indicators::keys::kMacd, indicators::keys::kMacdSignal, indicators::keys::kMacdHist,
                indicators::keys::kBollingerUpper, indicators::keys::kBollingerMiddle,
                indicators::keys::kBollingerLower, indicators::keys::kVolumeMa,
                indicators::keys::kVolumeRatio, indicators::keys::kAtr, indicators::keys::kPriceRoc
            };
            return known;
        }

        std::string requireString(const json& config, const char* key, const std::string& type) {
            if (!config.contains(key) || !config[key].is_string()) {
                throw std::invalid_argument(fmt::format("{} condition requires '{}' (string).", type, key));
            }
            return config[key].get<std::string>();
        }

        json makeCross(const std::string& first, const std::string& direction, const std::string& second) {
            return json{{"type", "Cross"}, {"indicator1", first}, {"direction", direction}, {"indicator2", second}};
        }

        json makeRsi(const char* op, double level) {
            return json{{"type", "Indicator"}, {"indicator1", indicators::keys::kRsi}, {"op", op}, {"value", level}};
        }

        json makeCloseVs(const char* op, const std::string& band) {
            return json{{"type", "PriceIndicator"}, {"field", "close"}, {"op", op}, {"indicator", band}};
        }

        json makeAnd(json first, json second) {
            return json{{"type", "AND"}, {"conditions", json::array({std::move(first), std::move(second)})}};
        }

    } // end anonymous namespace


    json StrategyFactory::defaultRules(double rsi_oversold, double rsi_overbought) {
        using namespace indicators::keys;
        // Band touches only count when RSI confirms the extreme
        return json::array({
            {{"rule_name", "ma_golden_cross"}, {"action", "buy"}, {"strength", 0.8},
             {"condition", makeAnd(makeCross(kMaShort, "above", kMaLong), makeRsi("<", rsi_overbought))}},
            {{"rule_name", "macd_golden_cross"}, {"action", "buy"}, {"strength", 0.6},
             {"condition", makeAnd(makeCross(kMacd, "above", kMacdSignal), makeRsi("<", rsi_overbought))}},
            {{"rule_name", "bollinger_lower_touch"}, {"action", "buy"}, {"strength", 0.7},
             {"condition", makeAnd(makeCloseVs("<=", kBollingerLower), makeRsi("<=", rsi_oversold))}},
            {{"rule_name", "rsi_oversold_rebound"}, {"action", "buy"}, {"strength", 0.5},
             {"condition", {{"type", "Cross"}, {"indicator1", kRsi}, {"direction", "above"}, {"value", rsi_oversold}}}},
            {{"rule_name", "ma_death_cross"}, {"action", "sell"}, {"strength", 0.8},
             {"condition", makeCross(kMaShort, "below", kMaLong)}},
            {{"rule_name", "macd_death_cross"}, {"action", "sell"}, {"strength", 0.6},
             {"condition", makeCross(kMacd, "below", kMacdSignal)}},
            {{"rule_name", "bollinger_upper_touch"}, {"action", "sell"}, {"strength", 0.7},
             {"condition", makeAnd(makeCloseVs(">=", kBollingerUpper), makeRsi(">=", rsi_overbought))}},
            {{"rule_name", "rsi_overbought"}, {"action", "sell"}, {"strength", 0.7},
             {"condition", makeRsi(">", rsi_overbought)}}
        });
    }

    // --- Recursive Helper to Parse Conditions ---
    std::unique_ptr<ICondition> StrategyFactory::parseCondition(const json& config,
                                                                std::vector<CrossPair>& cross_pairs) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw std::invalid_argument("Condition config must be an object with a 'type' (string).");
        }
        std::string type = config["type"].get<std::string>();
        core::logging::getLogger()->trace("Parsing condition of type: {}", type);

        if (type == "Indicator") {
            std::string indicator1 = requireString(config, "indicator1", type);
            ComparisonOp op = stringToCompOp(requireString(config, "op", type));
            if (config.contains("value") && config["value"].is_number()) {
                return std::make_unique<IndicatorCondition>(indicator1, op, config["value"].get<double>());
            }
            if (config.contains("indicator2") && config["indicator2"].is_string()) {
                return std::make_unique<IndicatorCondition>(indicator1, op, config["indicator2"].get<std::string>());
            }
            throw std::invalid_argument("Indicator condition requires 'value' (number) or 'indicator2' (string).");
        }
        if (type == "PriceIndicator") {
            PriceField field = stringToPriceField(requireString(config, "field", type));
            ComparisonOp op = stringToCompOp(requireString(config, "op", type));
            return std::make_unique<PriceIndicatorCondition>(field, op, requireString(config, "indicator", type));
        }
        if (type == "Cross") {
            std::string indicator1 = requireString(config, "indicator1", type);
            CrossDirection direction = stringToCrossDirection(requireString(config, "direction", type));
            std::unique_ptr<IndicatorCrossCondition> cross;
            if (config.contains("value") && config["value"].is_number()) {
                cross = std::make_unique<IndicatorCrossCondition>(indicator1, direction, config["value"].get<double>());
            } else {
                cross = std::make_unique<IndicatorCrossCondition>(indicator1, direction,
                                                                  requireString(config, "indicator2", type));
            }
            if (std::find(cross_pairs.begin(), cross_pairs.end(), cross->getCrossPair()) == cross_pairs.end()) {
                cross_pairs.push_back(cross->getCrossPair());
            }
            return cross;
        }
        if (type == "AND" || type == "OR") {
            if (!config.contains("conditions") || !config["conditions"].is_array() || config["conditions"].empty()) {
                throw std::invalid_argument(fmt::format("{} condition requires 'conditions' (non-empty array).", type));
            }
            std::vector<std::unique_ptr<ICondition>> sub_conditions;
            sub_conditions.reserve(config["conditions"].size());
            for (const auto& sub_conf : config["conditions"]) {
                sub_conditions.push_back(parseCondition(sub_conf, cross_pairs)); // Recursive call
            }
            if (type == "AND") {
                return std::make_unique<AndCondition>(std::move(sub_conditions));
            }
            return std::make_unique<OrCondition>(std::move(sub_conditions));
        }
        throw std::invalid_argument(fmt::format("Unknown condition type '{}' in config.", type));
    }

    // --- Helper to Parse Rules ---
    std::unique_ptr<IRule> StrategyFactory::parseRule(const json& config,
                                                      std::vector<CrossPair>& cross_pairs) {
        if (!config.is_object() ||
            !config.contains("rule_name") || !config["rule_name"].is_string() ||
            !config.contains("action") || !config["action"].is_string() ||
            !config.contains("condition") || !config["condition"].is_object())
        {
            throw std::invalid_argument("Rule config must be object with 'rule_name'(string), 'action'(string), 'condition'(object).");
        }
        std::string name = config["rule_name"].get<std::string>();
        core::SignalDirection direction = stringToDirection(config["action"].get<std::string>());
        double strength = config.value("strength", 0.5);

        auto condition = parseCondition(config["condition"], cross_pairs);
        return std::make_unique<Rule>(name, std::move(condition), direction, strength);
    }

    // --- Helper to Collect Indicator Names (Recursive) ---
    void StrategyFactory::collectIndicatorNames(const json& config, std::set<std::string>& names) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) return;

        std::string type = config["type"].get<std::string>();
        if (type == "AND" || type == "OR") {
            if (config.contains("conditions") && config["conditions"].is_array()) {
                for (const auto& sub_conf : config["conditions"]) {
                    collectIndicatorNames(sub_conf, names); // Recurse
                }
            }
            return;
        }
        for (const char* key : {"indicator", "indicator1", "indicator2"}) {
            if (config.contains(key) && config[key].is_string()) {
                names.insert(config[key].get<std::string>());
            }
        }
    }

    // --- Main Factory Method ---
    std::unique_ptr<ISignalStrategy> StrategyFactory::create(const core::EngineConfig& config) {
        auto logger = core::logging::getLogger();
        const core::StrategyConfig& strategy_config = config.strategy;

        if (strategy_config.type == core::StrategyType::Momentum) {
            logger->info("Creating momentum strategy '{}'", strategy_config.name);
            try {
                return std::make_unique<MomentumStrategy>(strategy_config.name,
                                                          strategy_config.price_change_threshold,
                                                          strategy_config.volume_change_threshold);
            } catch (const std::invalid_argument& e) {
                throw core::ConfigException(fmt::format("Invalid momentum strategy configuration: {}", e.what()));
            }
        }

        const json rules_config = strategy_config.rules.empty()
            ? defaultRules(strategy_config.rsi_oversold, strategy_config.rsi_overbought)
            : strategy_config.rules;
        logger->info("Creating technical strategy '{}' from {} {} rules", strategy_config.name,
                     rules_config.size(), strategy_config.rules.empty() ? "built-in" : "configured");

        try {
            if (!rules_config.is_array()) {
                throw std::invalid_argument("'rules' must be an array.");
            }

            // Reject references to indicators the engine never publishes
            std::set<std::string> indicator_names;
            for (const auto& rule_conf : rules_config) {
                if (rule_conf.is_object() && rule_conf.contains("condition")) {
                    collectIndicatorNames(rule_conf["condition"], indicator_names);
                }
            }
            std::vector<std::string> unknown;
            for (const auto& name : indicator_names) {
                if (knownIndicatorKeys().count(name) == 0) unknown.push_back(name);
            }
            if (!unknown.empty()) {
                throw std::invalid_argument(fmt::format("Unknown indicator key(s): {}", fmt::join(unknown, ", ")));
            }
            logger->debug("Rules reference indicators: {}", fmt::join(indicator_names, ", "));

            std::vector<CrossPair> cross_pairs;
            std::vector<std::unique_ptr<IRule>> rules;
            for (const auto& rule_conf : rules_config) {
                rules.push_back(parseRule(rule_conf, cross_pairs));
            }

            return std::make_unique<TechnicalStrategy>(strategy_config.name, std::move(rules), std::move(cross_pairs));

        } catch (const json::exception& e) {
            throw core::ConfigException(fmt::format("JSON error in strategy rules: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(fmt::format("Invalid strategy configuration: {}", e.what()));
        }
    }

} // namespace strategy_engine
