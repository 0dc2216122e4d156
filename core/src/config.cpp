#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace core {
namespace config {

    namespace { // File-local helpers

        SizingMethod stringToSizingMethod(const std::string& value) {
            if (value == "fixed_amount") return SizingMethod::FixedAmount;
            if (value == "fixed_fraction") return SizingMethod::FixedFraction;
            if (value == "kelly") return SizingMethod::Kelly;
            if (value == "atr") return SizingMethod::Atr;
            throw ConfigException("Unknown sizing method: " + value);
        }

        StrategyType stringToStrategyType(const std::string& value) {
            if (value == "technical") return StrategyType::Technical;
            if (value == "momentum") return StrategyType::Momentum;
            throw ConfigException("Unknown strategy type: " + value);
        }

        FillPriceMode stringToFillPriceMode(const std::string& value) {
            if (value == "close") return FillPriceMode::Close;
            if (value == "next_open") return FillPriceMode::NextOpen;
            throw ConfigException("Unknown fill price mode: " + value);
        }

        void requirePositive(int value, const char* name) {
            if (value <= 0) {
                throw ConfigException(fmt::format("'{}' must be positive (got {}).", name, value));
            }
        }

        void requireFraction(double value, const char* name) {
            if (!(value > 0.0 && value <= 1.0)) {
                throw ConfigException(fmt::format("'{}' must lie in (0, 1] (got {}).", name, value));
            }
        }

        void readIndicators(const json& j, IndicatorConfig& out) {
            out.ma_short = j.value("ma_short", out.ma_short);
            out.ma_long = j.value("ma_long", out.ma_long);
            out.rsi_period = j.value("rsi_period", out.rsi_period);
            if (j.contains("macd")) {
                const auto& m = j.at("macd");
                out.macd.fast = m.value("fast", out.macd.fast);
                out.macd.slow = m.value("slow", out.macd.slow);
                out.macd.signal = m.value("signal", out.macd.signal);
            }
            if (j.contains("bollinger")) {
                const auto& b = j.at("bollinger");
                out.bollinger.period = b.value("period", out.bollinger.period);
                out.bollinger.stddev = b.value("stddev", out.bollinger.stddev);
            }
            out.volume_ma = j.value("volume_ma", out.volume_ma);
            out.atr_period = j.value("atr_period", out.atr_period);
            out.momentum_period = j.value("momentum_period", out.momentum_period);
            out.warmup_bars = j.value("warmup_bars", out.warmup_bars);
        }

        void readStrategy(const json& j, StrategyConfig& out) {
            if (j.contains("type")) {
                out.type = stringToStrategyType(j.at("type").get<std::string>());
                out.name = j.at("type").get<std::string>();
            }
            out.name = j.value("name", out.name);
            out.rsi_overbought = j.value("rsi_overbought", out.rsi_overbought);
            out.rsi_oversold = j.value("rsi_oversold", out.rsi_oversold);
            if (j.contains("rules")) {
                if (!j.at("rules").is_array()) {
                    throw ConfigException("'strategy.rules' must be an array.");
                }
                out.rules = j.at("rules");
            }
            out.price_change_threshold = j.value("price_change_threshold", out.price_change_threshold);
            out.volume_change_threshold = j.value("volume_change_threshold", out.volume_change_threshold);
        }

        void readRisk(const json& j, RiskConfig& out) {
            if (j.contains("sizing_method")) {
                out.sizing_method = stringToSizingMethod(j.at("sizing_method").get<std::string>());
            }
            out.trade_amount = j.value("trade_amount", out.trade_amount);
            out.position_ratio = j.value("position_ratio", out.position_ratio);
            out.scale_by_strength = j.value("scale_by_strength", out.scale_by_strength);
            out.kelly_fraction = j.value("kelly_fraction", out.kelly_fraction);
            out.kelly_min_trades = j.value("kelly_min_trades", out.kelly_min_trades);
            out.kelly_lookback_trades = j.value("kelly_lookback_trades", out.kelly_lookback_trades);
            out.risk_per_trade = j.value("risk_per_trade", out.risk_per_trade);
            out.atr_multiplier = j.value("atr_multiplier", out.atr_multiplier);
            out.min_trade_amount = j.value("min_trade_amount", out.min_trade_amount);
            out.max_trade_amount = j.value("max_trade_amount", out.max_trade_amount);
            out.stop_loss = j.value("stop_loss", out.stop_loss);
            out.take_profit = j.value("take_profit", out.take_profit);
            out.trailing_stop = j.value("trailing_stop", out.trailing_stop);
            out.max_drawdown = j.value("max_drawdown", out.max_drawdown);
            out.max_daily_loss = j.value("max_daily_loss", out.max_daily_loss);
            out.max_daily_trades = j.value("max_daily_trades", out.max_daily_trades);
            out.max_single_position = j.value("max_single_position", out.max_single_position);
            out.lot_size = j.value("lot_size", out.lot_size);
            out.scale_out_by_strength = j.value("scale_out_by_strength", out.scale_out_by_strength);
        }

        void readExecution(const json& j, ExecutionConfig& out) {
            if (j.contains("fill_price")) {
                out.fill_price = stringToFillPriceMode(j.at("fill_price").get<std::string>());
            }
            out.commission_rate = j.value("commission_rate", out.commission_rate);
            out.min_commission = j.value("min_commission", out.min_commission);
            out.max_volume_participation = j.value("max_volume_participation", out.max_volume_participation);
        }

    } // end anonymous namespace

    std::string toString(SizingMethod method) {
        switch (method) {
            case SizingMethod::FixedAmount:   return "fixed_amount";
            case SizingMethod::FixedFraction: return "fixed_fraction";
            case SizingMethod::Kelly:         return "kelly";
            case SizingMethod::Atr:           return "atr";
        }
        return "unknown";
    }

    EngineConfig fromJson(const json& document) {
        if (!document.is_object()) {
            throw ConfigException("Configuration root must be a JSON object.");
        }

        EngineConfig config;
        try {
            config.instrument = document.value("instrument", config.instrument);
            config.interval = document.value("interval", config.interval);
            config.utc_offset_minutes = document.value("utc_offset_minutes", config.utc_offset_minutes);

            if (document.contains("indicators")) readIndicators(document.at("indicators"), config.indicators);
            if (document.contains("strategy")) readStrategy(document.at("strategy"), config.strategy);
            if (document.contains("risk")) readRisk(document.at("risk"), config.risk);
            if (document.contains("execution")) readExecution(document.at("execution"), config.execution);

            if (document.contains("backtest")) {
                const auto& b = document.at("backtest");
                config.backtest.initial_capital = b.value("initial_capital", config.backtest.initial_capital);
                config.backtest.min_bars = b.value("min_bars", config.backtest.min_bars);
                config.backtest.risk_free_rate = b.value("risk_free_rate", config.backtest.risk_free_rate);
                config.backtest.periods_per_year = b.value("periods_per_year", config.backtest.periods_per_year);
                config.backtest.persist_audit = b.value("persist_audit", config.backtest.persist_audit);
            }
            if (document.contains("live")) {
                const auto& l = document.at("live");
                config.live.base_url = l.value("base_url", config.live.base_url);
                config.live.access_token_env = l.value("access_token_env", config.live.access_token_env);
                config.live.poll_interval_ms = l.value("poll_interval_ms", config.live.poll_interval_ms);
                config.live.request_timeout_ms = l.value("request_timeout_ms", config.live.request_timeout_ms);
                config.live.order_timeout_ms = l.value("order_timeout_ms", config.live.order_timeout_ms);
                config.live.bootstrap_bars = l.value("bootstrap_bars", config.live.bootstrap_bars);
            }
            if (document.contains("database")) {
                config.database.path = document.at("database").value("path", config.database.path);
            }
            if (document.contains("logging")) {
                const auto& l = document.at("logging");
                config.logging.base_name = l.value("base_name", config.logging.base_name);
                config.logging.console_level = l.value("console_level", config.logging.console_level);
                config.logging.file_level = l.value("file_level", config.logging.file_level);
            }
        } catch (const json::exception& e) {
            throw ConfigException(fmt::format("Invalid configuration value: {}", e.what()));
        }

        validate(config);
        return config;
    }

    EngineConfig loadConfigFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json document;
        try {
            document = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        return fromJson(document);
    }

    void validate(const EngineConfig& config) {
        const auto& ind = config.indicators;
        requirePositive(ind.ma_short, "indicators.ma_short");
        requirePositive(ind.ma_long, "indicators.ma_long");
        if (ind.ma_short >= ind.ma_long) {
            throw ConfigException(fmt::format("Short MA period ({}) must be less than long MA period ({}).",
                                              ind.ma_short, ind.ma_long));
        }
        requirePositive(ind.rsi_period, "indicators.rsi_period");
        requirePositive(ind.macd.fast, "indicators.macd.fast");
        requirePositive(ind.macd.slow, "indicators.macd.slow");
        requirePositive(ind.macd.signal, "indicators.macd.signal");
        if (ind.macd.fast >= ind.macd.slow) {
            throw ConfigException(fmt::format("MACD fast period ({}) must be less than slow period ({}).",
                                              ind.macd.fast, ind.macd.slow));
        }
        requirePositive(ind.bollinger.period, "indicators.bollinger.period");
        if (ind.bollinger.stddev <= 0.0) {
            throw ConfigException("'indicators.bollinger.stddev' must be positive.");
        }
        requirePositive(ind.volume_ma, "indicators.volume_ma");
        requirePositive(ind.atr_period, "indicators.atr_period");
        requirePositive(ind.momentum_period, "indicators.momentum_period");
        if (ind.warmup_bars < 0) {
            throw ConfigException("'indicators.warmup_bars' cannot be negative.");
        }

        const auto& st = config.strategy;
        if (st.rsi_oversold >= st.rsi_overbought) {
            throw ConfigException(fmt::format("RSI oversold ({}) must be below overbought ({}).",
                                              st.rsi_oversold, st.rsi_overbought));
        }
        if (st.price_change_threshold <= 0.0 || st.volume_change_threshold < 0.0) {
            throw ConfigException("Momentum thresholds must be positive.");
        }

        const auto& r = config.risk;
        if (r.min_trade_amount < 0.0 || r.min_trade_amount > r.max_trade_amount) {
            throw ConfigException(fmt::format("Invalid trade amount range [{}, {}].",
                                              r.min_trade_amount, r.max_trade_amount));
        }
        if (r.trade_amount <= 0.0) throw ConfigException("'risk.trade_amount' must be positive.");
        requireFraction(r.position_ratio, "risk.position_ratio");
        requireFraction(r.kelly_fraction, "risk.kelly_fraction");
        requireFraction(r.risk_per_trade, "risk.risk_per_trade");
        requireFraction(r.stop_loss, "risk.stop_loss");
        requireFraction(r.max_drawdown, "risk.max_drawdown");
        requireFraction(r.max_daily_loss, "risk.max_daily_loss");
        requireFraction(r.max_single_position, "risk.max_single_position");
        if (r.take_profit <= 0.0) throw ConfigException("'risk.take_profit' must be positive.");
        if (r.trailing_stop < 0.0 || r.trailing_stop >= 1.0) {
            throw ConfigException("'risk.trailing_stop' must lie in [0, 1).");
        }
        if (r.atr_multiplier <= 0.0) throw ConfigException("'risk.atr_multiplier' must be positive.");
        requirePositive(r.max_daily_trades, "risk.max_daily_trades");
        requirePositive(r.kelly_lookback_trades, "risk.kelly_lookback_trades");
        if (r.kelly_min_trades < 0) throw ConfigException("'risk.kelly_min_trades' cannot be negative.");
        if (r.lot_size <= 0) {
            throw ConfigException("'risk.lot_size' must be positive.");
        }

        const auto& e = config.execution;
        if (e.commission_rate < 0.0 || e.min_commission < 0.0) {
            throw ConfigException("Commission parameters cannot be negative.");
        }
        if (e.max_volume_participation < 0.0 || e.max_volume_participation > 1.0) {
            throw ConfigException("'execution.max_volume_participation' must lie in [0, 1].");
        }

        if (config.backtest.initial_capital <= 0.0) {
            throw ConfigException("'backtest.initial_capital' must be positive.");
        }
        requirePositive(config.backtest.min_bars, "backtest.min_bars");
        requirePositive(config.backtest.periods_per_year, "backtest.periods_per_year");
        requirePositive(config.live.poll_interval_ms, "live.poll_interval_ms");
        requirePositive(config.live.request_timeout_ms, "live.request_timeout_ms");
        requirePositive(config.live.order_timeout_ms, "live.order_timeout_ms");

        // Throw ConfigException for unknown level names
        logging::levelFromString(config.logging.console_level);
        logging::levelFromString(config.logging.file_level);
    }

} // namespace config
} // namespace core
