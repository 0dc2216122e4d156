#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace core {

    using json = nlohmann::json;

    struct MacdParams {
        int fast = 12;
        int slow = 26;
        int signal = 9;
    };

    struct BollingerParams {
        int period = 20;
        double stddev = 2.0;
    };

    struct IndicatorConfig {
        int ma_short = 5;
        int ma_long = 20;
        int rsi_period = 14;
        MacdParams macd;
        BollingerParams bollinger;
        int volume_ma = 20;
        int atr_period = 14;
        int momentum_period = 10;
        int warmup_bars = 0; // Extra trailing bars kept beyond the maximum lookback
    };

    enum class StrategyType {
        Technical,
        Momentum
    };

    struct StrategyConfig {
        StrategyType type = StrategyType::Technical;
        std::string name = "technical";
        double rsi_overbought = 70.0;
        double rsi_oversold = 30.0;
        json rules = json::array();  // Empty -> built-in rule set
        double price_change_threshold = 0.01;
        double volume_change_threshold = 0.5;
    };

    enum class SizingMethod {
        FixedAmount,
        FixedFraction,
        Kelly,
        Atr
    };

    struct RiskConfig {
        SizingMethod sizing_method = SizingMethod::FixedFraction;
        double trade_amount = 20000.0;      // Fixed amount sizing
        double position_ratio = 0.3;        // Fixed fraction sizing
        bool scale_by_strength = true;
        double kelly_fraction = 0.5;
        int kelly_min_trades = 10;
        int kelly_lookback_trades = 20;
        double risk_per_trade = 0.01;       // ATR sizing
        double atr_multiplier = 2.0;
        double min_trade_amount = 5000.0;
        double max_trade_amount = 50000.0;
        double stop_loss = 0.05;
        double take_profit = 0.10;
        double trailing_stop = 0.0;         // 0 disables the trailing stop
        double max_drawdown = 0.10;
        double max_daily_loss = 0.05;
        int max_daily_trades = 10;
        double max_single_position = 0.5;
        long long lot_size = 100;
        bool scale_out_by_strength = false;
    };

    enum class FillPriceMode {
        Close,      // Fill at the close of the decision bar
        NextOpen    // Fill at the open of the following bar
    };

    struct ExecutionConfig {
        FillPriceMode fill_price = FillPriceMode::Close;
        double commission_rate = 0.0003;
        double min_commission = 0.0;
        double max_volume_participation = 0.0; // 0 -> always fully filled
    };

    struct BacktestConfig {
        double initial_capital = 100000.0;
        int min_bars = 20;
        double risk_free_rate = 0.03;
        int periods_per_year = 252;
        bool persist_audit = false;
    };

    struct LiveConfig {
        std::string base_url = "http://127.0.0.1:8080";
        std::string access_token_env = "AUTOTRADER_ACCESS_TOKEN";
        int poll_interval_ms = 60000;
        int request_timeout_ms = 15000;
        int order_timeout_ms = 30000;
        int bootstrap_bars = 60;
    };

    struct DatabaseConfig {
        std::string path = "autotrader.db";
    };

    struct LoggingConfig {
        std::string base_name = "autotrader";
        std::string console_level = "info";
        std::string file_level = "debug";
    };

    // Built once at start-up and passed by const reference to every component
    struct EngineConfig {
        std::string instrument;
        std::string interval = "day";
        int utc_offset_minutes = utils::kDefaultUtcOffsetMinutes;
        IndicatorConfig indicators;
        StrategyConfig strategy;
        RiskConfig risk;
        ExecutionConfig execution;
        BacktestConfig backtest;
        LiveConfig live;
        DatabaseConfig database;
        LoggingConfig logging;
    };

namespace config {

    // Build and validate a configuration; missing keys keep their defaults.
    // Throws ConfigException on malformed values or invalid combinations.
    EngineConfig fromJson(const json& document);

    EngineConfig loadConfigFile(const std::string& path);

    // Throws ConfigException describing the first violated constraint
    void validate(const EngineConfig& config);

    std::string toString(SizingMethod method);

} // namespace config
} // namespace core
