// cli/src/main.cpp

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "csv_bar_reader.hpp"
#include "broker_client.hpp"
#include "backtester.hpp"
#include "live_trader.hpp"

namespace {

    volatile std::sig_atomic_t g_stop_signal = 0;

    void handleSignal(int signal) {
        g_stop_signal = signal;
    }

    void printUsage(const char* program) {
        std::cerr << "Usage:\n"
                  << "  " << program << " <config.json> backtest <start YYYY-MM-DD> <end YYYY-MM-DD> [capital]\n"
                  << "  " << program << " <config.json> live\n"
                  << "  " << program << " <config.json> import <bars.csv>\n";
    }

    int runBacktest(const core::EngineConfig& config, data::DatabaseManager& db_manager,
                    const std::vector<std::string>& args) {
        auto logger = core::logging::getLogger();
        if (args.size() < 2 || args.size() > 3) {
            throw core::ConfigException("backtest expects <start> <end> [capital]");
        }
        std::optional<double> capital;
        if (args.size() == 3) {
            try {
                capital = std::stod(args[2]);
            } catch (const std::logic_error&) {
                throw core::ConfigException("Invalid capital: " + args[2]);
            }
        }

        backtester::Backtester the_backtester(config, &db_manager);
        backtester::BacktestReport report = the_backtester.run(config.instrument, args[0], args[1], capital);

        for (const auto& trade : report.trades) {
            logger->info("Trade {} -> {}: qty {} entry {:.2f} exit {:.2f} pnl {:.2f} ({:.2f}%)",
                         core::utils::timestampToString(trade.entry_time, config.utc_offset_minutes),
                         core::utils::timestampToString(trade.exit_time, config.utc_offset_minutes),
                         trade.quantity, trade.entry_price, trade.exit_price, trade.pnl, trade.return_pct * 100.0);
        }

        if (report.status != backtester::RunStatus::Completed) {
            logger->error("---=== Backtest Run Failed: {} ===---", report.failure_reason);
            return 1;
        }
        logger->info("---=== Backtest Run Finished Successfully ===---");
        return 0;
    }

    int runLive(const core::EngineConfig& config, data::DatabaseManager& db_manager) {
        auto logger = core::logging::getLogger();
        data::BrokerClient client = data::BrokerClient::fromConfig(config.live);
        live::LiveTrader trader(config, client, &db_manager);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        // Signal handlers may only set a flag; the watcher turns it into a graceful stop
        std::atomic<bool> finished{false};
        std::thread watcher([&]() {
            while (!finished.load()) {
                if (g_stop_signal != 0) {
                    logger->warn("Received signal {}; stopping after the current bar.", static_cast<int>(g_stop_signal));
                    trader.stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });
        struct WatcherGuard {
            std::atomic<bool>& finished;
            std::thread& watcher;
            ~WatcherGuard() {
                finished.store(true);
                if (watcher.joinable()) watcher.join();
            }
        } guard{finished, watcher};

        const backtester::RunStatus status = trader.run();
        return status == backtester::RunStatus::Completed ? 0 : 1;
    }

    int runImport(const core::EngineConfig& config, data::DatabaseManager& db_manager,
                  const std::vector<std::string>& args) {
        auto logger = core::logging::getLogger();
        if (args.size() != 1) {
            throw core::ConfigException("import expects <bars.csv>");
        }
        auto bars = data::readBarsCsv(args[0], config.utc_offset_minutes);
        if (!db_manager.saveBars(bars, config.instrument, config.interval)) {
            logger->error("Failed to save imported bars.");
            return 1;
        }
        logger->info("Imported {} bars for {} ({}) into {}", bars.size(), config.instrument,
                     config.interval, config.database.path);
        return 0;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string config_path = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    try {
        core::EngineConfig config = core::config::loadConfigFile(config_path);

        // --- Initialize Logging ---
        core::logging::LogSettings log_settings;
        log_settings.base_name = config.logging.base_name;
        log_settings.console_level = core::logging::levelFromString(config.logging.console_level);
        log_settings.file_level = core::logging::levelFromString(config.logging.file_level);
        core::logging::initialize(log_settings);
        logger = core::logging::getLogger();
        logger->info("AutoTrader CLI starting: command '{}' with config {}", command, config_path);

        if (config.instrument.empty()) {
            throw core::ConfigException("Config must name an instrument.");
        }

        // --- Database Setup ---
        data::DatabaseManager db_manager(config.database.path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::StorageException("Cannot open database " + config.database.path);
        }

        int exit_code = 1;
        if (command == "backtest") {
            exit_code = runBacktest(config, db_manager, args);
        } else if (command == "live") {
            exit_code = runLive(config, db_manager);
        } else if (command == "import") {
            exit_code = runImport(config, db_manager, args);
        } else {
            printUsage(argv[0]);
            logger->error("Unknown command '{}'", command);
        }

        db_manager.disconnect();
        logger->info("AutoTrader CLI finished with exit code {}.", exit_code);
        core::logging::shutdown();
        return exit_code;

    // --- Exception Handling ---
    } catch (const core::AutoTraderException& ex) {
        std::cerr << "AutoTrader Error: " << ex.what() << std::endl;
        if (logger) logger->critical("AutoTrader Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
