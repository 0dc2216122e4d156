#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace core {
namespace logging {

    namespace {
        std::shared_ptr<spdlog::logger> g_logger;
        constexpr const char* kLoggerName = "AutoTraderLogger";
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

        // Falls back to the working directory when `directory` cannot be created
        std::string ensureDirectory(const std::string& directory) {
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create log directory '" << directory << "': "
                          << ec.message() << ". Using the working directory." << std::endl;
                return ".";
            }
            return directory;
        }

        // <dir>/<base>_YYYYMMDD_HHMMSSZ.log
        std::string logFilePath(const std::string& directory, const std::string& base_name) {
            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            gmtime_r(&now, &utc_tm);
            std::ostringstream name;
            name << directory << "/" << base_name << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return name.str();
        }
    } // namespace

    spdlog::level::level_enum levelFromString(const std::string& level) {
        std::string name = level;
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        if (name == "trace") return spdlog::level::trace;
        if (name == "debug") return spdlog::level::debug;
        if (name == "info") return spdlog::level::info;
        if (name == "warn" || name == "warning") return spdlog::level::warn;
        if (name == "error" || name == "err") return spdlog::level::err;
        if (name == "critical" || name == "crit") return spdlog::level::critical;
        if (name == "off") return spdlog::level::off;
        throw ConfigException("Unknown log level: '" + level + "'");
    }

    void initialize(const LogSettings& settings) {
        auto console_level = settings.console_level;
        auto file_level = settings.file_level;

        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            try {
                console_level = file_level = levelFromString(env_level);
            } catch (const ConfigException& e) {
                std::cerr << "[Logging] Ignoring SPDLOG_LEVEL: " << e.what() << std::endl;
            }
        }

        const std::string file_path = logFilePath(ensureDirectory(settings.directory), settings.base_name);
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, settings.max_file_bytes, settings.max_files, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kPattern);

            spdlog::drop(kLoggerName);
            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
            g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            g_logger->set_level(std::min(console_level, file_level));
            spdlog::register_logger(g_logger);
            spdlog::set_default_logger(g_logger);
            spdlog::flush_on(spdlog::level::warn);
        } catch (const spdlog::spdlog_ex& ex) {
            throw ConfigException(std::string("Log initialization failed: ") + ex.what());
        }

        g_logger->info("Logging to console ({}) and {} ({})",
                       spdlog::level::to_string_view(console_level), file_path,
                       spdlog::level::to_string_view(file_level));
    }

    bool isInitialized() {
        return static_cast<bool>(g_logger);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!g_logger) {
            throw std::runtime_error("Logger accessed before core::logging::initialize().");
        }
        return g_logger;
    }

    void shutdown() {
        if (g_logger) {
            g_logger->flush();
        }
        spdlog::shutdown();
        g_logger.reset();
    }

} // namespace logging
} // namespace core
