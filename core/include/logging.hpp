#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <cstddef>
#include <memory>
#include <string>

namespace core {
namespace logging {

    struct LogSettings {
        std::string base_name = "autotrader";     // File name prefix
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        std::string directory = "logs";
        std::size_t max_file_bytes = 10 * 1024 * 1024;
        std::size_t max_files = 5;
    };

    // Builds the process-wide logger (colour console + rotating file). Call once per executable
    // before any component is constructed; calling again replaces the logger.
    // SPDLOG_LEVEL in the environment overrides both sink levels.
    void initialize(const LogSettings& settings);

    bool isInitialized();

    // Throws std::runtime_error before initialize()
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace" .. "critical", "off"; case-insensitive. Throws core::ConfigException otherwise.
    spdlog::level::level_enum levelFromString(const std::string& level);

    void shutdown();

} // namespace logging
} // namespace core
