#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

#include "config.hpp"

namespace core {
namespace logging {

    // Call this once at the beginning of the application (e.g., in main()).
    // An empty log_dir disables the rotating file sink.
    void initialize(const std::string& base_log_filename = "matchedge",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug,
                    const std::string& log_dir = "logs");

    // Same, with names and levels taken from the engine config's logging section
    void initialize(const LoggingConfig& config);

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    bool isInitialized();

    // Helper function to set log level from string (env vars, config file)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
