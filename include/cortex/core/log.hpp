#pragma once

/// @file log.hpp
/// @brief Logging utilities for cortex

#include "fwd.hpp"
#include "error.hpp"

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

namespace cortex_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Parse from a JSON document; absent fields keep their defaults
    [[nodiscard]] static Result<LogConfig> from_json_string(const std::string& json_str);
};

/// Apply a configuration: rebuilds the sinks and level of every named logger
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the behavior tree scheduler logger
std::shared_ptr<spdlog::logger> tree_logger();

/// Get the event system logger
std::shared_ptr<spdlog::logger> event_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

} // namespace cortex_core
