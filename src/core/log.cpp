/// @file log.cpp
/// @brief Logging system implementation for cortex_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers per subsystem sharing one sink configuration
/// - JSON-driven configuration

#include <cortex/core/log.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <mutex>
#include <map>
#include <vector>

namespace cortex_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration
std::vector<spdlog::sink_ptr> create_sinks(const std::string& name) {
    auto& reg = get_registry();
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.file_enabled && !reg.log_directory.empty()) {
        try {
            std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Could not open log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

Result<LogConfig> LogConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<LogConfig>(Error(ErrorCode::ParseError,
            std::string("Log config JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<LogConfig>(Error(ErrorCode::ParseError, "Log config must be a JSON object"));
    }

    LogConfig config;

    if (j.contains("console") && j["console"].is_boolean()) {
        config.console_enabled = j["console"].get<bool>();
    }
    if (j.contains("file") && j["file"].is_boolean()) {
        config.file_enabled = j["file"].get<bool>();
    }
    if (j.contains("directory") && j["directory"].is_string()) {
        config.log_directory = j["directory"].get<std::string>();
    }
    if (j.contains("max_file_size") && j["max_file_size"].is_number_unsigned()) {
        config.max_file_size = j["max_file_size"].get<std::size_t>();
    }
    if (j.contains("max_files") && j["max_files"].is_number_unsigned()) {
        config.max_files = j["max_files"].get<std::size_t>();
    }
    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Err<LogConfig>(Error(ErrorCode::ParseError, "Log config 'level' must be a string"));
        }
        auto level_str = j["level"].get<std::string>();
        auto level = parse_log_level(level_str);
        if (!level) {
            return Err<LogConfig>(Error(ErrorCode::ValidationError, "Unknown log level: " + level_str));
        }
        config.level = *level;
    }

    if (config.file_enabled && config.log_directory.empty()) {
        return Err<LogConfig>(Error(ErrorCode::ValidationError,
            "File logging enabled without a log directory"));
    }

    return Ok(std::move(config));
}

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Rebuild sinks of existing loggers so the new outputs take effect
    for (auto& [name, logger] : reg.loggers) {
        auto sinks = create_sinks(name);
        logger->sinks() = std::move(sinks);
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = create_sinks(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

std::shared_ptr<spdlog::logger> tree_logger() {
    return get_logger("behavior_tree");
}

std::shared_ptr<spdlog::logger> event_logger() {
    return get_logger("event_system");
}

// =============================================================================
// Log Level Management
// =============================================================================

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Flushing
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

} // namespace cortex_core
