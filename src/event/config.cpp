/// @file config.cpp
/// @brief EventSystemConfig JSON loading

#include <cortex/event/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace cortex_event {

using cortex_core::Err;
using cortex_core::Error;
using cortex_core::ErrorCode;
using cortex_core::Ok;

namespace {

Error config_error(const std::string& message) {
    return Error(ErrorCode::ParseError, "Event config " + message);
}

template<typename T>
Result<void> read_unsigned(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<std::int64_t>() >= 0)) {
        return Err(config_error(std::string("'") + key + "' must be a non-negative integer"));
    }
    out = value.get<T>();
    return Ok();
}

Result<void> read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_boolean()) {
        return Err(config_error(std::string("'") + key + "' must be a boolean"));
    }
    out = j[key].get<bool>();
    return Ok();
}

} // anonymous namespace

Result<void> EventSystemConfig::validate() const {
    if (bus_capacity == 0) {
        return Err(Error(ErrorCode::ValidationError, "bus_capacity must be positive"));
    }
    if (max_processing_time_ms == 0) {
        return Err(Error(ErrorCode::ValidationError, "max_processing_time_ms must be positive"));
    }
    if (stats_interval_ms == 0) {
        return Err(Error(ErrorCode::ValidationError, "stats_interval_ms must be positive"));
    }
    return Ok();
}

Result<EventSystemConfig> EventSystemConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<EventSystemConfig>(config_error(std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<EventSystemConfig>(config_error("must be a JSON object"));
    }

    EventSystemConfig config;

    for (auto result : {
             read_unsigned(j, "bus_capacity", config.bus_capacity),
             read_unsigned(j, "max_processing_time_ms", config.max_processing_time_ms),
             read_bool(j, "isolate_action_errors", config.isolate_action_errors),
             read_bool(j, "register_builtin_hooks", config.register_builtin_hooks),
             read_unsigned(j, "stats_interval_ms", config.stats_interval_ms)}) {
        if (!result) {
            return Err<EventSystemConfig>(std::move(result.error()));
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return Err<EventSystemConfig>(std::move(valid.error()));
    }
    return Ok(std::move(config));
}

Result<EventSystemConfig> EventSystemConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<EventSystemConfig>(Error(ErrorCode::IOError,
            "Failed to open event config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

std::string EventSystemConfig::to_json_string() const {
    nlohmann::json j;
    j["bus_capacity"] = bus_capacity;
    j["max_processing_time_ms"] = max_processing_time_ms;
    j["isolate_action_errors"] = isolate_action_errors;
    j["register_builtin_hooks"] = register_builtin_hooks;
    j["stats_interval_ms"] = stats_interval_ms;
    return j.dump(2);
}

} // namespace cortex_event
