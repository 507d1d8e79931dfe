/// @file config.cpp
/// @brief TreeConfig JSON loading

#include <cortex/ai/config.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace cortex_ai {

using cortex_core::Err;
using cortex_core::Error;
using cortex_core::ErrorCode;
using cortex_core::Ok;
using cortex_core::TreeError;

namespace {

/// Read an unsigned field, rejecting negative or non-integer values
Result<void> read_u32(const nlohmann::json& j, const char* key, std::uint32_t& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
        value.get<std::int64_t>() > static_cast<std::int64_t>(UINT32_MAX)) {
        return Err(Error(ErrorCode::ParseError,
            std::string("Tree config '") + key + "' must be a non-negative integer"));
    }
    out = value.get<std::uint32_t>();
    return Ok();
}

Result<void> read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_boolean()) {
        return Err(Error(ErrorCode::ParseError,
            std::string("Tree config '") + key + "' must be a boolean"));
    }
    out = j[key].get<bool>();
    return Ok();
}

} // anonymous namespace

// =============================================================================
// TreeConfig
// =============================================================================

Result<void> TreeConfig::validate() const {
    if (!(tick_rate_hz > 0.0f) || !std::isfinite(tick_rate_hz)) {
        return Err(Error(TreeError::invalid_config("tick_rate_hz must be positive")));
    }
    if (max_execution_time_ms == 0) {
        return Err(Error(TreeError::invalid_config("max_execution_time_ms must be positive")));
    }
    if (max_depth == 0) {
        return Err(Error(TreeError::invalid_config("max_depth must be positive")));
    }
    return Ok();
}

Result<TreeConfig> TreeConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<TreeConfig>(Error(ErrorCode::ParseError,
            std::string("Tree config JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<TreeConfig>(Error(ErrorCode::ParseError, "Tree config must be a JSON object"));
    }

    TreeConfig config;

    for (auto result : {
             read_u32(j, "max_execution_time_ms", config.max_execution_time_ms),
             read_u32(j, "max_depth", config.max_depth),
             read_bool(j, "enable_blackboard_sharing", config.enable_blackboard_sharing),
             read_bool(j, "enable_debugging", config.enable_debugging),
             read_u32(j, "memory_limit_mb", config.memory_limit_mb)}) {
        if (!result) {
            return Err<TreeConfig>(std::move(result.error()));
        }
    }

    if (j.contains("tick_rate_hz")) {
        if (!j["tick_rate_hz"].is_number()) {
            return Err<TreeConfig>(Error(ErrorCode::ParseError,
                "Tree config 'tick_rate_hz' must be a number"));
        }
        config.tick_rate_hz = j["tick_rate_hz"].get<float>();
    }

    auto valid = config.validate();
    if (!valid) {
        return Err<TreeConfig>(std::move(valid.error()));
    }

    return Ok(std::move(config));
}

Result<TreeConfig> TreeConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<TreeConfig>(Error(ErrorCode::IOError,
            "Failed to open tree config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

std::string TreeConfig::to_json_string() const {
    nlohmann::json j;
    j["max_execution_time_ms"] = max_execution_time_ms;
    j["max_depth"] = max_depth;
    j["enable_blackboard_sharing"] = enable_blackboard_sharing;
    j["enable_debugging"] = enable_debugging;
    j["tick_rate_hz"] = tick_rate_hz;
    j["memory_limit_mb"] = memory_limit_mb;
    return j.dump(2);
}

} // namespace cortex_ai
