#pragma once

/// @file value_json.hpp
/// @brief JSON bridging for RuntimeValue (nlohmann_json)

#include "value.hpp"

#include <nlohmann/json.hpp>

namespace cortex_core {

/// Serialize a value. Vectors are encoded as {"vec3": [x, y, z]}.
[[nodiscard]] nlohmann::json to_json(const RuntimeValue& value);

/// Serialize a string-keyed payload as a JSON object
[[nodiscard]] nlohmann::json to_json(const ValueObject& object);

/// Inverse of to_json. Integers outside int32 range become Float.
[[nodiscard]] RuntimeValue value_from_json(const nlohmann::json& j);

} // namespace cortex_core
