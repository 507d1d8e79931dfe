/// @file value.cpp
/// @brief RuntimeValue conversions and JSON bridging

#include <cortex/core/value.hpp>
#include <cortex/core/value_json.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <cstdint>
#include <limits>

namespace cortex_core {

// =============================================================================
// Conversions
// =============================================================================

bool RuntimeValue::as_bool() const noexcept {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return false;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            return v != 0;
        } else if constexpr (std::is_same_v<T, float>) {
            return v != 0.0f;
        } else if constexpr (std::is_same_v<T, Vec3>) {
            return true;
        } else {
            return !v.empty();
        }
    }, m_data);
}

std::int32_t RuntimeValue::as_int() const noexcept {
    if (auto* i = std::get_if<std::int32_t>(&m_data)) return *i;
    if (auto* f = std::get_if<float>(&m_data)) {
        if (std::isnan(*f)) return 0;
        if (*f >= static_cast<float>(std::numeric_limits<std::int32_t>::max())) {
            return std::numeric_limits<std::int32_t>::max();
        }
        if (*f <= static_cast<float>(std::numeric_limits<std::int32_t>::min())) {
            return std::numeric_limits<std::int32_t>::min();
        }
        return static_cast<std::int32_t>(*f);
    }
    if (auto* b = std::get_if<bool>(&m_data)) return *b ? 1 : 0;
    return 0;
}

float RuntimeValue::as_float() const noexcept {
    if (auto* f = std::get_if<float>(&m_data)) return *f;
    if (auto* i = std::get_if<std::int32_t>(&m_data)) return static_cast<float>(*i);
    if (auto* b = std::get_if<bool>(&m_data)) return *b ? 1.0f : 0.0f;
    return 0.0f;
}

std::string RuntimeValue::as_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "None";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, float>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, Vec3>) {
            return fmt::format("({}, {}, {})", v.x, v.y, v.z);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return "[Array]";
        } else {
            return "[Object]";
        }
    }, m_data);
}

// =============================================================================
// Loose Equality
// =============================================================================

namespace {

bool float_eq(float a, float b) noexcept {
    return std::fabs(a - b) < std::numeric_limits<float>::epsilon();
}

} // anonymous namespace

bool loosely_equals(const RuntimeValue& a, const RuntimeValue& b) noexcept {
    if (a.type() != b.type()) {
        return false;
    }

    switch (a.type()) {
        case ValueType::None:
            return true;
        case ValueType::Bool:
            return *a.try_bool() == *b.try_bool();
        case ValueType::Int:
            return *a.try_int() == *b.try_int();
        case ValueType::Float:
            return float_eq(*a.try_float(), *b.try_float());
        case ValueType::String:
            return *a.try_string() == *b.try_string();
        case ValueType::Vector3: {
            const Vec3& va = *a.try_vec3();
            const Vec3& vb = *b.try_vec3();
            return float_eq(va.x, vb.x) && float_eq(va.y, vb.y) && float_eq(va.z, vb.z);
        }
        case ValueType::Array:
        case ValueType::Object:
        default:
            return false;
    }
}

// =============================================================================
// JSON
// =============================================================================

nlohmann::json to_json(const RuntimeValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Vec3>) {
            return nlohmann::json{{"vec3", {v.x, v.y, v.z}}};
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : v) {
                arr.push_back(to_json(item));
            }
            return arr;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, item] : v) {
                obj[key] = to_json(item);
            }
            return obj;
        } else {
            return v;
        }
    }, value.variant());
}

nlohmann::json to_json(const ValueObject& object) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [key, item] : object) {
        obj[key] = to_json(item);
    }
    return obj;
}

namespace {

bool is_vec3_object(const nlohmann::json& j) {
    if (j.size() != 1 || !j.contains("vec3")) return false;
    const auto& arr = j["vec3"];
    if (!arr.is_array() || arr.size() != 3) return false;
    for (const auto& c : arr) {
        if (!c.is_number()) return false;
    }
    return true;
}

} // anonymous namespace

RuntimeValue value_from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::boolean:
            return RuntimeValue(j.get<bool>());
        case nlohmann::json::value_t::number_unsigned: {
            auto wide = j.get<std::uint64_t>();
            if (wide > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
                return RuntimeValue(static_cast<float>(wide));
            }
            return RuntimeValue(static_cast<std::int32_t>(wide));
        }
        case nlohmann::json::value_t::number_integer: {
            auto wide = j.get<std::int64_t>();
            if (wide > std::numeric_limits<std::int32_t>::max() ||
                wide < std::numeric_limits<std::int32_t>::min()) {
                return RuntimeValue(static_cast<float>(wide));
            }
            return RuntimeValue(static_cast<std::int32_t>(wide));
        }
        case nlohmann::json::value_t::number_float:
            return RuntimeValue(j.get<float>());
        case nlohmann::json::value_t::string:
            return RuntimeValue(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            ValueArray arr;
            arr.reserve(j.size());
            for (const auto& item : j) {
                arr.push_back(value_from_json(item));
            }
            return RuntimeValue(std::move(arr));
        }
        case nlohmann::json::value_t::object: {
            if (is_vec3_object(j)) {
                const auto& c = j["vec3"];
                return RuntimeValue::vec3(c[0].get<float>(), c[1].get<float>(), c[2].get<float>());
            }
            ValueObject obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj.emplace(it.key(), value_from_json(it.value()));
            }
            return RuntimeValue(std::move(obj));
        }
        default:
            return RuntimeValue{};
    }
}

} // namespace cortex_core
