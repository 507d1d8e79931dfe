#pragma once

/// @file value.hpp
/// @brief Dynamic runtime value shared by blackboards and events

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cortex_core {

// =============================================================================
// Vec3
// =============================================================================

/// 3D vector payload
struct Vec3 {
    float x = 0.0f, y = 0.0f, z = 0.0f;

    constexpr Vec3() noexcept = default;
    constexpr Vec3(float x_, float y_, float z_) noexcept : x(x_), y(y_), z(z_) {}

    constexpr bool operator==(const Vec3& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
};

// =============================================================================
// ValueType
// =============================================================================

/// Value type discriminator (matches variant index order)
enum class ValueType : std::uint8_t {
    None = 0,
    Bool,
    Int,
    Float,
    String,
    Vector3,
    Array,
    Object
};

/// Get string name for value type
[[nodiscard]] inline const char* value_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::None: return "None";
        case ValueType::Bool: return "Bool";
        case ValueType::Int: return "Int";
        case ValueType::Float: return "Float";
        case ValueType::String: return "String";
        case ValueType::Vector3: return "Vector3";
        case ValueType::Array: return "Array";
        case ValueType::Object: return "Object";
        default: return "Unknown";
    }
}

// =============================================================================
// RuntimeValue
// =============================================================================

class RuntimeValue;

/// Array of values
using ValueArray = std::vector<RuntimeValue>;

/// Object (ordered key-value map)
using ValueObject = std::map<std::string, RuntimeValue>;

/// Tagged value exchanged between blackboards, events and node parameters.
/// The as_* conversions are total: every variant has a defined fallback.
class RuntimeValue {
public:
    using Variant = std::variant<
        std::monostate,      // None
        bool,                // Bool
        std::int32_t,        // Int
        float,               // Float
        std::string,         // String
        Vec3,                // Vector3
        ValueArray,          // Array
        ValueObject          // Object
    >;

    /// Default constructor creates None
    RuntimeValue() : m_data(std::monostate{}) {}

    RuntimeValue(bool v) : m_data(v) {}
    RuntimeValue(std::int32_t v) : m_data(v) {}
    RuntimeValue(float v) : m_data(v) {}
    RuntimeValue(double v) : m_data(static_cast<float>(v)) {}
    RuntimeValue(const char* v) : m_data(std::string(v)) {}
    RuntimeValue(std::string v) : m_data(std::move(v)) {}
    RuntimeValue(std::string_view v) : m_data(std::string(v)) {}
    RuntimeValue(Vec3 v) : m_data(v) {}
    RuntimeValue(ValueArray v) : m_data(std::move(v)) {}
    RuntimeValue(ValueObject v) : m_data(std::move(v)) {}

    // -------------------------------------------------------------------------
    // Factory methods
    // -------------------------------------------------------------------------

    [[nodiscard]] static RuntimeValue none() { return RuntimeValue{}; }

    [[nodiscard]] static RuntimeValue vec3(float x, float y, float z) {
        return RuntimeValue(Vec3{x, y, z});
    }

    [[nodiscard]] static RuntimeValue array(std::initializer_list<RuntimeValue> values) {
        return RuntimeValue(ValueArray(values));
    }

    [[nodiscard]] static RuntimeValue empty_object() {
        return RuntimeValue(ValueObject{});
    }

    // -------------------------------------------------------------------------
    // Type checking
    // -------------------------------------------------------------------------

    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(m_data.index());
    }

    [[nodiscard]] const char* type_name() const noexcept {
        return value_type_name(type());
    }

    [[nodiscard]] bool is_none() const noexcept { return std::holds_alternative<std::monostate>(m_data); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(m_data); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<std::int32_t>(m_data); }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<float>(m_data); }
    [[nodiscard]] bool is_numeric() const noexcept { return is_int() || is_float(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(m_data); }
    [[nodiscard]] bool is_vec3() const noexcept { return std::holds_alternative<Vec3>(m_data); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<ValueArray>(m_data); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<ValueObject>(m_data); }

    // -------------------------------------------------------------------------
    // Optional accessors (nullopt / nullptr on type mismatch)
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<bool> try_bool() const noexcept {
        if (auto* p = std::get_if<bool>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::int32_t> try_int() const noexcept {
        if (auto* p = std::get_if<std::int32_t>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<float> try_float() const noexcept {
        if (auto* p = std::get_if<float>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] const std::string* try_string() const noexcept {
        return std::get_if<std::string>(&m_data);
    }

    [[nodiscard]] const Vec3* try_vec3() const noexcept {
        return std::get_if<Vec3>(&m_data);
    }

    [[nodiscard]] const ValueArray* try_array() const noexcept {
        return std::get_if<ValueArray>(&m_data);
    }

    [[nodiscard]] const ValueObject* try_object() const noexcept {
        return std::get_if<ValueObject>(&m_data);
    }

    // -------------------------------------------------------------------------
    // Total conversions
    // -------------------------------------------------------------------------

    /// Truthiness: non-zero numbers, non-empty strings and containers,
    /// any vector; None is false
    [[nodiscard]] bool as_bool() const noexcept;

    /// Int, truncated Float, Bool as 1/0; anything else is 0
    [[nodiscard]] std::int32_t as_int() const noexcept;

    /// Float, Int, Bool as 1/0; anything else is 0
    [[nodiscard]] float as_float() const noexcept;

    /// Human readable rendering; containers render as placeholders
    [[nodiscard]] std::string as_string() const;

    // -------------------------------------------------------------------------
    // Object helpers
    // -------------------------------------------------------------------------

    /// Element count for arrays and objects, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* arr = std::get_if<ValueArray>(&m_data)) return arr->size();
        if (auto* obj = std::get_if<ValueObject>(&m_data)) return obj->size();
        return 0;
    }

    /// Member lookup on objects (nullptr if absent or not an object)
    [[nodiscard]] const RuntimeValue* get(const std::string& key) const {
        if (auto* obj = std::get_if<ValueObject>(&m_data)) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    bool operator==(const RuntimeValue& other) const {
        return m_data == other.m_data;
    }

    bool operator!=(const RuntimeValue& other) const {
        return m_data != other.m_data;
    }

private:
    Variant m_data;
};

/// Equality used by event conditions: same variant required, floats and
/// vector components compared within float epsilon, containers never match
[[nodiscard]] bool loosely_equals(const RuntimeValue& a, const RuntimeValue& b) noexcept;

} // namespace cortex_core
