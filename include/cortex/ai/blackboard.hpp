/// @file blackboard.hpp
/// @brief Per-entity key/value store with a shared namespace

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cortex/core/value.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cortex_ai {

using cortex_core::RuntimeValue;

/// @brief Key/value storage used for both the private and shared namespaces
using ValueMap = std::unordered_map<std::string, RuntimeValue>;

/// @brief Shared namespace handle; several blackboards may point at one store
using SharedStorePtr = std::shared_ptr<ValueMap>;

// =============================================================================
// Blackboard Key
// =============================================================================

/// @brief Typed blackboard key for compile-time type safety
template<typename T>
struct BlackboardKey {
    std::string name;

    explicit BlackboardKey(std::string_view n) : name(n) {}
    BlackboardKey(const char* n) : name(n) {}
};

// =============================================================================
// Blackboard
// =============================================================================

/// @brief Scratch memory for one entity's behavior tree
///
/// Lookups consult the private namespace first and fall back to the shared
/// one. Writes through set() always land in the private namespace. The shared
/// namespace is owned by the blackboard until a system wires it to a
/// process-wide store with set_shared_store().
class Blackboard {
public:
    Blackboard();
    explicit Blackboard(std::string entity_id);

    // Identity
    const std::string& entity_id() const { return m_entity_id; }
    void set_entity_id(std::string entity_id) { m_entity_id = std::move(entity_id); }

    // Private namespace
    void set(std::string_view key, RuntimeValue value);
    bool remove(std::string_view key);
    void clear();

    /// @brief Look up private then shared (nullptr if absent in both)
    const RuntimeValue* get(std::string_view key) const;

    /// @brief Copying variant of get()
    std::optional<RuntimeValue> get_value(std::string_view key) const;

    bool has_key(std::string_view key) const;
    bool contains_private(std::string_view key) const;

    // Shared namespace
    void set_shared(std::string_view key, RuntimeValue value);
    const RuntimeValue* get_shared(std::string_view key) const;
    bool shared_contains(std::string_view key) const;
    bool remove_shared(std::string_view key);

    void set_shared_store(SharedStorePtr store);
    const SharedStorePtr& shared_store() const { return m_shared; }

    /// @brief Sorted, de-duplicated union of private and shared keys
    std::vector<std::string> keys() const;

    std::size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }

    // Convenience setters
    void set_bool(std::string_view key, bool value) { set(key, RuntimeValue(value)); }
    void set_int(std::string_view key, std::int32_t value) { set(key, RuntimeValue(value)); }
    void set_float(std::string_view key, float value) { set(key, RuntimeValue(value)); }
    void set_string(std::string_view key, std::string_view value) { set(key, RuntimeValue(value)); }
    void set_vec3(std::string_view key, const cortex_core::Vec3& value) { set(key, RuntimeValue(value)); }

    // Convenience getters (default when absent or of another type)
    bool get_bool(std::string_view key, bool default_value = false) const;
    std::int32_t get_int(std::string_view key, std::int32_t default_value = 0) const;
    float get_float(std::string_view key, float default_value = 0) const;
    std::string get_string(std::string_view key, std::string_view default_value = "") const;
    cortex_core::Vec3 get_vec3(std::string_view key, const cortex_core::Vec3& default_value = {}) const;

    // Typed key access
    template<typename T>
    void set(const BlackboardKey<T>& key, const T& value) {
        set(key.name, RuntimeValue(value));
    }

    template<typename T>
    T get_or_default(const BlackboardKey<T>& key, const T& default_value = T{}) const;

    template<typename T>
    bool has(const BlackboardKey<T>& key) const { return has_key(key.name); }

private:
    std::string m_entity_id;
    ValueMap m_data;
    SharedStorePtr m_shared;
};

// =============================================================================
// Template Implementations
// =============================================================================

template<typename T>
T Blackboard::get_or_default(const BlackboardKey<T>& key, const T& default_value) const {
    if constexpr (std::is_same_v<T, bool>) {
        return get_bool(key.name, default_value);
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return get_int(key.name, default_value);
    } else if constexpr (std::is_same_v<T, float>) {
        return get_float(key.name, default_value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return get_string(key.name, default_value);
    } else if constexpr (std::is_same_v<T, cortex_core::Vec3>) {
        return get_vec3(key.name, default_value);
    } else {
        static_assert(std::is_same_v<T, RuntimeValue>, "Unsupported blackboard key type");
        auto* value = get(key.name);
        return value ? *value : default_value;
    }
}

} // namespace cortex_ai
