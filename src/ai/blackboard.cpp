/// @file blackboard.cpp
/// @brief Blackboard implementation for cortex_ai module

#include <cortex/ai/blackboard.hpp>

#include <algorithm>

namespace cortex_ai {

// =============================================================================
// Blackboard Implementation
// =============================================================================

Blackboard::Blackboard()
    : Blackboard("default") {
}

Blackboard::Blackboard(std::string entity_id)
    : m_entity_id(std::move(entity_id))
    , m_shared(std::make_shared<ValueMap>()) {
}

void Blackboard::set(std::string_view key, RuntimeValue value) {
    m_data[std::string(key)] = std::move(value);
}

bool Blackboard::remove(std::string_view key) {
    return m_data.erase(std::string(key)) > 0;
}

void Blackboard::clear() {
    m_data.clear();
}

const RuntimeValue* Blackboard::get(std::string_view key) const {
    std::string key_str(key);
    auto it = m_data.find(key_str);
    if (it != m_data.end()) {
        return &it->second;
    }

    auto shared_it = m_shared->find(key_str);
    if (shared_it != m_shared->end()) {
        return &shared_it->second;
    }

    return nullptr;
}

std::optional<RuntimeValue> Blackboard::get_value(std::string_view key) const {
    if (auto* value = get(key)) {
        return *value;
    }
    return std::nullopt;
}

bool Blackboard::has_key(std::string_view key) const {
    return get(key) != nullptr;
}

bool Blackboard::contains_private(std::string_view key) const {
    return m_data.find(std::string(key)) != m_data.end();
}

// =============================================================================
// Shared Namespace
// =============================================================================

void Blackboard::set_shared(std::string_view key, RuntimeValue value) {
    (*m_shared)[std::string(key)] = std::move(value);
}

const RuntimeValue* Blackboard::get_shared(std::string_view key) const {
    auto it = m_shared->find(std::string(key));
    return it != m_shared->end() ? &it->second : nullptr;
}

bool Blackboard::shared_contains(std::string_view key) const {
    return get_shared(key) != nullptr;
}

bool Blackboard::remove_shared(std::string_view key) {
    return m_shared->erase(std::string(key)) > 0;
}

void Blackboard::set_shared_store(SharedStorePtr store) {
    m_shared = store ? std::move(store) : std::make_shared<ValueMap>();
}

std::vector<std::string> Blackboard::keys() const {
    std::vector<std::string> result;
    result.reserve(m_data.size() + m_shared->size());

    for (const auto& [key, value] : m_data) {
        result.push_back(key);
    }
    for (const auto& [key, value] : *m_shared) {
        result.push_back(key);
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

// =============================================================================
// Typed Getters
// =============================================================================

bool Blackboard::get_bool(std::string_view key, bool default_value) const {
    if (auto* value = get(key)) {
        if (auto b = value->try_bool()) {
            return *b;
        }
    }
    return default_value;
}

std::int32_t Blackboard::get_int(std::string_view key, std::int32_t default_value) const {
    if (auto* value = get(key)) {
        if (auto i = value->try_int()) {
            return *i;
        }
    }
    return default_value;
}

float Blackboard::get_float(std::string_view key, float default_value) const {
    if (auto* value = get(key)) {
        if (value->is_numeric()) {
            return value->as_float();
        }
    }
    return default_value;
}

std::string Blackboard::get_string(std::string_view key, std::string_view default_value) const {
    if (auto* value = get(key)) {
        if (auto* s = value->try_string()) {
            return *s;
        }
    }
    return std::string(default_value);
}

cortex_core::Vec3 Blackboard::get_vec3(std::string_view key, const cortex_core::Vec3& default_value) const {
    if (auto* value = get(key)) {
        if (auto* v = value->try_vec3()) {
            return *v;
        }
    }
    return default_value;
}

} // namespace cortex_ai
