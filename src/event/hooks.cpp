/// @file hooks.cpp
/// @brief HookRegistry implementation

#include <cortex/event/hooks.hpp>

namespace cortex_event {

using cortex_core::Err;
using cortex_core::EventError;
using cortex_core::Ok;

// =============================================================================
// Registration
// =============================================================================

Result<void> HookRegistry::register_condition(const std::string& name, CustomCondition condition) {
    if (name.empty()) {
        return Err(EventError::invalid_hook(name, "empty name"));
    }
    if (!condition) {
        return Err(EventError::invalid_hook(name, "condition is empty"));
    }
    m_conditions.insert_or_assign(name, std::move(condition));
    return Ok();
}

Result<void> HookRegistry::register_action(const std::string& name, CustomAction action) {
    if (name.empty()) {
        return Err(EventError::invalid_hook(name, "empty name"));
    }
    if (!action) {
        return Err(EventError::invalid_hook(name, "action is empty"));
    }
    m_actions.insert_or_assign(name, std::move(action));
    return Ok();
}

Result<void> HookRegistry::register_function(const std::string& name, CustomFunction function) {
    if (name.empty()) {
        return Err(EventError::invalid_hook(name, "empty name"));
    }
    if (!function) {
        return Err(EventError::invalid_hook(name, "function is empty"));
    }
    m_functions.insert_or_assign(name, std::move(function));
    return Ok();
}

// =============================================================================
// Dispatch
// =============================================================================

std::optional<bool> HookRegistry::evaluate_condition(const std::string& name, const Event& event) {
    auto it = m_conditions.find(name);
    if (it == m_conditions.end()) {
        return std::nullopt;
    }
    ++m_conditions_evaluated;
    return it->second(event);
}

Result<void> HookRegistry::execute_action(const std::string& name, const Event& event, EventContext& context) {
    auto it = m_actions.find(name);
    if (it == m_actions.end()) {
        return Err(EventError::custom_action_not_found(name));
    }
    ++m_actions_executed;
    return it->second(event, context);
}

Result<bool> HookRegistry::call_function(const std::string& name, const cortex_core::ValueArray& args,
                                         EventContext& context) {
    auto it = m_functions.find(name);
    if (it == m_functions.end()) {
        return Ok(false);
    }
    ++m_functions_called;
    auto result = it->second(args, context);
    if (!result) {
        return Err<bool>(std::move(result.error()));
    }
    return Ok(true);
}

void HookRegistry::clear() {
    m_conditions.clear();
    m_actions.clear();
    m_functions.clear();
    m_conditions_evaluated = 0;
    m_actions_executed = 0;
    m_functions_called = 0;
}

} // namespace cortex_event
