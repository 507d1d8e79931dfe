#pragma once

/// @file hooks.hpp
/// @brief Named custom conditions, actions and functions

#include "fwd.hpp"
#include "event.hpp"
#include "action.hpp"

#include <cortex/core/error.hpp>

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace cortex_event {

/// Predicate referenced by EventCondition::custom
using CustomCondition = std::function<bool(const Event& event)>;

/// Command referenced by EventAction::custom
using CustomAction = std::function<Result<void>(const Event& event, EventContext& context)>;

/// Function referenced by EventAction::call_function
using CustomFunction = std::function<Result<void>(const cortex_core::ValueArray& args, EventContext& context)>;

// =============================================================================
// HookRegistry
// =============================================================================

/// Registry resolving custom names used by conditions and actions.
/// Registering an existing name replaces the previous hook.
class HookRegistry {
public:
    HookRegistry() = default;

    // Registration
    Result<void> register_condition(const std::string& name, CustomCondition condition);
    Result<void> register_action(const std::string& name, CustomAction action);
    Result<void> register_function(const std::string& name, CustomFunction function);

    bool remove_condition(const std::string& name) { return m_conditions.erase(name) > 0; }
    bool remove_action(const std::string& name) { return m_actions.erase(name) > 0; }
    bool remove_function(const std::string& name) { return m_functions.erase(name) > 0; }

    [[nodiscard]] bool has_condition(const std::string& name) const { return m_conditions.count(name) > 0; }
    [[nodiscard]] bool has_action(const std::string& name) const { return m_actions.count(name) > 0; }
    [[nodiscard]] bool has_function(const std::string& name) const { return m_functions.count(name) > 0; }

    // Dispatch

    /// Evaluate a custom condition (nullopt if the name is unknown)
    [[nodiscard]] std::optional<bool> evaluate_condition(const std::string& name, const Event& event);

    /// Run a custom action; CustomActionNotFound if the name is unknown
    [[nodiscard]] Result<void> execute_action(const std::string& name, const Event& event, EventContext& context);

    /// Call a function; Ok(false) if the name is unknown
    [[nodiscard]] Result<bool> call_function(const std::string& name, const cortex_core::ValueArray& args,
                                             EventContext& context);

    // Statistics
    [[nodiscard]] std::uint64_t conditions_evaluated() const noexcept { return m_conditions_evaluated; }
    [[nodiscard]] std::uint64_t actions_executed() const noexcept { return m_actions_executed; }
    [[nodiscard]] std::uint64_t functions_called() const noexcept { return m_functions_called; }

    [[nodiscard]] std::size_t condition_count() const noexcept { return m_conditions.size(); }
    [[nodiscard]] std::size_t action_count() const noexcept { return m_actions.size(); }
    [[nodiscard]] std::size_t function_count() const noexcept { return m_functions.size(); }

    void clear();

private:
    std::unordered_map<std::string, CustomCondition> m_conditions;
    std::unordered_map<std::string, CustomAction> m_actions;
    std::unordered_map<std::string, CustomFunction> m_functions;

    std::uint64_t m_conditions_evaluated = 0;
    std::uint64_t m_actions_executed = 0;
    std::uint64_t m_functions_called = 0;
};

} // namespace cortex_event
