#pragma once

/// @file action.hpp
/// @brief Command language executed by handlers and triggers

#include "fwd.hpp"
#include "event.hpp"
#include "condition.hpp"

#include <cortex/core/error.hpp>
#include <cortex/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cortex_event {

using cortex_core::Result;

// =============================================================================
// EventAction
// =============================================================================

/// Closed recursive command executed in response to an event.
///
/// Execution only fails structurally (an unregistered custom action, or a
/// failure reported by a registered hook). TriggerEvent and Delay never run
/// anything immediately; they append to the context.
class EventAction {
public:
    enum class Kind : std::uint8_t {
        LogMessage,
        SetVariable,
        TriggerEvent,
        CallFunction,
        Sequence,
        Conditional,
        Delay,
        Custom
    };

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    [[nodiscard]] static EventAction log_message(std::string message);
    [[nodiscard]] static EventAction set_variable(std::string key, RuntimeValue value);
    [[nodiscard]] static EventAction trigger_event(std::string event_name, EventData data = {});
    [[nodiscard]] static EventAction call_function(std::string function, cortex_core::ValueArray args = {});
    [[nodiscard]] static EventAction sequence(std::vector<EventAction> actions);
    [[nodiscard]] static EventAction conditional(EventCondition condition, EventAction then_action,
                                                 std::optional<EventAction> else_action = std::nullopt);
    [[nodiscard]] static EventAction delay(std::uint64_t delay_ms, EventAction action);
    [[nodiscard]] static EventAction custom(std::string name);

    // -------------------------------------------------------------------------
    // Execution
    // -------------------------------------------------------------------------

    /// Run the action for an event. A Sequence stops at the first error.
    [[nodiscard]] Result<void> execute(const Event& event, EventContext& context, HookRegistry& hooks) const;

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    /// Message, variable key, event name, function name or custom name
    [[nodiscard]] const std::string& text() const noexcept { return m_text; }
    [[nodiscard]] const RuntimeValue& value() const noexcept { return m_value; }
    [[nodiscard]] const EventData& data() const noexcept { return m_data; }
    [[nodiscard]] const cortex_core::ValueArray& args() const noexcept { return m_args; }
    [[nodiscard]] const std::vector<EventAction>& actions() const noexcept { return m_actions; }
    [[nodiscard]] const EventCondition& condition() const noexcept { return m_condition; }
    [[nodiscard]] std::uint64_t delay_ms() const noexcept { return m_delay_ms; }

private:
    explicit EventAction(Kind kind) : m_kind(kind) {}

    Kind m_kind;
    std::string m_text;
    RuntimeValue m_value;
    EventData m_data;
    cortex_core::ValueArray m_args;
    std::vector<EventAction> m_actions;   // Sequence items; Conditional then/else; Delay target
    EventCondition m_condition;
    std::uint64_t m_delay_ms = 0;
};

// =============================================================================
// DelayedAction
// =============================================================================

/// Action waiting in the context until execute_at has passed
struct DelayedAction {
    DelayedActionId id;
    cortex_core::TimePoint execute_at;
    EventAction action;
    Event event;
    std::optional<TriggerId> trigger_id;  ///< Set when scheduled by a timed trigger
};

// =============================================================================
// EventContext
// =============================================================================

/// Mutable state shared by every action executed by one EventSystem
struct EventContext {
    EventData variables;
    std::vector<Event> triggered_events;
    std::vector<DelayedAction> delayed_actions;

    /// Time used as the base for newly scheduled delays
    cortex_core::TimePoint now{};

    /// Append a delayed action and return its id
    DelayedActionId schedule(cortex_core::TimePoint execute_at, EventAction action, Event event,
                             std::optional<TriggerId> trigger_id = std::nullopt);

    [[nodiscard]] const RuntimeValue* get_variable(const std::string& key) const;

    /// Forget pending triggered events; variables and delays are kept
    void clear() { triggered_events.clear(); }

private:
    std::uint64_t m_next_delayed_id = 1;
};

} // namespace cortex_event
