/// @file action.cpp
/// @brief EventAction and EventContext implementation

#include <cortex/event/action.hpp>
#include <cortex/event/hooks.hpp>

#include <cortex/core/log.hpp>

namespace cortex_event {

using cortex_core::Err;
using cortex_core::Ok;

// =============================================================================
// Factories
// =============================================================================

EventAction EventAction::log_message(std::string message) {
    EventAction a(Kind::LogMessage);
    a.m_text = std::move(message);
    return a;
}

EventAction EventAction::set_variable(std::string key, RuntimeValue value) {
    EventAction a(Kind::SetVariable);
    a.m_text = std::move(key);
    a.m_value = std::move(value);
    return a;
}

EventAction EventAction::trigger_event(std::string event_name, EventData data) {
    EventAction a(Kind::TriggerEvent);
    a.m_text = std::move(event_name);
    a.m_data = std::move(data);
    return a;
}

EventAction EventAction::call_function(std::string function, cortex_core::ValueArray args) {
    EventAction a(Kind::CallFunction);
    a.m_text = std::move(function);
    a.m_args = std::move(args);
    return a;
}

EventAction EventAction::sequence(std::vector<EventAction> actions) {
    EventAction a(Kind::Sequence);
    a.m_actions = std::move(actions);
    return a;
}

EventAction EventAction::conditional(EventCondition condition, EventAction then_action,
                                     std::optional<EventAction> else_action) {
    EventAction a(Kind::Conditional);
    a.m_condition = std::move(condition);
    a.m_actions.push_back(std::move(then_action));
    if (else_action) {
        a.m_actions.push_back(std::move(*else_action));
    }
    return a;
}

EventAction EventAction::delay(std::uint64_t delay_ms, EventAction action) {
    EventAction a(Kind::Delay);
    a.m_delay_ms = delay_ms;
    a.m_actions.push_back(std::move(action));
    return a;
}

EventAction EventAction::custom(std::string name) {
    EventAction a(Kind::Custom);
    a.m_text = std::move(name);
    return a;
}

// =============================================================================
// Execution
// =============================================================================

Result<void> EventAction::execute(const Event& event, EventContext& context, HookRegistry& hooks) const {
    switch (m_kind) {
        case Kind::LogMessage:
            cortex_core::event_logger()->info("Event Log [{}]: {}", event.name(), m_text);
            return Ok();

        case Kind::SetVariable:
            context.variables.insert_or_assign(m_text, m_value);
            return Ok();

        case Kind::TriggerEvent: {
            Event triggered(m_text, m_data);
            triggered.with_source("triggered_by_" + std::to_string(event.id().id));
            context.triggered_events.push_back(std::move(triggered));
            return Ok();
        }

        case Kind::CallFunction: {
            auto called = hooks.call_function(m_text, m_args, context);
            if (!called) {
                return Err(std::move(called.error()));
            }
            if (!*called) {
                cortex_core::event_logger()->warn("Function '{}' is not registered ({} args ignored)",
                                                  m_text, m_args.size());
            }
            return Ok();
        }

        case Kind::Sequence:
            for (const auto& action : m_actions) {
                auto result = action.execute(event, context, hooks);
                if (!result) {
                    return result;
                }
            }
            return Ok();

        case Kind::Conditional:
            if (m_condition.evaluate(event, hooks)) {
                return m_actions[0].execute(event, context, hooks);
            }
            if (m_actions.size() > 1) {
                return m_actions[1].execute(event, context, hooks);
            }
            return Ok();

        case Kind::Delay:
            context.schedule(context.now + cortex_core::Milliseconds(m_delay_ms), m_actions[0], event);
            return Ok();

        case Kind::Custom:
            return hooks.execute_action(m_text, event, context);
    }
    return Ok();
}

// =============================================================================
// EventContext
// =============================================================================

DelayedActionId EventContext::schedule(cortex_core::TimePoint execute_at, EventAction action, Event event,
                                       std::optional<TriggerId> trigger_id) {
    DelayedActionId id(m_next_delayed_id++);
    delayed_actions.push_back(DelayedAction{id, execute_at, std::move(action), std::move(event), trigger_id});
    return id;
}

const RuntimeValue* EventContext::get_variable(const std::string& key) const {
    auto it = variables.find(key);
    return it != variables.end() ? &it->second : nullptr;
}

} // namespace cortex_event
