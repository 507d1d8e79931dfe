/// @file condition.cpp
/// @brief EventCondition implementation

#include <cortex/event/condition.hpp>
#include <cortex/event/hooks.hpp>

#include <spdlog/fmt/fmt.h>

namespace cortex_event {

// =============================================================================
// Factories
// =============================================================================

EventCondition EventCondition::always() {
    return EventCondition(Kind::Always);
}

EventCondition EventCondition::never() {
    return EventCondition(Kind::Never);
}

EventCondition EventCondition::key_exists(std::string key) {
    EventCondition c(Kind::KeyExists);
    c.m_key = std::move(key);
    return c;
}

EventCondition EventCondition::key_equals(std::string key, RuntimeValue value) {
    EventCondition c(Kind::KeyEquals);
    c.m_key = std::move(key);
    c.m_value = std::move(value);
    return c;
}

EventCondition EventCondition::key_greater(std::string key, float threshold) {
    EventCondition c(Kind::KeyGreater);
    c.m_key = std::move(key);
    c.m_threshold = threshold;
    return c;
}

EventCondition EventCondition::key_less(std::string key, float threshold) {
    EventCondition c(Kind::KeyLess);
    c.m_key = std::move(key);
    c.m_threshold = threshold;
    return c;
}

EventCondition EventCondition::both(EventCondition left, EventCondition right) {
    EventCondition c(Kind::And);
    c.m_operands.reserve(2);
    c.m_operands.push_back(std::move(left));
    c.m_operands.push_back(std::move(right));
    return c;
}

EventCondition EventCondition::either(EventCondition left, EventCondition right) {
    EventCondition c(Kind::Or);
    c.m_operands.reserve(2);
    c.m_operands.push_back(std::move(left));
    c.m_operands.push_back(std::move(right));
    return c;
}

EventCondition EventCondition::negate(EventCondition condition) {
    EventCondition c(Kind::Not);
    c.m_operands.push_back(std::move(condition));
    return c;
}

EventCondition EventCondition::custom(std::string name) {
    EventCondition c(Kind::Custom);
    c.m_key = std::move(name);
    return c;
}

// =============================================================================
// Evaluation
// =============================================================================

bool EventCondition::evaluate(const Event& event, HookRegistry& hooks) const {
    switch (m_kind) {
        case Kind::Always:
            return true;

        case Kind::Never:
            return false;

        case Kind::KeyExists:
            return event.has_data(m_key);

        case Kind::KeyEquals: {
            const auto* value = event.get_data(m_key);
            return value && cortex_core::loosely_equals(*value, m_value);
        }

        case Kind::KeyGreater: {
            const auto* value = event.get_data(m_key);
            return value && value->as_float() > m_threshold;
        }

        case Kind::KeyLess: {
            const auto* value = event.get_data(m_key);
            return value && value->as_float() < m_threshold;
        }

        case Kind::And: {
            // Both sides run so custom hooks observe every evaluation
            bool left = m_operands[0].evaluate(event, hooks);
            bool right = m_operands[1].evaluate(event, hooks);
            return left && right;
        }

        case Kind::Or: {
            bool left = m_operands[0].evaluate(event, hooks);
            bool right = m_operands[1].evaluate(event, hooks);
            return left || right;
        }

        case Kind::Not:
            return !m_operands[0].evaluate(event, hooks);

        case Kind::Custom:
            return hooks.evaluate_condition(m_key, event).value_or(false);
    }
    return false;
}

// =============================================================================
// Formatting
// =============================================================================

std::string EventCondition::to_string() const {
    switch (m_kind) {
        case Kind::Always: return "Always";
        case Kind::Never: return "Never";
        case Kind::KeyExists: return fmt::format("KeyExists({})", m_key);
        case Kind::KeyEquals: return fmt::format("KeyEquals({}, {})", m_key, m_value.as_string());
        case Kind::KeyGreater: return fmt::format("KeyGreater({}, {})", m_key, m_threshold);
        case Kind::KeyLess: return fmt::format("KeyLess({}, {})", m_key, m_threshold);
        case Kind::And:
            return fmt::format("And({}, {})", m_operands[0].to_string(), m_operands[1].to_string());
        case Kind::Or:
            return fmt::format("Or({}, {})", m_operands[0].to_string(), m_operands[1].to_string());
        case Kind::Not: return fmt::format("Not({})", m_operands[0].to_string());
        case Kind::Custom: return fmt::format("Custom({})", m_key);
    }
    return "Unknown";
}

} // namespace cortex_event
