#pragma once

/// @file condition.hpp
/// @brief Boolean predicate language evaluated against events

#include "fwd.hpp"
#include "event.hpp"

#include <string>
#include <vector>

namespace cortex_event {

// =============================================================================
// EventCondition
// =============================================================================

/// Closed recursive predicate over an event's payload.
///
/// Evaluation is total: missing keys and unknown custom names evaluate to
/// false. Both operands of And/Or are always evaluated.
class EventCondition {
public:
    enum class Kind : std::uint8_t {
        Always,
        Never,
        KeyExists,
        KeyEquals,
        KeyGreater,
        KeyLess,
        And,
        Or,
        Not,
        Custom
    };

    /// Default condition is Always
    EventCondition() = default;

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    [[nodiscard]] static EventCondition always();
    [[nodiscard]] static EventCondition never();
    [[nodiscard]] static EventCondition key_exists(std::string key);
    [[nodiscard]] static EventCondition key_equals(std::string key, RuntimeValue value);
    [[nodiscard]] static EventCondition key_greater(std::string key, float threshold);
    [[nodiscard]] static EventCondition key_less(std::string key, float threshold);
    [[nodiscard]] static EventCondition both(EventCondition left, EventCondition right);
    [[nodiscard]] static EventCondition either(EventCondition left, EventCondition right);
    [[nodiscard]] static EventCondition negate(EventCondition condition);
    [[nodiscard]] static EventCondition custom(std::string name);

    // -------------------------------------------------------------------------
    // Evaluation
    // -------------------------------------------------------------------------

    /// Evaluate against an event; custom names resolve through the registry
    [[nodiscard]] bool evaluate(const Event& event, HookRegistry& hooks) const;

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    /// Key for Key* kinds, name for Custom
    [[nodiscard]] const std::string& key() const noexcept { return m_key; }
    [[nodiscard]] const RuntimeValue& value() const noexcept { return m_value; }
    [[nodiscard]] float threshold() const noexcept { return m_threshold; }
    [[nodiscard]] const std::vector<EventCondition>& operands() const noexcept { return m_operands; }

    /// Readable form, e.g. "And(KeyExists(health), KeyLess(health, 25))"
    [[nodiscard]] std::string to_string() const;

private:
    explicit EventCondition(Kind kind) : m_kind(kind) {}

    Kind m_kind = Kind::Always;
    std::string m_key;
    RuntimeValue m_value;
    float m_threshold = 0.0f;
    std::vector<EventCondition> m_operands;
};

} // namespace cortex_event
