#pragma once

/// @file handler.hpp
/// @brief Event handlers and triggers

#include "fwd.hpp"
#include "event.hpp"
#include "condition.hpp"
#include "action.hpp"

#include <cortex/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace cortex_event {

// =============================================================================
// EventHandler
// =============================================================================

/// Subscription of an action to events whose name matches a pattern.
///
/// Patterns: "*" matches every event; a pattern containing '*' matches when
/// the event name contains the pattern with all '*' removed; otherwise the
/// name must equal the pattern.
struct EventHandler {
    HandlerId id;
    std::string name;
    std::string event_pattern;
    EventCondition condition;
    EventAction action = EventAction::log_message("Default handler action");
    bool enabled = true;
    std::uint64_t execution_count = 0;
    std::optional<cortex_core::TimePoint> last_execution;
    std::optional<std::uint64_t> cooldown_ms;

    [[nodiscard]] bool matches(const Event& event) const;

    /// Enabled and outside the cooldown window at `now`
    [[nodiscard]] bool can_execute(cortex_core::TimePoint now) const;

    void record_execution(cortex_core::TimePoint now) {
        ++execution_count;
        last_execution = now;
    }
};

/// Check a name against a handler pattern
[[nodiscard]] bool pattern_matches(const std::string& pattern, const std::string& event_name);

// =============================================================================
// HandlerBuilder
// =============================================================================

/// Fluent construction of handlers for EventSystem::add_handler
class HandlerBuilder {
public:
    HandlerBuilder(std::string name, std::string event_pattern);

    HandlerBuilder& with_condition(EventCondition condition);
    HandlerBuilder& with_action(EventAction action);
    HandlerBuilder& with_cooldown(std::uint64_t cooldown_ms);
    HandlerBuilder& disabled();

    [[nodiscard]] EventHandler build() const { return m_handler; }

private:
    EventHandler m_handler;
};

// =============================================================================
// TriggerType
// =============================================================================

/// When a trigger's action runs after its condition matches
struct TriggerType {
    enum class Kind : std::uint8_t {
        Immediate,  ///< Every matching event
        Delayed,    ///< Once, `ms` after each matching event
        Interval,   ///< Every `ms`, armed by the first matching event
        Once        ///< First matching event, then the trigger disables itself
    };

    Kind kind = Kind::Immediate;
    std::uint64_t ms = 0;

    [[nodiscard]] static constexpr TriggerType immediate() { return {Kind::Immediate, 0}; }
    [[nodiscard]] static constexpr TriggerType delayed(std::uint64_t ms) { return {Kind::Delayed, ms}; }
    [[nodiscard]] static constexpr TriggerType interval(std::uint64_t ms) { return {Kind::Interval, ms}; }
    [[nodiscard]] static constexpr TriggerType once() { return {Kind::Once, 0}; }

    constexpr bool operator==(const TriggerType&) const noexcept = default;
};

[[nodiscard]] const char* trigger_kind_name(TriggerType::Kind kind) noexcept;

// =============================================================================
// EventTrigger
// =============================================================================

/// Condition evaluated against every processed event, independent of names
struct EventTrigger {
    TriggerId id;
    std::string name;
    EventCondition condition;
    EventAction action;
    TriggerType trigger_type;
    bool enabled = true;
    std::uint64_t activation_count = 0;
    std::optional<cortex_core::TimePoint> last_activation;

    /// Interval triggers: a firing is already scheduled
    bool interval_armed = false;

    EventTrigger(std::string trigger_name, EventCondition trigger_condition, EventAction trigger_action)
        : name(std::move(trigger_name))
        , condition(std::move(trigger_condition))
        , action(std::move(trigger_action)) {}

    EventTrigger& with_trigger_type(TriggerType type) {
        trigger_type = type;
        return *this;
    }

    void record_activation(cortex_core::TimePoint now) {
        ++activation_count;
        last_activation = now;
    }
};

} // namespace cortex_event
