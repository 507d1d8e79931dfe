/// @file handler.cpp
/// @brief EventHandler and HandlerBuilder implementation

#include <cortex/event/handler.hpp>

#include <algorithm>

namespace cortex_event {

bool pattern_matches(const std::string& pattern, const std::string& event_name) {
    if (pattern == "*") {
        return true;
    }

    if (pattern.find('*') != std::string::npos) {
        std::string fragment = pattern;
        fragment.erase(std::remove(fragment.begin(), fragment.end(), '*'), fragment.end());
        return event_name.find(fragment) != std::string::npos;
    }

    return event_name == pattern;
}

// =============================================================================
// EventHandler
// =============================================================================

bool EventHandler::matches(const Event& event) const {
    return pattern_matches(event_pattern, event.name());
}

bool EventHandler::can_execute(cortex_core::TimePoint now) const {
    if (!enabled) {
        return false;
    }
    if (cooldown_ms && last_execution) {
        return now - *last_execution >= cortex_core::Milliseconds(*cooldown_ms);
    }
    return true;
}

// =============================================================================
// HandlerBuilder
// =============================================================================

HandlerBuilder::HandlerBuilder(std::string name, std::string event_pattern) {
    m_handler.name = std::move(name);
    m_handler.event_pattern = std::move(event_pattern);
}

HandlerBuilder& HandlerBuilder::with_condition(EventCondition condition) {
    m_handler.condition = std::move(condition);
    return *this;
}

HandlerBuilder& HandlerBuilder::with_action(EventAction action) {
    m_handler.action = std::move(action);
    return *this;
}

HandlerBuilder& HandlerBuilder::with_cooldown(std::uint64_t cooldown_ms) {
    m_handler.cooldown_ms = cooldown_ms;
    return *this;
}

HandlerBuilder& HandlerBuilder::disabled() {
    m_handler.enabled = false;
    return *this;
}

// =============================================================================
// TriggerType
// =============================================================================

const char* trigger_kind_name(TriggerType::Kind kind) noexcept {
    switch (kind) {
        case TriggerType::Kind::Immediate: return "Immediate";
        case TriggerType::Kind::Delayed: return "Delayed";
        case TriggerType::Kind::Interval: return "Interval";
        case TriggerType::Kind::Once: return "Once";
        default: return "Unknown";
    }
}

} // namespace cortex_event
