#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for cortex_event

#include <cstdint>
#include <functional>

namespace cortex_event {

// Priority
enum class Priority : std::uint8_t;

// =============================================================================
// Ids
// =============================================================================

/// Unique identifier of a registered handler
struct HandlerId {
    std::uint64_t id = 0;

    constexpr HandlerId() = default;
    constexpr explicit HandlerId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const HandlerId&) const noexcept = default;
    constexpr bool operator==(const HandlerId&) const noexcept = default;
};

/// Unique identifier of a trigger
struct TriggerId {
    std::uint64_t id = 0;

    constexpr TriggerId() = default;
    constexpr explicit TriggerId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const TriggerId&) const noexcept = default;
    constexpr bool operator==(const TriggerId&) const noexcept = default;
};

/// Process-unique identifier of an event
struct EventId {
    std::uint64_t id = 0;

    constexpr EventId() = default;
    constexpr explicit EventId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const EventId&) const noexcept = default;
    constexpr bool operator==(const EventId&) const noexcept = default;
};

/// Identifier of a scheduled delayed action
struct DelayedActionId {
    std::uint64_t id = 0;

    constexpr DelayedActionId() = default;
    constexpr explicit DelayedActionId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const DelayedActionId&) const noexcept = default;
    constexpr bool operator==(const DelayedActionId&) const noexcept = default;
};

/// Subscription to the global bus
struct SubscriberId {
    std::uint64_t id = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;
};

// Core types
class Event;
class EventBuilder;
class EventCondition;
class EventAction;
struct EventContext;
struct DelayedAction;
class HookRegistry;
struct EventHandler;
class HandlerBuilder;
struct EventTrigger;
class GlobalEventBus;
struct EventSystemConfig;
class EventSystem;

} // namespace cortex_event

// Hash specializations
namespace std {
    template<> struct hash<cortex_event::HandlerId> {
        std::size_t operator()(const cortex_event::HandlerId& h) const noexcept {
            return std::hash<std::uint64_t>{}(h.id);
        }
    };
    template<> struct hash<cortex_event::TriggerId> {
        std::size_t operator()(const cortex_event::TriggerId& t) const noexcept {
            return std::hash<std::uint64_t>{}(t.id);
        }
    };
    template<> struct hash<cortex_event::EventId> {
        std::size_t operator()(const cortex_event::EventId& e) const noexcept {
            return std::hash<std::uint64_t>{}(e.id);
        }
    };
}
