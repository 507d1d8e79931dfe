#pragma once

/// @file event.hpp
/// @brief Named events carrying a RuntimeValue payload

#include "fwd.hpp"

#include <cortex/core/value.hpp>

#include <string>
#include <string_view>

namespace cortex_event {

using cortex_core::RuntimeValue;

/// Event payload (ordered by key)
using EventData = cortex_core::ValueObject;

// =============================================================================
// Priority
// =============================================================================

/// Event priority; queues are drained from Critical down to Low
enum class Priority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

/// Number of priority levels
inline constexpr std::size_t k_priority_count = 4;

/// Lower-case name ("critical", "high", "normal", "low")
[[nodiscard]] const char* priority_name(Priority priority) noexcept;

// =============================================================================
// Event
// =============================================================================

/// A named message. Identity (id, name, timestamp) is fixed at construction;
/// the payload and propagation flag may be changed explicitly.
class Event {
public:
    explicit Event(std::string name, EventData data = {});

    [[nodiscard]] EventId id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const EventData& data() const noexcept { return m_data; }

    /// Milliseconds since the Unix epoch at creation
    [[nodiscard]] std::uint64_t timestamp() const noexcept { return m_timestamp; }

    [[nodiscard]] Priority priority() const noexcept { return m_priority; }
    [[nodiscard]] const std::string& source() const noexcept { return m_source; }

    Event& with_priority(Priority priority) {
        m_priority = priority;
        return *this;
    }

    Event& with_source(std::string source) {
        m_source = std::move(source);
        return *this;
    }

    /// Payload lookup (nullptr if absent)
    [[nodiscard]] const RuntimeValue* get_data(const std::string& key) const;
    [[nodiscard]] bool has_data(const std::string& key) const { return get_data(key) != nullptr; }
    void set_data(std::string key, RuntimeValue value);

    void stop_propagation() noexcept { m_propagation_stopped = true; }
    [[nodiscard]] bool is_propagation_stopped() const noexcept { return m_propagation_stopped; }

private:
    EventId m_id;
    std::string m_name;
    EventData m_data;
    std::uint64_t m_timestamp = 0;
    Priority m_priority = Priority::Normal;
    std::string m_source = "unknown";
    bool m_propagation_stopped = false;
};

// =============================================================================
// EventBuilder
// =============================================================================

/// Fluent construction of events
class EventBuilder {
public:
    explicit EventBuilder(std::string name) : m_event(std::move(name)) {}

    EventBuilder& with_data(std::string key, RuntimeValue value) {
        m_event.set_data(std::move(key), std::move(value));
        return *this;
    }

    EventBuilder& with_priority(Priority priority) {
        m_event.with_priority(priority);
        return *this;
    }

    EventBuilder& with_source(std::string source) {
        m_event.with_source(std::move(source));
        return *this;
    }

    [[nodiscard]] Event build() const { return m_event; }

private:
    Event m_event;
};

} // namespace cortex_event
