#pragma once

/// @file event_system.hpp
/// @brief Priority-ordered event dispatch to handlers and triggers

#include "fwd.hpp"
#include "event.hpp"
#include "condition.hpp"
#include "action.hpp"
#include "hooks.hpp"
#include "handler.hpp"
#include "event_bus.hpp"
#include "config.hpp"

#include <cortex/core/error.hpp>
#include <cortex/core/time.hpp>

#include <array>
#include <deque>
#include <map>
#include <optional>
#include <string>

namespace cortex_event {

// =============================================================================
// Statistics
// =============================================================================

struct EventSystemStats {
    std::uint64_t events_processed_total = 0;
    std::uint32_t events_processed_per_second = 0;
    std::uint64_t handlers_executed_total = 0;
    std::uint64_t triggers_activated_total = 0;
    std::uint64_t custom_conditions_evaluated = 0;
    std::uint64_t custom_actions_executed = 0;
    std::uint64_t delayed_actions_executed = 0;
    std::uint64_t action_errors = 0;        ///< Failures logged while isolating errors
    std::uint64_t budget_overruns = 0;      ///< update() calls that left events queued
    float average_processing_time_ms = 0.0f;
    std::map<std::string, std::uint32_t> queue_sizes;  ///< Keyed by priority_name()
};

// =============================================================================
// EventSystem
// =============================================================================

/// Routes named events to handlers and triggers.
///
/// trigger_event() queues an event in its priority bucket and publishes a copy
/// on the global bus. update() drains buckets from Critical to Low (FIFO within
/// a bucket) until the processing budget is spent, then runs due delayed
/// actions and finally queues the events actions asked to trigger.
///
/// Not thread-safe; call from the frame loop.
class EventSystem {
public:
    explicit EventSystem(EventSystemConfig config = {});
    ~EventSystem() = default;

    EventSystem(const EventSystem&) = delete;
    EventSystem& operator=(const EventSystem&) = delete;

    /// Validate the configuration and install the built-in hooks
    Result<void> initialize();

    /// Log totals and drop handlers, triggers, hooks and queued events
    Result<void> shutdown();

    // -------------------------------------------------------------------------
    // Handlers and triggers
    // -------------------------------------------------------------------------

    /// Register a handler named "handler_<n>" (n = handlers registered so far)
    HandlerId register_handler(std::string event_pattern, EventCondition condition, EventAction action);

    /// Register a prebuilt handler; its id is assigned here
    HandlerId add_handler(EventHandler handler);

    /// Create an Immediate trigger
    TriggerId create_trigger(std::string name, EventCondition condition, EventAction action);

    /// Register a prebuilt trigger; its id is assigned here
    TriggerId add_trigger(EventTrigger trigger);

    Result<void> enable_handler(HandlerId id);
    Result<void> disable_handler(HandlerId id);
    Result<void> remove_handler(HandlerId id);

    Result<void> enable_trigger(TriggerId id);
    Result<void> disable_trigger(TriggerId id);

    /// Remove a trigger; pending timed firings of it are cancelled
    Result<void> remove_trigger(TriggerId id);

    [[nodiscard]] const EventHandler* get_handler(HandlerId id) const;
    [[nodiscard]] const EventTrigger* get_trigger(TriggerId id) const;

    [[nodiscard]] std::size_t handler_count() const noexcept { return m_handlers.size(); }
    [[nodiscard]] std::size_t trigger_count() const noexcept { return m_triggers.size(); }

    // -------------------------------------------------------------------------
    // Hooks
    // -------------------------------------------------------------------------

    Result<void> register_custom_condition(const std::string& name, CustomCondition condition);
    Result<void> register_custom_action(const std::string& name, CustomAction action);
    Result<void> register_custom_function(const std::string& name, CustomFunction function);

    [[nodiscard]] HookRegistry& hooks() noexcept { return m_hooks; }
    [[nodiscard]] const HookRegistry& hooks() const noexcept { return m_hooks; }

    // -------------------------------------------------------------------------
    // Dispatch
    // -------------------------------------------------------------------------

    /// Queue an event and publish it on the global bus.
    /// Dropped when processing is disabled.
    void trigger_event(Event event);

    /// Process queued events, due delayed actions and follow-up events.
    /// With isolate_action_errors disabled the first action failure aborts
    /// the call and is returned.
    Result<void> update(float delta_time);

    /// Drop queued events and pending triggered events
    void clear_all_events();

    void set_processing_enabled(bool enabled) noexcept { m_processing_enabled = enabled; }
    [[nodiscard]] bool is_processing_enabled() const noexcept { return m_processing_enabled; }

    [[nodiscard]] std::size_t total_queue_size() const;
    [[nodiscard]] std::size_t queue_size(Priority priority) const;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] EventContext& context() noexcept { return m_context; }
    [[nodiscard]] const EventContext& context() const noexcept { return m_context; }

    [[nodiscard]] GlobalEventBus& global_bus() noexcept { return m_bus; }

    [[nodiscard]] const EventSystemStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const EventSystemConfig& config() const noexcept { return m_config; }

    /// Replace the clock used for cooldowns, delays and the budget
    void set_time_source(cortex_core::TimeSource source);

private:
    using Bucket = std::deque<Event>;

    void register_builtin_hooks();

    Result<void> process_event(const Event& event);
    Result<void> fire_trigger(EventTrigger& trigger, const Event& event);
    Result<void> process_delayed_actions();

    /// Apply the error policy to an action result
    Result<void> handle_action_result(Result<void> result, const char* origin, const std::string& name);

    void refresh_queue_sizes();

    [[nodiscard]] Bucket& bucket(Priority priority) {
        return m_queues[static_cast<std::size_t>(priority)];
    }

    EventSystemConfig m_config;

    std::map<HandlerId, EventHandler> m_handlers;
    std::map<TriggerId, EventTrigger> m_triggers;
    std::uint64_t m_next_handler_id = 1;
    std::uint64_t m_next_trigger_id = 1;

    HookRegistry m_hooks;
    GlobalEventBus m_bus;
    EventContext m_context;
    std::array<Bucket, k_priority_count> m_queues;

    EventSystemStats m_stats;
    cortex_core::TimeSource m_time_source;
    std::optional<cortex_core::TimePoint> m_last_stats_update;
    std::uint64_t m_events_since_stats = 0;
    double m_processing_ms_since_stats = 0.0;
    std::uint64_t m_updates_since_stats = 0;
    bool m_processing_enabled = true;
};

} // namespace cortex_event
