/// @file event_system.cpp
/// @brief EventSystem implementation

#include <cortex/event/event_system.hpp>

#include <cortex/core/log.hpp>

#include <algorithm>
#include <utility>

namespace cortex_event {

using cortex_core::Err;
using cortex_core::Error;
using cortex_core::EventError;
using cortex_core::Ok;

namespace {

constexpr Priority k_processing_order[] = {
    Priority::Critical,
    Priority::High,
    Priority::Normal,
    Priority::Low,
};

std::string id_string(std::uint64_t id) {
    return std::to_string(id);
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

EventSystem::EventSystem(EventSystemConfig config)
    : m_config(config)
    , m_bus(config.bus_capacity)
    , m_time_source(cortex_core::steady_time_source()) {
    refresh_queue_sizes();
}

Result<void> EventSystem::initialize() {
    auto logger = cortex_core::event_logger();

    auto valid = m_config.validate();
    if (!valid) {
        logger->error("Rejected event system configuration: {}", valid.error().message());
        return valid;
    }

    if (m_config.register_builtin_hooks) {
        register_builtin_hooks();
    }

    logger->info("Event system initialized");
    logger->info("  Global event bus capacity: {}", m_bus.capacity());
    logger->info("  Priority queues: {} levels (critical, high, normal, low)", k_priority_count);
    logger->info("  Processing budget: {}ms", m_config.max_processing_time_ms);
    logger->info("  Action error isolation: {}", m_config.isolate_action_errors);
    logger->info("  Custom conditions: {}, custom actions: {}",
                 m_hooks.condition_count(), m_hooks.action_count());
    return Ok();
}

Result<void> EventSystem::shutdown() {
    auto logger = cortex_core::event_logger();
    logger->info("Event system shutdown");
    logger->info("  Total events processed: {}", m_stats.events_processed_total);
    logger->info("  Total handlers executed: {}", m_stats.handlers_executed_total);
    logger->info("  Total triggers activated: {}", m_stats.triggers_activated_total);
    logger->info("  Handlers registered: {}", m_handlers.size());
    logger->info("  Triggers registered: {}", m_triggers.size());
    logger->info("  Custom conditions: {}", m_hooks.condition_count());
    logger->info("  Custom actions: {}", m_hooks.action_count());

    m_handlers.clear();
    m_triggers.clear();
    m_hooks.clear();
    clear_all_events();
    m_context.delayed_actions.clear();
    refresh_queue_sizes();
    cortex_core::flush_all_loggers();
    return Ok();
}

void EventSystem::register_builtin_hooks() {
    auto logger = cortex_core::event_logger();

    auto report = [&logger](const char* name, const Result<void>& result) {
        if (!result) {
            logger->error("Failed to register built-in hook '{}': {}", name, result.error().message());
        }
    };

    // Conditions
    report("building.block_placed", m_hooks.register_condition("building.block_placed",
        [](const Event& event) {
            return event.has_data("block_type") && event.has_data("position");
        }));

    report("player.health_low", m_hooks.register_condition("player.health_low",
        [](const Event& event) {
            const auto* health = event.get_data("health");
            return health && health->as_float() < 25.0f;
        }));

    report("npc.in_range", m_hooks.register_condition("npc.in_range",
        [](const Event& event) {
            const auto* distance = event.get_data("distance");
            return distance && distance->as_float() < 10.0f;
        }));

    // Actions
    report("building.save_structure", m_hooks.register_action("building.save_structure",
        [](const Event& event, EventContext& context) -> Result<void> {
            if (const auto* structure = event.get_data("structure")) {
                context.variables.insert_or_assign("last_saved_structure", *structure);
                cortex_core::event_logger()->info("Structure saved: {}", structure->as_string());
            }
            return Ok();
        }));

    report("player.show_notification", m_hooks.register_action("player.show_notification",
        [](const Event& event, EventContext&) -> Result<void> {
            if (const auto* message = event.get_data("message")) {
                cortex_core::event_logger()->info("NOTIFICATION: {}", message->as_string());
            }
            return Ok();
        }));

    report("ai.update_behavior", m_hooks.register_action("ai.update_behavior",
        [](const Event& event, EventContext& context) -> Result<void> {
            const auto* entity_id = event.get_data("entity_id");
            const auto* behavior = event.get_data("behavior");
            if (entity_id && behavior) {
                context.variables.insert_or_assign("ai_behavior_" + entity_id->as_string(), *behavior);
                cortex_core::event_logger()->info("AI behavior updated for entity: {}", entity_id->as_string());
            }
            return Ok();
        }));
}

// =============================================================================
// Handlers and triggers
// =============================================================================

HandlerId EventSystem::register_handler(std::string event_pattern, EventCondition condition, EventAction action) {
    EventHandler handler;
    handler.name = "handler_" + std::to_string(m_handlers.size());
    handler.event_pattern = std::move(event_pattern);
    handler.condition = std::move(condition);
    handler.action = std::move(action);
    return add_handler(std::move(handler));
}

HandlerId EventSystem::add_handler(EventHandler handler) {
    HandlerId id(m_next_handler_id++);
    handler.id = id;
    cortex_core::event_logger()->debug("Registered handler '{}' for pattern '{}'",
                                       handler.name, handler.event_pattern);
    m_handlers.emplace(id, std::move(handler));
    return id;
}

TriggerId EventSystem::create_trigger(std::string name, EventCondition condition, EventAction action) {
    return add_trigger(EventTrigger(std::move(name), std::move(condition), std::move(action)));
}

TriggerId EventSystem::add_trigger(EventTrigger trigger) {
    TriggerId id(m_next_trigger_id++);
    trigger.id = id;
    cortex_core::event_logger()->debug("Created {} trigger '{}'",
                                       trigger_kind_name(trigger.trigger_type.kind), trigger.name);
    m_triggers.emplace(id, std::move(trigger));
    return id;
}

Result<void> EventSystem::enable_handler(HandlerId id) {
    auto it = m_handlers.find(id);
    if (it == m_handlers.end()) {
        return Err(EventError::handler_not_found(id_string(id.id)));
    }
    it->second.enabled = true;
    return Ok();
}

Result<void> EventSystem::disable_handler(HandlerId id) {
    auto it = m_handlers.find(id);
    if (it == m_handlers.end()) {
        return Err(EventError::handler_not_found(id_string(id.id)));
    }
    it->second.enabled = false;
    return Ok();
}

Result<void> EventSystem::remove_handler(HandlerId id) {
    if (m_handlers.erase(id) == 0) {
        return Err(EventError::handler_not_found(id_string(id.id)));
    }
    return Ok();
}

Result<void> EventSystem::enable_trigger(TriggerId id) {
    auto it = m_triggers.find(id);
    if (it == m_triggers.end()) {
        return Err(EventError::trigger_not_found(id_string(id.id)));
    }
    it->second.enabled = true;
    return Ok();
}

Result<void> EventSystem::disable_trigger(TriggerId id) {
    auto it = m_triggers.find(id);
    if (it == m_triggers.end()) {
        return Err(EventError::trigger_not_found(id_string(id.id)));
    }
    it->second.enabled = false;
    return Ok();
}

Result<void> EventSystem::remove_trigger(TriggerId id) {
    if (m_triggers.erase(id) == 0) {
        return Err(EventError::trigger_not_found(id_string(id.id)));
    }

    auto& delayed = m_context.delayed_actions;
    delayed.erase(std::remove_if(delayed.begin(), delayed.end(),
        [id](const DelayedAction& action) {
            return action.trigger_id && *action.trigger_id == id;
        }), delayed.end());
    return Ok();
}

const EventHandler* EventSystem::get_handler(HandlerId id) const {
    auto it = m_handlers.find(id);
    return it != m_handlers.end() ? &it->second : nullptr;
}

const EventTrigger* EventSystem::get_trigger(TriggerId id) const {
    auto it = m_triggers.find(id);
    return it != m_triggers.end() ? &it->second : nullptr;
}

// =============================================================================
// Hooks
// =============================================================================

Result<void> EventSystem::register_custom_condition(const std::string& name, CustomCondition condition) {
    return m_hooks.register_condition(name, std::move(condition));
}

Result<void> EventSystem::register_custom_action(const std::string& name, CustomAction action) {
    return m_hooks.register_action(name, std::move(action));
}

Result<void> EventSystem::register_custom_function(const std::string& name, CustomFunction function) {
    return m_hooks.register_function(name, std::move(function));
}

// =============================================================================
// Dispatch
// =============================================================================

void EventSystem::trigger_event(Event event) {
    if (!m_processing_enabled) {
        cortex_core::event_logger()->debug("Processing disabled, dropping event '{}'", event.name());
        return;
    }

    bucket(event.priority()).push_back(event);
    m_bus.publish(std::move(event));
}

Result<void> EventSystem::update(float /*delta_time*/) {
    if (!m_processing_enabled) {
        return Ok();
    }

    const auto start = m_time_source();
    if (!m_last_stats_update) {
        m_last_stats_update = start;
    }

    std::uint64_t processed = 0;
    bool budget_hit = false;

    for (Priority priority : k_processing_order) {
        auto& queue = bucket(priority);
        while (!queue.empty()) {
            if (cortex_core::elapsed_ms(start, m_time_source()) > m_config.max_processing_time_ms) {
                budget_hit = true;
                break;
            }

            Event event = std::move(queue.front());
            queue.pop_front();

            m_context.now = m_time_source();
            auto result = process_event(event);
            if (!result) {
                refresh_queue_sizes();
                return result;
            }
            ++processed;
        }
        if (budget_hit) {
            break;
        }
    }

    if (budget_hit) {
        ++m_stats.budget_overruns;
        cortex_core::event_logger()->warn(
            "Event processing exceeded {}ms budget; {} events deferred to next update",
            m_config.max_processing_time_ms, total_queue_size());
    }

    m_context.now = m_time_source();
    auto delayed = process_delayed_actions();
    if (!delayed) {
        refresh_queue_sizes();
        return delayed;
    }

    auto triggered = std::exchange(m_context.triggered_events, {});
    for (auto& event : triggered) {
        trigger_event(std::move(event));
    }

    // Statistics
    const auto end = m_time_source();
    m_events_since_stats += processed;
    m_processing_ms_since_stats += cortex_core::elapsed_ms(start, end);
    ++m_updates_since_stats;

    m_stats.custom_conditions_evaluated = m_hooks.conditions_evaluated();
    m_stats.custom_actions_executed = m_hooks.actions_executed();
    refresh_queue_sizes();

    const double since_stats = cortex_core::elapsed_ms(*m_last_stats_update, end);
    if (since_stats >= m_config.stats_interval_ms) {
        m_stats.events_processed_per_second =
            static_cast<std::uint32_t>(static_cast<double>(m_events_since_stats) * 1000.0 / since_stats);
        m_stats.average_processing_time_ms =
            static_cast<float>(m_processing_ms_since_stats / static_cast<double>(m_updates_since_stats));
        m_events_since_stats = 0;
        m_processing_ms_since_stats = 0.0;
        m_updates_since_stats = 0;
        m_last_stats_update = end;
    }

    return Ok();
}

Result<void> EventSystem::process_event(const Event& event) {
    if (event.is_propagation_stopped()) {
        return Ok();
    }

    const auto now = m_context.now;

    // Hooks may register or remove handlers, so work from ids and copies
    std::vector<HandlerId> candidates;
    for (const auto& [id, handler] : m_handlers) {
        if (handler.matches(event) && handler.can_execute(now)) {
            candidates.push_back(id);
        }
    }

    for (HandlerId id : candidates) {
        auto it = m_handlers.find(id);
        if (it == m_handlers.end() || !it->second.condition.evaluate(event, m_hooks)) {
            continue;
        }

        const std::string name = it->second.name;
        const EventAction action = it->second.action;
        auto result = action.execute(event, m_context, m_hooks);
        if (!result) {
            auto handled = handle_action_result(std::move(result), "handler", name);
            if (!handled) {
                return handled;
            }
            continue;
        }

        it = m_handlers.find(id);
        if (it != m_handlers.end()) {
            it->second.record_execution(now);
        }
        ++m_stats.handlers_executed_total;
    }

    std::vector<TriggerId> trigger_ids;
    trigger_ids.reserve(m_triggers.size());
    for (const auto& [id, trigger] : m_triggers) {
        trigger_ids.push_back(id);
    }

    for (TriggerId id : trigger_ids) {
        auto it = m_triggers.find(id);
        if (it == m_triggers.end() || !it->second.enabled) {
            continue;
        }
        if (!it->second.condition.evaluate(event, m_hooks)) {
            continue;
        }
        auto fired = fire_trigger(it->second, event);
        if (!fired) {
            return fired;
        }
    }

    ++m_stats.events_processed_total;
    return Ok();
}

Result<void> EventSystem::fire_trigger(EventTrigger& trigger, const Event& event) {
    const auto now = m_context.now;
    const TriggerId id = trigger.id;
    const std::string name = trigger.name;

    switch (trigger.trigger_type.kind) {
        case TriggerType::Kind::Once:
        case TriggerType::Kind::Immediate: {
            const bool once = trigger.trigger_type.kind == TriggerType::Kind::Once;
            if (once && trigger.activation_count != 0) {
                return Ok();
            }
            const EventAction action = trigger.action;
            auto result = action.execute(event, m_context, m_hooks);
            if (!result) {
                return handle_action_result(std::move(result), "trigger", name);
            }

            // The action may have removed the trigger through a hook
            auto it = m_triggers.find(id);
            if (it != m_triggers.end()) {
                it->second.record_activation(now);
                if (once) {
                    it->second.enabled = false;
                }
            }
            ++m_stats.triggers_activated_total;
            return Ok();
        }

        case TriggerType::Kind::Delayed:
            m_context.schedule(now + cortex_core::Milliseconds(trigger.trigger_type.ms),
                               trigger.action, event, id);
            return Ok();

        case TriggerType::Kind::Interval:
            if (!trigger.interval_armed) {
                trigger.interval_armed = true;
                m_context.schedule(now + cortex_core::Milliseconds(trigger.trigger_type.ms),
                                   trigger.action, event, id);
            }
            return Ok();
    }
    return Ok();
}

Result<void> EventSystem::process_delayed_actions() {
    const auto now = m_context.now;

    auto& pending = m_context.delayed_actions;
    auto split = std::stable_partition(pending.begin(), pending.end(),
        [now](const DelayedAction& action) {
            return action.execute_at > now;
        });
    std::vector<DelayedAction> due(std::make_move_iterator(split), std::make_move_iterator(pending.end()));
    pending.erase(split, pending.end());

    for (auto& delayed : due) {
        if (!delayed.trigger_id) {
            ++m_stats.delayed_actions_executed;
            auto result = handle_action_result(
                delayed.action.execute(delayed.event, m_context, m_hooks), "delayed action",
                id_string(delayed.id.id));
            if (!result) {
                return result;
            }
            continue;
        }

        // Timed trigger firing; skipped once the trigger is disabled or gone
        auto it = m_triggers.find(*delayed.trigger_id);
        if (it == m_triggers.end()) {
            continue;
        }
        EventTrigger& trigger = it->second;
        const auto kind = trigger.trigger_type.kind;
        if (!trigger.enabled ||
            (kind != TriggerType::Kind::Delayed && kind != TriggerType::Kind::Interval)) {
            trigger.interval_armed = false;
            continue;
        }

        const std::string name = trigger.name;
        const TriggerId trigger_id = trigger.id;
        const EventAction action = trigger.action;
        if (kind == TriggerType::Kind::Interval) {
            m_context.schedule(now + cortex_core::Milliseconds(trigger.trigger_type.ms),
                               action, delayed.event, trigger_id);
        }

        auto result = action.execute(delayed.event, m_context, m_hooks);
        if (!result) {
            auto handled = handle_action_result(std::move(result), "trigger", name);
            if (!handled) {
                return handled;
            }
            continue;
        }

        it = m_triggers.find(trigger_id);
        if (it != m_triggers.end()) {
            it->second.record_activation(now);
        }
        ++m_stats.triggers_activated_total;
        ++m_stats.delayed_actions_executed;
    }
    return Ok();
}

Result<void> EventSystem::handle_action_result(Result<void> result, const char* origin, const std::string& name) {
    if (result) {
        return result;
    }

    Error error = std::move(result.error());
    error.with_context(origin, name);

    if (!m_config.isolate_action_errors) {
        return Err(std::move(error));
    }

    ++m_stats.action_errors;
    cortex_core::debug::record_error(error);
    cortex_core::event_logger()->error("Action failed in {} '{}': {}",
                                       origin, name, cortex_core::build_error_chain(error));
    return Ok();
}

void EventSystem::clear_all_events() {
    for (auto& queue : m_queues) {
        queue.clear();
    }
    m_context.clear();
}

std::size_t EventSystem::total_queue_size() const {
    std::size_t total = 0;
    for (const auto& queue : m_queues) {
        total += queue.size();
    }
    return total;
}

std::size_t EventSystem::queue_size(Priority priority) const {
    return m_queues[static_cast<std::size_t>(priority)].size();
}

void EventSystem::refresh_queue_sizes() {
    for (Priority priority : k_processing_order) {
        m_stats.queue_sizes[priority_name(priority)] = static_cast<std::uint32_t>(queue_size(priority));
    }
}

void EventSystem::set_time_source(cortex_core::TimeSource source) {
    m_time_source = source ? std::move(source) : cortex_core::steady_time_source();
}

} // namespace cortex_event
