#pragma once

/// @file events.hpp
/// @brief Main include header for cortex_event
///
/// cortex_event routes named events to handlers and triggers:
/// - Four priority buckets drained Critical to Low, FIFO within a bucket
/// - Handlers matched by name pattern, cooldown and condition
/// - Triggers firing immediately, once, after a delay or on an interval
/// - Condition and action expression trees with named custom hooks
/// - A bounded GlobalEventBus for external subscribers
///
/// ## Quick Start
/// ```cpp
/// using namespace cortex_event::prelude;
///
/// EventSystem events;
/// events.initialize();
///
/// events.register_handler("player_*",
///     EventCondition::key_exists("health"),
///     EventAction::conditional(EventCondition::key_less("health", 25.0f),
///                              EventAction::set_variable("low_health", true)));
///
/// events.trigger_event(EventBuilder("player_update")
///     .with_data("health", 10)
///     .build());
///
/// // Each frame
/// events.update(dt);
/// ```
///
/// Actions never dispatch synchronously: TriggerEvent queues a follow-up
/// event after the current pass and Delay schedules work for a later update.

#include "fwd.hpp"
#include "event.hpp"
#include "condition.hpp"
#include "action.hpp"
#include "hooks.hpp"
#include "handler.hpp"
#include "event_bus.hpp"
#include "config.hpp"
#include "event_system.hpp"

namespace cortex_event {

namespace prelude {
    using cortex_event::Priority;
    using cortex_event::Event;
    using cortex_event::EventBuilder;
    using cortex_event::EventData;
    using cortex_event::RuntimeValue;

    using cortex_event::EventCondition;
    using cortex_event::EventAction;
    using cortex_event::EventContext;

    using cortex_event::EventHandler;
    using cortex_event::HandlerBuilder;
    using cortex_event::EventTrigger;
    using cortex_event::TriggerType;

    using cortex_event::GlobalEventBus;
    using cortex_event::EventSystem;
    using cortex_event::EventSystemConfig;
}

} // namespace cortex_event
