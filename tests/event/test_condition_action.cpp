// cortex_event condition, action and hook tests

#include <catch2/catch_test_macros.hpp>
#include <cortex/event/events.hpp>

using namespace cortex_event;
using cortex_core::ErrorCode;
using cortex_core::EventError;
using cortex_core::ValueArray;

namespace {

Event damaged(float health) {
    return Event("player_damaged", EventData{{"health", RuntimeValue(health)}, {"source", RuntimeValue("fall")}});
}

} // anonymous namespace

TEST_CASE("Event: construction", "[event][event]") {
    auto a = Event("a");
    auto b = EventBuilder("b")
        .with_data("x", RuntimeValue(1))
        .with_priority(Priority::High)
        .with_source("test")
        .build();

    REQUIRE(a.id().is_valid());
    REQUIRE(b.id() > a.id());
    REQUIRE(a.priority() == Priority::Normal);
    REQUIRE(a.source() == "unknown");
    REQUIRE(b.priority() == Priority::High);
    REQUIRE(b.source() == "test");
    REQUIRE(b.get_data("x")->as_int() == 1);
    REQUIRE_FALSE(b.has_data("y"));

    b.stop_propagation();
    REQUIRE(b.is_propagation_stopped());

    REQUIRE(std::string(priority_name(Priority::Critical)) == "critical");
}

TEST_CASE("EventCondition: evaluation", "[event][condition]") {
    HookRegistry hooks;
    auto event = damaged(10.0f);

    SECTION("constants") {
        REQUIRE(EventCondition::always().evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::never().evaluate(event, hooks));
        REQUIRE(EventCondition().evaluate(event, hooks));
    }

    SECTION("key checks") {
        REQUIRE(EventCondition::key_exists("health").evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::key_exists("mana").evaluate(event, hooks));

        REQUIRE(EventCondition::key_equals("source", RuntimeValue("fall")).evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::key_equals("source", RuntimeValue("fire")).evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::key_equals("mana", RuntimeValue(0)).evaluate(event, hooks));
    }

    SECTION("thresholds are strict") {
        REQUIRE(EventCondition::key_less("health", 25.0f).evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::key_less("health", 10.0f).evaluate(event, hooks));
        REQUIRE(EventCondition::key_greater("health", 5.0f).evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::key_greater("health", 10.0f).evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::key_greater("mana", -1.0f).evaluate(event, hooks));
    }

    SECTION("combinators") {
        auto low = EventCondition::key_less("health", 25.0f);
        auto has_mana = EventCondition::key_exists("mana");

        REQUIRE_FALSE(EventCondition::both(low, has_mana).evaluate(event, hooks));
        REQUIRE(EventCondition::either(low, has_mana).evaluate(event, hooks));
        REQUIRE(EventCondition::negate(has_mana).evaluate(event, hooks));
    }

    SECTION("custom conditions") {
        REQUIRE(hooks.register_condition("is_fall", [](const Event& e) {
            return e.get_data("source") && e.get_data("source")->as_string() == "fall";
        }).is_ok());

        REQUIRE(EventCondition::custom("is_fall").evaluate(event, hooks));
        REQUIRE_FALSE(EventCondition::custom("unknown").evaluate(event, hooks));
        REQUIRE(hooks.conditions_evaluated() == 1);
    }

    SECTION("both operands of a combinator are evaluated") {
        REQUIRE(hooks.register_condition("yes", [](const Event&) { return true; }).is_ok());

        auto either = EventCondition::either(EventCondition::custom("yes"), EventCondition::custom("yes"));
        REQUIRE(either.evaluate(event, hooks));
        REQUIRE(hooks.conditions_evaluated() == 2);
    }

    SECTION("description") {
        auto cond = EventCondition::both(EventCondition::key_exists("a"),
                                         EventCondition::negate(EventCondition::custom("b")));
        REQUIRE(cond.to_string() == "And(KeyExists(a), Not(Custom(b)))");
    }
}

TEST_CASE("HookRegistry: registration", "[event][hooks]") {
    HookRegistry hooks;

    SECTION("rejects empty names and callbacks") {
        auto unnamed = hooks.register_condition("", [](const Event&) { return true; });
        REQUIRE(unnamed.is_err());
        REQUIRE(unnamed.error().is<EventError>());
        REQUIRE(unnamed.error().code() == ErrorCode::InvalidArgument);

        REQUIRE(hooks.register_action("noop", CustomAction{}).is_err());
        REQUIRE(hooks.condition_count() == 0);
        REQUIRE(hooks.action_count() == 0);
    }

    SECTION("re-registration replaces") {
        int calls = 0;
        REQUIRE(hooks.register_condition("c", [](const Event&) { return false; }).is_ok());
        REQUIRE(hooks.register_condition("c", [&calls](const Event&) { ++calls; return true; }).is_ok());
        REQUIRE(hooks.condition_count() == 1);

        REQUIRE(hooks.evaluate_condition("c", Event("e")) == true);
        REQUIRE(calls == 1);
    }

    SECTION("removal and clear") {
        REQUIRE(hooks.register_function("f", [](const ValueArray&, EventContext&) -> Result<void> {
            return cortex_core::Ok();
        }).is_ok());
        REQUIRE(hooks.has_function("f"));
        REQUIRE(hooks.remove_function("f"));
        REQUIRE_FALSE(hooks.remove_function("f"));

        REQUIRE(hooks.register_condition("c", [](const Event&) { return true; }).is_ok());
        hooks.clear();
        REQUIRE_FALSE(hooks.has_condition("c"));
    }

    SECTION("unknown hooks") {
        EventContext context;
        REQUIRE_FALSE(hooks.evaluate_condition("missing", Event("e")).has_value());

        auto action = hooks.execute_action("missing", Event("e"), context);
        REQUIRE(action.is_err());
        REQUIRE(action.error().message().find("missing") != std::string::npos);

        auto function = hooks.call_function("missing", {}, context);
        REQUIRE(function.is_ok());
        REQUIRE_FALSE(*function);
        REQUIRE(hooks.functions_called() == 0);
    }
}

TEST_CASE("EventAction: execution", "[event][action]") {
    HookRegistry hooks;
    EventContext context;
    auto event = damaged(10.0f);

    SECTION("set variable") {
        REQUIRE(EventAction::set_variable("hp", RuntimeValue(10)).execute(event, context, hooks).is_ok());
        REQUIRE(context.get_variable("hp")->as_int() == 10);

        REQUIRE(EventAction::set_variable("hp", RuntimeValue(3)).execute(event, context, hooks).is_ok());
        REQUIRE(context.get_variable("hp")->as_int() == 3);
    }

    SECTION("log message has no side effects") {
        REQUIRE(EventAction::log_message("hello").execute(event, context, hooks).is_ok());
        REQUIRE(context.variables.empty());
        REQUIRE(context.triggered_events.empty());
    }

    SECTION("trigger event") {
        auto action = EventAction::trigger_event("alarm", EventData{{"level", RuntimeValue(2)}});
        REQUIRE(action.execute(event, context, hooks).is_ok());

        REQUIRE(context.triggered_events.size() == 1);
        const auto& raised = context.triggered_events[0];
        REQUIRE(raised.name() == "alarm");
        REQUIRE(raised.get_data("level")->as_int() == 2);
        REQUIRE(raised.priority() == Priority::Normal);
        REQUIRE(raised.source() == "triggered_by_" + std::to_string(event.id().id));

        context.clear();
        REQUIRE(context.triggered_events.empty());
    }

    SECTION("call function") {
        ValueArray received;
        REQUIRE(hooks.register_function("spawn", [&received](const ValueArray& args, EventContext&) -> Result<void> {
            received = args;
            return cortex_core::Ok();
        }).is_ok());

        auto call = EventAction::call_function("spawn", ValueArray{RuntimeValue("orc"), RuntimeValue(3)});
        REQUIRE(call.execute(event, context, hooks).is_ok());
        REQUIRE(received.size() == 2);
        REQUIRE(received[1].as_int() == 3);
        REQUIRE(hooks.functions_called() == 1);

        REQUIRE(EventAction::call_function("unregistered").execute(event, context, hooks).is_ok());
    }

    SECTION("failing function propagates") {
        REQUIRE(hooks.register_function("fail", [](const ValueArray&, EventContext&) -> Result<void> {
            return cortex_core::Err(cortex_core::Error(EventError::action_failed("fail", "boom")));
        }).is_ok());

        auto result = EventAction::call_function("fail").execute(event, context, hooks);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidState);
    }

    SECTION("sequence stops at the first error") {
        auto seq = EventAction::sequence({
            EventAction::set_variable("first", RuntimeValue(true)),
            EventAction::custom("missing"),
            EventAction::set_variable("second", RuntimeValue(true)),
        });

        auto result = seq.execute(event, context, hooks);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(context.get_variable("first") != nullptr);
        REQUIRE(context.get_variable("second") == nullptr);
    }

    SECTION("conditional branches") {
        auto branch = EventAction::conditional(
            EventCondition::key_less("health", 25.0f),
            EventAction::set_variable("low", RuntimeValue(true)),
            EventAction::set_variable("low", RuntimeValue(false)));

        REQUIRE(branch.execute(damaged(10.0f), context, hooks).is_ok());
        REQUIRE(context.get_variable("low")->as_bool());

        REQUIRE(branch.execute(damaged(90.0f), context, hooks).is_ok());
        REQUIRE_FALSE(context.get_variable("low")->as_bool());
    }

    SECTION("conditional without else does nothing when false") {
        auto branch = EventAction::conditional(EventCondition::never(),
                                               EventAction::set_variable("x", RuntimeValue(1)));
        REQUIRE(branch.execute(event, context, hooks).is_ok());
        REQUIRE(context.variables.empty());
    }

    SECTION("delay schedules relative to the context clock") {
        context.now = cortex_core::TimePoint{} + cortex_core::Milliseconds(1000);
        auto delayed = EventAction::delay(500, EventAction::set_variable("late", RuntimeValue(true)));

        REQUIRE(delayed.execute(event, context, hooks).is_ok());
        REQUIRE(context.variables.empty());
        REQUIRE(context.delayed_actions.size() == 1);

        const auto& pending = context.delayed_actions[0];
        REQUIRE(pending.id.is_valid());
        REQUIRE(pending.execute_at == context.now + cortex_core::Milliseconds(500));
        REQUIRE(pending.event.id() == event.id());
        REQUIRE_FALSE(pending.trigger_id.has_value());
    }

    SECTION("custom actions") {
        REQUIRE(hooks.register_action("mark", [](const Event& e, EventContext& ctx) -> Result<void> {
            ctx.variables.insert_or_assign("marked", RuntimeValue(e.name()));
            return cortex_core::Ok();
        }).is_ok());

        REQUIRE(EventAction::custom("mark").execute(event, context, hooks).is_ok());
        REQUIRE(context.get_variable("marked")->as_string() == "player_damaged");
        REQUIRE(hooks.actions_executed() == 1);

        auto missing = EventAction::custom("absent").execute(event, context, hooks);
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().message() == "Custom action 'absent' not found");
    }
}

TEST_CASE("EventHandler: matching", "[event][handler]") {
    SECTION("patterns") {
        REQUIRE(pattern_matches("*", "anything"));
        REQUIRE(pattern_matches("player_*", "player_damaged"));
        REQUIRE(pattern_matches("*_damaged", "npc_damaged"));
        REQUIRE(pattern_matches("player_*", "old_player_x"));
        REQUIRE_FALSE(pattern_matches("player_*", "npc_damaged"));
        REQUIRE(pattern_matches("ping", "ping"));
        REQUIRE_FALSE(pattern_matches("ping", "ping_pong"));
    }

    SECTION("builder") {
        auto handler = HandlerBuilder("watch", "player_*")
            .with_condition(EventCondition::key_exists("health"))
            .with_cooldown(250)
            .disabled()
            .build();

        REQUIRE(handler.name == "watch");
        REQUIRE(handler.matches(damaged(1.0f)));
        REQUIRE(handler.cooldown_ms == 250u);
        REQUIRE_FALSE(handler.enabled);
        REQUIRE_FALSE(handler.can_execute(cortex_core::TimePoint{}));
        REQUIRE(handler.action.kind() == EventAction::Kind::LogMessage);
    }

    SECTION("cooldown window") {
        auto handler = HandlerBuilder("cd", "ping").with_cooldown(1000).build();
        const auto t0 = cortex_core::TimePoint{} + cortex_core::Milliseconds(5000);

        REQUIRE(handler.can_execute(t0));
        handler.record_execution(t0);
        REQUIRE(handler.execution_count == 1);
        REQUIRE_FALSE(handler.can_execute(t0 + cortex_core::Milliseconds(999)));
        REQUIRE(handler.can_execute(t0 + cortex_core::Milliseconds(1000)));
    }
}

TEST_CASE("TriggerType", "[event][trigger]") {
    REQUIRE(TriggerType{} == TriggerType::immediate());
    REQUIRE(TriggerType::delayed(100).ms == 100);
    REQUIRE_FALSE(TriggerType::interval(100) == TriggerType::delayed(100));
    REQUIRE(std::string(trigger_kind_name(TriggerType::Kind::Once)) == "Once");

    EventTrigger trigger("t", EventCondition::always(), EventAction::log_message("x"));
    trigger.with_trigger_type(TriggerType::interval(50));
    REQUIRE(trigger.trigger_type.kind == TriggerType::Kind::Interval);
    REQUIRE(trigger.enabled);
    REQUIRE(trigger.activation_count == 0);
}
