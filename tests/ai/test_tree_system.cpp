// cortex_ai BehaviorTreeSystem tests

#include <catch2/catch_test_macros.hpp>
#include <cortex/ai/ai.hpp>
#include <cortex/core/time.hpp>

#include <filesystem>

using namespace cortex_ai;
using cortex_core::ErrorCode;
using cortex_core::ManualClock;
using cortex_core::TreeError;

namespace {

BehaviorNodePtr advancing_action(ManualClock& clock, std::int64_t ms, int* ticks) {
    return make_action("slow", [&clock, ms, ticks](Blackboard&, float) {
        clock.advance_ms(ms);
        ++*ticks;
        return NodeStatus::Success;
    });
}

} // anonymous namespace

TEST_CASE("BehaviorTreeSystem: heal scenario", "[ai][system]") {
    ManualClock clock;
    BehaviorTreeSystem system;
    system.set_time_source(clock.source());
    REQUIRE(system.initialize().is_ok());

    auto id = system.create_tree("healer");
    auto root = std::make_unique<SequenceNode>("heal");
    root->add_child(make_condition("alive", [](const Blackboard& bb) {
        return bb.get_float("health") > 0.0f;
    }));
    root->add_child(std::make_unique<WaitNode>(1.0f));
    root->add_child(make_action("heal", [](Blackboard& bb, float) {
        bb.set_bool("healed", true);
        return NodeStatus::Success;
    }));
    system.get_tree(id)->set_root(std::move(root));

    REQUIRE(system.assign_tree_to_entity("npc", id).is_ok());
    REQUIRE(system.update_blackboard("npc", "health", RuntimeValue(100.0f)).is_ok());

    system.update(1.1f);

    REQUIRE(system.get_tree(id)->last_status() == NodeStatus::Success);
    auto healed = system.get_blackboard_value("npc", "healed");
    REQUIRE(healed.is_ok());
    REQUIRE(healed->has_value());
    REQUIRE((*healed)->as_bool());
}

TEST_CASE("BehaviorTreeSystem: tree management", "[ai][system]") {
    BehaviorTreeSystem system;

    auto first = system.create_tree("alpha");
    auto second = system.create_tree("beta");

    REQUIRE(first != second);
    REQUIRE(system.tree_count() == 2);
    REQUIRE(system.get_tree_names() == std::vector<std::string>{"alpha", "beta"});

    SECTION("created trees are inactive until assigned") {
        REQUIRE(system.get_tree_status(first) == false);
        REQUIRE(system.get_active_tree_count() == 0);

        REQUIRE(system.assign_tree_to_entity("e1", first).is_ok());
        REQUIRE(system.get_tree_status(first) == true);
        REQUIRE(system.get_active_tree_count() == 1);
        REQUIRE(system.get_tree(first)->entity_id() == "e1");
    }

    SECTION("pause and resume") {
        REQUIRE(system.assign_tree_to_entity("e1", first).is_ok());
        REQUIRE(system.pause_tree(first).is_ok());
        REQUIRE(system.get_tree_status(first) == false);
        REQUIRE(system.get_active_tree_count() == 0);

        REQUIRE(system.resume_tree(first).is_ok());
        REQUIRE(system.get_active_tree_count() == 1);
    }

    SECTION("reassignment replaces the mapping") {
        REQUIRE(system.assign_tree_to_entity("e1", first).is_ok());
        REQUIRE(system.assign_tree_to_entity("e1", second).is_ok());
        REQUIRE(system.tree_for_entity("e1") == second);
    }

    SECTION("remove purges entity mappings") {
        REQUIRE(system.assign_tree_to_entity("e1", first).is_ok());
        REQUIRE(system.assign_tree_to_entity("e2", first).is_ok());
        REQUIRE(system.remove_tree(first).is_ok());

        REQUIRE(system.get_tree(first) == nullptr);
        REQUIRE_FALSE(system.tree_for_entity("e1").has_value());
        REQUIRE_FALSE(system.tree_for_entity("e2").has_value());
        REQUIRE_FALSE(system.get_tree_status(first).has_value());
        REQUIRE(system.get_tree_names() == std::vector<std::string>{"beta"});
    }

    SECTION("unknown ids are reported") {
        BehaviorTreeId missing{999};

        auto assigned = system.assign_tree_to_entity("e1", missing);
        REQUIRE(assigned.is_err());
        REQUIRE(assigned.error().code() == ErrorCode::NotFound);
        REQUIRE(assigned.error().is<TreeError>());
        REQUIRE(assigned.error().get_context("entity") != nullptr);

        REQUIRE(system.pause_tree(missing).is_err());
        REQUIRE(system.resume_tree(missing).is_err());
        REQUIRE(system.remove_tree(missing).is_err());
        REQUIRE_FALSE(system.tree_for_entity("e1").has_value());
    }

    SECTION("shutdown releases everything") {
        REQUIRE(system.assign_tree_to_entity("e1", first).is_ok());
        REQUIRE(system.shutdown().is_ok());
        REQUIRE(system.tree_count() == 0);
        REQUIRE_FALSE(system.tree_for_entity("e1").has_value());
    }
}

TEST_CASE("BehaviorTreeSystem: blackboard access", "[ai][system]") {
    BehaviorTreeSystem system;

    SECTION("unassigned entities are rejected") {
        auto set = system.update_blackboard("ghost", "hp", RuntimeValue(1));
        REQUIRE(set.is_err());
        REQUIRE(set.error().code() == ErrorCode::InvalidArgument);

        auto get = system.get_blackboard_value("ghost", "hp");
        REQUIRE(get.is_err());
    }

    SECTION("absent keys are not errors") {
        auto id = system.create_tree("t");
        REQUIRE(system.assign_tree_to_entity("e", id).is_ok());

        auto get = system.get_blackboard_value("e", "missing");
        REQUIRE(get.is_ok());
        REQUIRE_FALSE(get->has_value());
    }

    SECTION("shared store reaches every tree") {
        auto a = system.create_tree("a");
        auto b = system.create_tree("b");
        REQUIRE(system.assign_tree_to_entity("ea", a).is_ok());
        REQUIRE(system.assign_tree_to_entity("eb", b).is_ok());

        system.get_tree(a)->blackboard().set_shared("alarm", RuntimeValue(true));

        auto seen = system.get_blackboard_value("eb", "alarm");
        REQUIRE(seen.is_ok());
        REQUIRE(seen->has_value());
        REQUIRE((*seen)->as_bool());
        REQUIRE(system.shared_store()->count("alarm") == 1);
    }
}

TEST_CASE("BehaviorTreeSystem: blackboard sharing disabled", "[ai][system]") {
    TreeConfig config;
    config.enable_blackboard_sharing = false;
    BehaviorTreeSystem system(config);

    auto a = system.create_tree("a");
    auto b = system.create_tree("b");
    REQUIRE(system.assign_tree_to_entity("ea", a).is_ok());
    REQUIRE(system.assign_tree_to_entity("eb", b).is_ok());

    system.get_tree(a)->blackboard().set_shared("alarm", RuntimeValue(true));

    auto seen = system.get_blackboard_value("eb", "alarm");
    REQUIRE(seen.is_ok());
    REQUIRE_FALSE(seen->has_value());
}

TEST_CASE("BehaviorTreeSystem: update ticks active trees only", "[ai][system]") {
    ManualClock clock;
    BehaviorTreeSystem system;
    system.set_time_source(clock.source());

    int ticks_a = 0;
    int ticks_b = 0;
    auto a = system.create_tree("a");
    auto b = system.create_tree("b");
    system.get_tree(a)->set_root(advancing_action(clock, 0, &ticks_a));
    system.get_tree(b)->set_root(advancing_action(clock, 0, &ticks_b));

    REQUIRE(system.assign_tree_to_entity("ea", a).is_ok());
    system.update(0.016f);

    REQUIRE(ticks_a == 1);
    REQUIRE(ticks_b == 0);
    REQUIRE(system.stats().updates == 1);
    REQUIRE(system.stats().trees_ticked == 1);
}

TEST_CASE("BehaviorTreeSystem: empty time source", "[ai][system]") {
    ManualClock clock;
    BehaviorTreeSystem system;

    int ticks = 0;
    auto id = system.create_tree("fallback");
    system.get_tree(id)->set_root(advancing_action(clock, 0, &ticks));
    REQUIRE(system.assign_tree_to_entity("e", id).is_ok());

    // An empty source falls back to the steady clock
    system.set_time_source(cortex_core::TimeSource{});
    REQUIRE_NOTHROW(system.update(0.016f));
    REQUIRE(ticks == 1);

    system.get_tree(id)->set_time_source(cortex_core::TimeSource{});
    REQUIRE_NOTHROW(system.get_tree(id)->tick(0.016f));
}

TEST_CASE("BehaviorTreeSystem: execution budget", "[ai][system]") {
    ManualClock clock;
    TreeConfig config;
    config.max_execution_time_ms = 16;
    BehaviorTreeSystem system(config);
    system.set_time_source(clock.source());

    int ticks[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        auto id = system.create_tree("tree_" + std::to_string(i));
        system.get_tree(id)->set_root(advancing_action(clock, 20, &ticks[i]));
        REQUIRE(system.assign_tree_to_entity("e" + std::to_string(i), id).is_ok());
    }

    system.update(0.016f);

    REQUIRE(ticks[0] == 1);
    REQUIRE(ticks[1] == 0);
    REQUIRE(ticks[2] == 0);
    REQUIRE(system.stats().budget_overruns == 1);
    REQUIRE(system.stats().trees_skipped == 2);
    REQUIRE(system.get_active_tree_count() == 3);
}

TEST_CASE("BehaviorTreeSystem: depth limit", "[ai][system]") {
    TreeConfig config;
    config.max_depth = 2;
    BehaviorTreeSystem system(config);

    SECTION("deep trees are rejected") {
        auto tree = BehaviorTreeBuilder("deep", "e", 30.0f)
            .selector()
                .sequence()
                    .action("leaf", [](Blackboard&, float) { return NodeStatus::Success; })
            .build();
        REQUIRE(tree->depth() == 3);

        auto added = system.add_tree(std::move(tree));
        REQUIRE(added.is_err());
        REQUIRE(added.error().code() == ErrorCode::ValidationError);
        REQUIRE(system.tree_count() == 0);
    }

    SECTION("trees within the limit are accepted") {
        auto tree = BehaviorTreeBuilder("shallow", "e", 30.0f)
            .sequence()
                .action("leaf", [](Blackboard&, float) { return NodeStatus::Success; })
            .build();

        auto added = system.add_tree(std::move(tree));
        REQUIRE(added.is_ok());
        REQUIRE(system.get_tree(*added) != nullptr);
        REQUIRE(system.get_tree_status(*added) == false);
    }

    SECTION("null trees are rejected") {
        REQUIRE(system.add_tree(nullptr).is_err());
    }
}

TEST_CASE("BehaviorTreeSystem: debug snapshot", "[ai][system]") {
    SECTION("describes every tree") {
        BehaviorTreeSystem system;
        auto id = system.create_tree("watcher");
        system.get_tree(id)->set_root(make_wait(1.0f));
        REQUIRE(system.assign_tree_to_entity("e", id).is_ok());
        REQUIRE(system.update_blackboard("e", "hp", RuntimeValue(5)).is_ok());

        auto snapshot = system.debug_snapshot();
        REQUIRE(snapshot["trees"].size() == 1);

        const auto& tree = snapshot["trees"][0];
        REQUIRE(tree["name"] == "watcher");
        REQUIRE(tree["entity"] == "e");
        REQUIRE(tree["state"] == "Active");
        REQUIRE(tree["root"]["type"] == "Wait");
        REQUIRE(tree["blackboard"]["hp"] == 5);
        REQUIRE(snapshot["active_trees"] == 1);
    }

    SECTION("empty when debugging is disabled") {
        TreeConfig config;
        config.enable_debugging = false;
        BehaviorTreeSystem system(config);
        system.create_tree("hidden");
        REQUIRE(system.debug_snapshot().empty());
    }
}

TEST_CASE("TreeConfig", "[ai][config]") {
    SECTION("defaults are valid") {
        TreeConfig config;
        REQUIRE(config.validate().is_ok());
        REQUIRE(config.max_execution_time_ms == 16);
        REQUIRE(config.max_depth == 20);
    }

    SECTION("partial documents keep defaults") {
        auto config = TreeConfig::from_json_string(R"({"max_depth": 5, "tick_rate_hz": 60})");
        REQUIRE(config.is_ok());
        REQUIRE(config->max_depth == 5);
        REQUIRE(config->tick_rate_hz == 60.0f);
        REQUIRE(config->max_execution_time_ms == 16);
        REQUIRE(config->enable_blackboard_sharing);
    }

    SECTION("malformed JSON") {
        auto config = TreeConfig::from_json_string("{oops");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong field types") {
        REQUIRE(TreeConfig::from_json_string(R"({"max_depth": "deep"})").is_err());
        REQUIRE(TreeConfig::from_json_string(R"({"enable_debugging": 1})").is_err());
    }

    SECTION("out of range values") {
        auto config = TreeConfig::from_json_string(R"({"max_depth": 0})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ValidationError);

        TreeConfig bad;
        bad.tick_rate_hz = 0.0f;
        REQUIRE(bad.validate().is_err());
    }

    SECTION("serialized form parses back") {
        TreeConfig config;
        config.max_depth = 7;
        auto parsed = TreeConfig::from_json_string(config.to_json_string());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed->max_depth == 7);
    }

    SECTION("missing file") {
        auto config = TreeConfig::load(std::filesystem::path("/nonexistent/cortex_tree.json"));
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::IOError);
    }

    SECTION("invalid configuration fails initialize") {
        TreeConfig bad;
        bad.max_execution_time_ms = 0;
        BehaviorTreeSystem system(bad);
        REQUIRE(system.initialize().is_err());
    }
}
