// cortex_ai behavior node tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cortex/ai/ai.hpp>

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

using namespace cortex_ai;

namespace {

/// Action returning a fixed status and counting its ticks
BehaviorNodePtr fixed(NodeStatus status, int* ticks = nullptr) {
    return make_action("Fixed", [status, ticks](Blackboard&, float) {
        if (ticks) {
            ++*ticks;
        }
        return status;
    });
}

/// Action replaying a script of statuses, repeating the last one
BehaviorNodePtr scripted(std::vector<NodeStatus> script, int* ticks = nullptr) {
    auto index = std::make_shared<std::size_t>(0);
    return make_action("Scripted", [script = std::move(script), index, ticks](Blackboard&, float) {
        if (ticks) {
            ++*ticks;
        }
        auto status = script[std::min(*index, script.size() - 1)];
        ++*index;
        return status;
    });
}

} // anonymous namespace

// =============================================================================
// Composite Tests
// =============================================================================

TEST_CASE("SequenceNode: runs children in order", "[ai][nodes][sequence]") {
    Blackboard bb;

    SECTION("empty sequence succeeds") {
        SequenceNode seq;
        REQUIRE(seq.tick(bb, 0.016f) == NodeStatus::Success);
    }

    SECTION("all succeed") {
        SequenceNode seq;
        seq.add_child(fixed(NodeStatus::Success));
        seq.add_child(fixed(NodeStatus::Success));
        REQUIRE(seq.tick(bb, 0.016f) == NodeStatus::Success);
        REQUIRE(seq.current_child() == 0);
    }

    SECTION("failure stops the sequence") {
        int third = 0;
        SequenceNode seq;
        seq.add_child(fixed(NodeStatus::Success));
        seq.add_child(fixed(NodeStatus::Failure));
        seq.add_child(fixed(NodeStatus::Success, &third));
        REQUIRE(seq.tick(bb, 0.016f) == NodeStatus::Failure);
        REQUIRE(third == 0);
        REQUIRE(seq.current_child() == 0);
    }

    SECTION("running child is resumed without re-ticking earlier children") {
        int first = 0;
        SequenceNode seq;
        seq.add_child(fixed(NodeStatus::Success, &first));
        seq.add_child(scripted({NodeStatus::Running, NodeStatus::Success}));

        REQUIRE(seq.tick(bb, 0.016f) == NodeStatus::Running);
        REQUIRE(seq.current_child() == 1);
        REQUIRE(seq.tick(bb, 0.016f) == NodeStatus::Success);
        REQUIRE(first == 1);
    }

    SECTION("invalid child propagates") {
        SequenceNode seq;
        seq.add_child(std::make_unique<InverterNode>());
        REQUIRE(seq.tick(bb, 0.016f) == NodeStatus::Invalid);
    }
}

TEST_CASE("SelectorNode: first success wins", "[ai][nodes][selector]") {
    Blackboard bb;

    SECTION("empty selector fails") {
        SelectorNode sel;
        REQUIRE(sel.tick(bb, 0.016f) == NodeStatus::Failure);
    }

    SECTION("falls through failures") {
        int last = 0;
        SelectorNode sel;
        sel.add_child(fixed(NodeStatus::Failure));
        sel.add_child(fixed(NodeStatus::Success));
        sel.add_child(fixed(NodeStatus::Success, &last));
        REQUIRE(sel.tick(bb, 0.016f) == NodeStatus::Success);
        REQUIRE(last == 0);
    }

    SECTION("invalid child is skipped") {
        SelectorNode sel;
        sel.add_child(std::make_unique<RetryNode>());
        sel.add_child(fixed(NodeStatus::Success));
        REQUIRE(sel.tick(bb, 0.016f) == NodeStatus::Success);
    }

    SECTION("all fail") {
        SelectorNode sel;
        sel.add_child(fixed(NodeStatus::Failure));
        sel.add_child(fixed(NodeStatus::Failure));
        REQUIRE(sel.tick(bb, 0.016f) == NodeStatus::Failure);
        REQUIRE(sel.current_child() == 0);
    }
}

TEST_CASE("SelectorNode: De Morgan duality with Sequence", "[ai][nodes][selector]") {
    Blackboard bb;
    const std::array<NodeStatus, 2> outcomes{NodeStatus::Success, NodeStatus::Failure};

    for (auto a : outcomes) {
        for (auto b : outcomes) {
            for (auto c : outcomes) {
                SelectorNode sel;
                sel.add_child(fixed(a));
                sel.add_child(fixed(b));
                sel.add_child(fixed(c));

                auto seq = std::make_unique<SequenceNode>();
                seq->add_child(std::make_unique<InverterNode>(fixed(a)));
                seq->add_child(std::make_unique<InverterNode>(fixed(b)));
                seq->add_child(std::make_unique<InverterNode>(fixed(c)));
                InverterNode dual(std::move(seq));

                REQUIRE(sel.tick(bb, 0.016f) == dual.tick(bb, 0.016f));
            }
        }
    }
}

TEST_CASE("ParallelNode: policies", "[ai][nodes][parallel]") {
    Blackboard bb;

    SECTION("empty parallel succeeds") {
        ParallelNode par;
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Success);
    }

    SECTION("RequireAll success waits for running children") {
        ParallelNode par(ParallelPolicy::RequireAll, ParallelPolicy::RequireAll);
        par.add_child(fixed(NodeStatus::Success));
        par.add_child(scripted({NodeStatus::Running, NodeStatus::Success}));

        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Running);
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Success);
    }

    SECTION("RequireOne success") {
        ParallelNode par(ParallelPolicy::RequireOne, ParallelPolicy::RequireAll);
        par.add_child(fixed(NodeStatus::Failure));
        par.add_child(fixed(NodeStatus::Success));
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Success);
    }

    SECTION("RequireOne failure") {
        ParallelNode par(ParallelPolicy::RequireAll, ParallelPolicy::RequireOne);
        par.add_child(fixed(NodeStatus::Success));
        par.add_child(fixed(NodeStatus::Failure));
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Failure);
    }

    SECTION("success threshold is checked first") {
        ParallelNode par(ParallelPolicy::RequireOne, ParallelPolicy::RequireOne);
        par.add_child(fixed(NodeStatus::Failure));
        par.add_child(fixed(NodeStatus::Success));
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Success);
    }

    SECTION("invalid counts as failure") {
        ParallelNode par(ParallelPolicy::RequireAll, ParallelPolicy::RequireOne);
        par.add_child(fixed(NodeStatus::Success));
        par.add_child(std::make_unique<InverterNode>());
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Failure);
    }

    SECTION("no threshold met and nothing running fails") {
        ParallelNode par(ParallelPolicy::RequireAll, ParallelPolicy::RequireAll);
        par.add_child(fixed(NodeStatus::Success));
        par.add_child(fixed(NodeStatus::Failure));
        REQUIRE(par.tick(bb, 0.016f) == NodeStatus::Failure);
    }
}

// =============================================================================
// Decorator Tests
// =============================================================================

TEST_CASE("InverterNode", "[ai][nodes][decorator]") {
    Blackboard bb;

    REQUIRE(InverterNode(fixed(NodeStatus::Success)).tick(bb, 0.0f) == NodeStatus::Failure);
    REQUIRE(InverterNode(fixed(NodeStatus::Failure)).tick(bb, 0.0f) == NodeStatus::Success);
    REQUIRE(InverterNode(fixed(NodeStatus::Running)).tick(bb, 0.0f) == NodeStatus::Running);
    REQUIRE(InverterNode().tick(bb, 0.0f) == NodeStatus::Invalid);
}

TEST_CASE("RetryNode: bounded attempts", "[ai][nodes][decorator]") {
    Blackboard bb;

    SECTION("always failing child fails after max attempts") {
        int ticks = 0;
        RetryNode retry(fixed(NodeStatus::Failure, &ticks), 3);

        REQUIRE(retry.tick(bb, 0.0f) == NodeStatus::Running);
        REQUIRE(retry.current_attempts() == 1);
        REQUIRE(retry.tick(bb, 0.0f) == NodeStatus::Running);
        REQUIRE(retry.tick(bb, 0.0f) == NodeStatus::Failure);
        REQUIRE(ticks == 3);
        REQUIRE(retry.current_attempts() == 0);
    }

    SECTION("success resets the attempt counter") {
        RetryNode retry(scripted({NodeStatus::Failure, NodeStatus::Success}), 3);
        REQUIRE(retry.tick(bb, 0.0f) == NodeStatus::Running);
        REQUIRE(retry.tick(bb, 0.0f) == NodeStatus::Success);
        REQUIRE(retry.current_attempts() == 0);
    }

    SECTION("missing child") {
        RetryNode retry;
        REQUIRE(retry.tick(bb, 0.0f) == NodeStatus::Invalid);
    }
}

TEST_CASE("RepeaterNode: counted runs", "[ai][nodes][decorator]") {
    Blackboard bb;

    SECTION("completes after N runs regardless of outcome") {
        int ticks = 0;
        RepeaterNode repeater(
            scripted({NodeStatus::Success, NodeStatus::Failure, NodeStatus::Success}, &ticks), 3u);

        REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Running);
        REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Running);
        REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Success);
        REQUIRE(ticks == 3);
        REQUIRE(repeater.current_count() == 3);

        // Already complete: the child is not ticked again
        REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Success);
        REQUIRE(ticks == 3);
    }

    SECTION("running child does not count") {
        RepeaterNode repeater(scripted({NodeStatus::Running, NodeStatus::Success}), 1u);
        REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Running);
        REQUIRE(repeater.current_count() == 0);
        REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Success);
    }

    SECTION("unbounded repeater keeps running") {
        RepeaterNode repeater(fixed(NodeStatus::Success));
        for (int i = 0; i < 10; ++i) {
            REQUIRE(repeater.tick(bb, 0.0f) == NodeStatus::Running);
        }
        REQUIRE(repeater.current_count() == 10);
    }
}

// =============================================================================
// Leaf Tests
// =============================================================================

TEST_CASE("ActionNode and ConditionNode", "[ai][nodes][leaf]") {
    Blackboard bb;
    bb.set_int("health", 10);

    ConditionNode alive("Alive", [](const Blackboard& b) { return b.get_int("health") > 0; });
    REQUIRE(alive.tick(bb, 0.0f) == NodeStatus::Success);

    bb.set_int("health", 0);
    REQUIRE(alive.tick(bb, 0.0f) == NodeStatus::Failure);

    ActionNode heal("Heal", [](Blackboard& b, float) {
        b.set_int("health", 100);
        return NodeStatus::Success;
    });
    REQUIRE(heal.tick(bb, 0.0f) == NodeStatus::Success);
    REQUIRE(bb.get_int("health") == 100);
    REQUIRE(heal.status() == NodeStatus::Success);

    ActionNode empty(ActionCallback{});
    REQUIRE(empty.tick(bb, 0.0f) == NodeStatus::Invalid);
}

TEST_CASE("WaitNode: accumulates delta time", "[ai][nodes][leaf]") {
    Blackboard bb;
    WaitNode wait("Wait", "test", 1.0f);

    auto run = [&]() {
        REQUIRE(wait.tick(bb, 0.3f) == NodeStatus::Running);
        REQUIRE(wait.tick(bb, 0.3f) == NodeStatus::Running);
        REQUIRE(wait.tick(bb, 0.3f) == NodeStatus::Running);
        REQUIRE(wait.tick(bb, 0.3f) == NodeStatus::Success);
        REQUIRE(wait.elapsed() == Catch::Approx(1.2f));
    };

    run();
    wait.reset();
    REQUIRE(wait.elapsed() == 0.0f);
    run();
}

// =============================================================================
// Reset Tests
// =============================================================================

TEST_CASE("Node reset is idempotent", "[ai][nodes][reset]") {
    Blackboard bb;

    auto build = []() {
        auto seq = std::make_unique<SequenceNode>();
        seq->add_child(std::make_unique<WaitNode>(0.5f));
        seq->add_child(std::make_unique<RetryNode>(fixed(NodeStatus::Failure), 2));
        return seq;
    };

    auto used = build();
    REQUIRE(used->tick(bb, 0.3f) == NodeStatus::Running);
    REQUIRE(used->tick(bb, 0.3f) == NodeStatus::Running);
    used->reset();
    used->reset();

    auto fresh = build();
    for (int i = 0; i < 4; ++i) {
        REQUIRE(used->tick(bb, 0.3f) == fresh->tick(bb, 0.3f));
        REQUIRE(used->current_child() == fresh->current_child());
    }
}

TEST_CASE("Node depth", "[ai][nodes]") {
    REQUIRE(WaitNode(1.0f).depth() == 1);
    REQUIRE(InverterNode().depth() == 1);

    auto seq = std::make_unique<SequenceNode>();
    seq->add_child(std::make_unique<InverterNode>(fixed(NodeStatus::Success)));
    seq->add_child(fixed(NodeStatus::Success));
    REQUIRE(seq->depth() == 3);
    REQUIRE(seq->child_count() == 2);
}
