/// @file ai.hpp
/// @brief Main header for cortex_ai module
///
/// Behavior tree scheduling for many independently controlled entities.
///
/// ## Behavior Trees
/// - Composite nodes: Sequence, Selector, Parallel
/// - Decorator nodes: Inverter, Repeater, Retry
/// - Leaf nodes: Action, Condition, Wait
/// - Nesting builder plus flat sequence/selector/parallel builders
/// - Per-entity blackboard with an optional process-wide shared namespace
///
/// ## Scheduling
/// BehaviorTreeSystem ticks every active tree once per update() in creation
/// order and defers the rest of the pass when the frame budget is spent.
///
/// ## Usage
///
/// ```cpp
/// #include <cortex/ai/ai.hpp>
///
/// using namespace cortex_ai::prelude;
///
/// BehaviorTreeSystem system;
/// system.initialize();
///
/// auto tree = BehaviorTreeBuilder("guard", "npc_1", 10.0f)
///     .selector()
///         .sequence()
///             .condition("HasTarget", [](const Blackboard& bb) {
///                 return bb.get_bool("has_target");
///             })
///             .action("Attack", [](Blackboard& bb, float dt) {
///                 return NodeStatus::Success;
///             })
///         .end()
///         .wait(2.0f, "Idle")
///     .build();
///
/// auto id = system.add_tree(std::move(tree));
/// system.assign_tree_to_entity("npc_1", *id);
///
/// // Each frame
/// system.update(dt);
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "blackboard.hpp"
#include "behavior_tree.hpp"
#include "behavior_tree_system.hpp"

namespace cortex_ai {

namespace prelude {
    // Node status
    using cortex_ai::NodeStatus;
    using cortex_ai::NodeType;
    using cortex_ai::ParallelPolicy;
    using cortex_ai::TreeState;

    // Behavior tree
    using cortex_ai::BehaviorTree;
    using cortex_ai::BehaviorTreeBuilder;
    using cortex_ai::BehaviorTreeId;
    using cortex_ai::IBehaviorNode;
    using cortex_ai::ActionNode;
    using cortex_ai::ConditionNode;
    using cortex_ai::WaitNode;
    using cortex_ai::SequenceNode;
    using cortex_ai::SelectorNode;
    using cortex_ai::ParallelNode;
    using cortex_ai::InverterNode;
    using cortex_ai::RepeaterNode;
    using cortex_ai::RetryNode;

    // Blackboard
    using cortex_ai::Blackboard;
    using cortex_ai::BlackboardKey;
    using cortex_ai::RuntimeValue;

    // Scheduling
    using cortex_ai::BehaviorTreeSystem;
    using cortex_ai::TreeConfig;
}

} // namespace cortex_ai
