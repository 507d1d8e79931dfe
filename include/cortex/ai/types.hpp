/// @file types.hpp
/// @brief Common types for cortex_ai module

#pragma once

#include "fwd.hpp"

#include <functional>

namespace cortex_ai {

// =============================================================================
// Behavior Tree Types
// =============================================================================

/// @brief Result of a behavior node tick
enum class NodeStatus : std::uint8_t {
    Success,        ///< Node completed successfully
    Failure,        ///< Node failed
    Running,        ///< Node still executing
    Invalid         ///< Node structurally broken (e.g. decorator without child)
};

/// @brief Type of behavior node
enum class NodeType : std::uint8_t {
    // Composites
    Sequence,
    Selector,
    Parallel,

    // Decorators
    Inverter,
    Repeater,
    Retry,

    // Leaf nodes
    Action,
    Condition,
    Wait
};

/// @brief Policy for parallel node completion
enum class ParallelPolicy : std::uint8_t {
    RequireOne,     ///< Threshold met when any child reaches the outcome
    RequireAll      ///< Threshold met only when every child reaches it
};

/// @brief Lifecycle state of a behavior tree
enum class TreeState : std::uint8_t {
    Stopped,        ///< Inactive, cursors reset
    Active,         ///< Ticked by the scheduler
    Paused          ///< Inactive, cursors preserved
};

/// @brief Callback for action nodes; may mutate the blackboard and return Running
using ActionCallback = std::function<NodeStatus(Blackboard& bb, float dt)>;

/// @brief Callback for condition nodes; pure predicate of the blackboard
using ConditionCallback = std::function<bool(const Blackboard& bb)>;

/// @brief Returns true if the status ends a node's run
[[nodiscard]] inline bool is_terminal(NodeStatus status) {
    return status == NodeStatus::Success || status == NodeStatus::Failure;
}

/// @brief Convert node status to string
const char* node_status_to_string(NodeStatus status);

/// @brief Convert node type to string
const char* node_type_to_string(NodeType type);

/// @brief Convert tree state to string
const char* tree_state_to_string(TreeState state);

} // namespace cortex_ai
