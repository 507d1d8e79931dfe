/// @file fwd.hpp
/// @brief Forward declarations for cortex_ai module

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace cortex_ai {

// =============================================================================
// Handle Types
// =============================================================================

/// @brief Strongly-typed behavior tree ID
struct BehaviorTreeId {
    std::uint32_t value{0};
    explicit operator bool() const { return value != 0; }
    bool operator==(const BehaviorTreeId&) const = default;
    auto operator<=>(const BehaviorTreeId&) const = default;
};

/// @brief Entities are identified by caller-supplied strings
using EntityId = std::string;

// =============================================================================
// Forward Declarations - Behavior Trees
// =============================================================================

class IBehaviorNode;
class BehaviorTree;
class BehaviorTreeBuilder;
class BehaviorTreeSystem;

// Composites
class CompositeNode;
class SequenceNode;
class SelectorNode;
class ParallelNode;

// Decorators
class DecoratorNode;
class InverterNode;
class RepeaterNode;
class RetryNode;

// Leaf Nodes
class ActionNode;
class ConditionNode;
class WaitNode;

// Flat builders
class SequenceBuilder;
class SelectorBuilder;
class ParallelBuilder;

// =============================================================================
// Forward Declarations - Blackboard
// =============================================================================

class Blackboard;

struct TreeConfig;

// =============================================================================
// Smart Pointer Aliases
// =============================================================================

using BehaviorNodePtr = std::unique_ptr<IBehaviorNode>;
using BehaviorTreePtr = std::unique_ptr<BehaviorTree>;

} // namespace cortex_ai

// Hash specializations
namespace std {
    template<> struct hash<cortex_ai::BehaviorTreeId> {
        std::size_t operator()(const cortex_ai::BehaviorTreeId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };
}
