/// @file behavior_tree.hpp
/// @brief Behavior tree nodes, trees and builders

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "blackboard.hpp"

#include <cortex/core/time.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cortex_ai {

// =============================================================================
// Behavior Node Interface
// =============================================================================

/// @brief Base interface for all behavior tree nodes
///
/// Nodes own their children exclusively. A node never throws from tick();
/// structural problems are reported as NodeStatus::Invalid.
class IBehaviorNode {
public:
    virtual ~IBehaviorNode() = default;

    /// @brief Tick the node
    /// @param bb Blackboard of the owning tree
    /// @param dt Delta time in seconds
    /// @return Node status
    virtual NodeStatus tick(Blackboard& bb, float dt) = 0;

    /// @brief Reset the node (and its subtree) to its freshly constructed state
    virtual void reset() { m_status = NodeStatus::Invalid; }

    // Properties
    virtual NodeType type() const = 0;
    std::string_view name() const { return m_name; }
    void set_name(std::string_view name) { m_name = std::string(name); }
    std::string_view description() const { return m_description; }
    void set_description(std::string_view description) { m_description = std::string(description); }

    NodeStatus status() const { return m_status; }
    bool is_running() const { return m_status == NodeStatus::Running; }
    bool is_success() const { return m_status == NodeStatus::Success; }
    bool is_failure() const { return m_status == NodeStatus::Failure; }

    // Structure
    virtual std::size_t child_count() const { return 0; }
    virtual const IBehaviorNode* child_at(std::size_t /*index*/) const { return nullptr; }

    /// @brief Number of levels in this subtree (a leaf is 1)
    virtual std::size_t depth() const { return 1; }

protected:
    IBehaviorNode() = default;
    IBehaviorNode(std::string_view name, std::string_view description)
        : m_name(name), m_description(description) {}

    NodeStatus finish(NodeStatus status) {
        m_status = status;
        return status;
    }

    std::string m_name;
    std::string m_description;
    NodeStatus m_status{NodeStatus::Invalid};
};

// =============================================================================
// Composite Nodes
// =============================================================================

/// @brief Base class for composite nodes with children
class CompositeNode : public IBehaviorNode {
public:
    void add_child(BehaviorNodePtr child);
    void clear_children();

    std::size_t child_count() const override { return m_children.size(); }
    const IBehaviorNode* child_at(std::size_t index) const override;
    IBehaviorNode* child(std::size_t index) const;

    std::size_t current_child() const { return m_current_child; }

    void reset() override;
    std::size_t depth() const override;

protected:
    using IBehaviorNode::IBehaviorNode;

    std::vector<BehaviorNodePtr> m_children;
    std::size_t m_current_child{0};
};

/// @brief Executes children in order until one fails
///
/// Progress is kept across ticks: a Running child is resumed on the next
/// tick. Failure or Invalid resets the subtree. An empty sequence succeeds.
class SequenceNode : public CompositeNode {
public:
    explicit SequenceNode(std::string_view name = "Sequence",
                          std::string_view description = "Sequence node")
        : CompositeNode(name, description) {}

    NodeType type() const override { return NodeType::Sequence; }
    NodeStatus tick(Blackboard& bb, float dt) override;
};

/// @brief Executes children in order until one succeeds
///
/// Failure and Invalid both advance to the next child. An empty selector fails.
class SelectorNode : public CompositeNode {
public:
    explicit SelectorNode(std::string_view name = "Selector",
                          std::string_view description = "Selector node")
        : CompositeNode(name, description) {}

    NodeType type() const override { return NodeType::Selector; }
    NodeStatus tick(Blackboard& bb, float dt) override;
};

/// @brief Ticks every child on every tick and resolves by policy
///
/// The success threshold is checked before the failure threshold. Invalid
/// children count as failures. On resolution the node resets itself.
class ParallelNode : public CompositeNode {
public:
    explicit ParallelNode(ParallelPolicy success_policy = ParallelPolicy::RequireAll,
                          ParallelPolicy failure_policy = ParallelPolicy::RequireOne,
                          std::string_view name = "Parallel",
                          std::string_view description = "Parallel node");

    NodeType type() const override { return NodeType::Parallel; }
    NodeStatus tick(Blackboard& bb, float dt) override;

    ParallelPolicy success_policy() const { return m_success_policy; }
    ParallelPolicy failure_policy() const { return m_failure_policy; }
    void set_success_policy(ParallelPolicy policy) { m_success_policy = policy; }
    void set_failure_policy(ParallelPolicy policy) { m_failure_policy = policy; }

private:
    std::size_t threshold(ParallelPolicy policy) const;

    ParallelPolicy m_success_policy{ParallelPolicy::RequireAll};
    ParallelPolicy m_failure_policy{ParallelPolicy::RequireOne};
};

// =============================================================================
// Decorator Nodes
// =============================================================================

/// @brief Base class for decorator nodes with single child
class DecoratorNode : public IBehaviorNode {
public:
    void set_child(BehaviorNodePtr child) { m_child = std::move(child); }
    IBehaviorNode* child() const { return m_child.get(); }

    std::size_t child_count() const override { return m_child ? 1 : 0; }
    const IBehaviorNode* child_at(std::size_t index) const override;

    void reset() override;
    std::size_t depth() const override;

protected:
    DecoratorNode(BehaviorNodePtr child, std::string_view name, std::string_view description)
        : IBehaviorNode(name, description), m_child(std::move(child)) {}

    BehaviorNodePtr m_child;
};

/// @brief Swaps Success and Failure; Running and Invalid pass through
class InverterNode : public DecoratorNode {
public:
    explicit InverterNode(BehaviorNodePtr child = nullptr,
                          std::string_view name = "Inverter",
                          std::string_view description = "Inverter node")
        : DecoratorNode(std::move(child), name, description) {}

    NodeType type() const override { return NodeType::Inverter; }
    NodeStatus tick(Blackboard& bb, float dt) override;
};

/// @brief Re-runs its child a number of times regardless of outcome
///
/// Every terminal child result counts as one run and resets the child.
/// Reports Running until the count is reached (forever without a count),
/// then Success.
class RepeaterNode : public DecoratorNode {
public:
    explicit RepeaterNode(BehaviorNodePtr child = nullptr,
                          std::optional<std::uint32_t> repeat_count = std::nullopt,
                          std::string_view name = "Repeater",
                          std::string_view description = "Repeater node")
        : DecoratorNode(std::move(child), name, description)
        , m_repeat_count(repeat_count) {}

    NodeType type() const override { return NodeType::Repeater; }
    NodeStatus tick(Blackboard& bb, float dt) override;
    void reset() override;

    std::optional<std::uint32_t> repeat_count() const { return m_repeat_count; }
    std::uint32_t current_count() const { return m_current_count; }

private:
    std::optional<std::uint32_t> m_repeat_count;
    std::uint32_t m_current_count{0};
};

/// @brief Re-runs its child on Failure, up to max_attempts
class RetryNode : public DecoratorNode {
public:
    explicit RetryNode(BehaviorNodePtr child = nullptr,
                       std::uint32_t max_attempts = 3,
                       std::string_view name = "Retry",
                       std::string_view description = "Retry node")
        : DecoratorNode(std::move(child), name, description)
        , m_max_attempts(max_attempts) {}

    NodeType type() const override { return NodeType::Retry; }
    NodeStatus tick(Blackboard& bb, float dt) override;
    void reset() override;

    std::uint32_t max_attempts() const { return m_max_attempts; }
    std::uint32_t current_attempts() const { return m_current_attempts; }

private:
    std::uint32_t m_max_attempts{3};
    std::uint32_t m_current_attempts{0};
};

// =============================================================================
// Leaf Nodes
// =============================================================================

/// @brief Executes an action callback
class ActionNode : public IBehaviorNode {
public:
    explicit ActionNode(ActionCallback action);
    ActionNode(std::string_view name, ActionCallback action,
               std::string_view description = "Action node");

    NodeType type() const override { return NodeType::Action; }
    NodeStatus tick(Blackboard& bb, float dt) override;

private:
    ActionCallback m_action;
};

/// @brief Checks a predicate over the blackboard; never Running
class ConditionNode : public IBehaviorNode {
public:
    explicit ConditionNode(ConditionCallback condition);
    ConditionNode(std::string_view name, ConditionCallback condition,
                  std::string_view description = "Condition node");

    NodeType type() const override { return NodeType::Condition; }
    NodeStatus tick(Blackboard& bb, float dt) override;

private:
    ConditionCallback m_condition;
};

/// @brief Accumulates delta time until the wait time is reached
class WaitNode : public IBehaviorNode {
public:
    explicit WaitNode(float wait_time);
    WaitNode(std::string_view name, std::string_view description, float wait_time);

    NodeType type() const override { return NodeType::Wait; }
    NodeStatus tick(Blackboard& bb, float dt) override;
    void reset() override;

    float wait_time() const { return m_wait_time; }
    float elapsed() const { return m_elapsed; }

private:
    float m_wait_time{1.0f};
    float m_elapsed{0};
};

// =============================================================================
// Behavior Tree
// =============================================================================

/// @brief One root node plus the blackboard it runs against
///
/// Lifecycle: start() resets then activates, stop() deactivates then resets,
/// pause()/resume() toggle activity without touching node state.
class BehaviorTree {
public:
    BehaviorTree(std::string_view name, EntityId entity_id, float tick_rate_hz);
    ~BehaviorTree() = default;

    BehaviorTree(const BehaviorTree&) = delete;
    BehaviorTree& operator=(const BehaviorTree&) = delete;

    /// @brief Tick the tree
    /// @return Invalid when inactive or rootless, Running when throttled,
    ///         otherwise the root status
    NodeStatus tick(float dt);

    /// @brief Reset the root subtree
    void reset();

    // Lifecycle
    void start();
    void stop();
    void pause();
    void resume();

    TreeState state() const { return m_state; }
    bool is_active() const { return m_state == TreeState::Active; }

    // Root access
    void set_root(BehaviorNodePtr root) { m_root = std::move(root); }
    IBehaviorNode* root() const { return m_root.get(); }

    /// @brief Depth of the node structure (0 without a root)
    std::size_t depth() const { return m_root ? m_root->depth() : 0; }

    // Blackboard access
    Blackboard& blackboard() { return m_blackboard; }
    const Blackboard& blackboard() const { return m_blackboard; }

    // Identifiers
    void set_id(BehaviorTreeId id) { m_id = id; }
    BehaviorTreeId id() const { return m_id; }
    const std::string& name() const { return m_name; }
    const std::string& entity_id() const { return m_blackboard.entity_id(); }

    // Timing
    cortex_core::SteadyClock::duration tick_interval() const { return m_tick_interval; }
    void set_tick_rate(float tick_rate_hz);
    void set_time_source(cortex_core::TimeSource source) {
        m_time_source = source ? std::move(source) : cortex_core::steady_time_source();
    }

    /// @brief Status returned by the last tick that reached the root
    NodeStatus last_status() const { return m_last_status; }

    /// @brief Number of ticks that reached the root
    std::uint64_t tick_count() const { return m_tick_count; }

private:
    BehaviorTreeId m_id{};
    std::string m_name;
    BehaviorNodePtr m_root;
    Blackboard m_blackboard;
    TreeState m_state{TreeState::Stopped};

    cortex_core::TimeSource m_time_source;
    cortex_core::SteadyClock::duration m_tick_interval{};
    std::optional<cortex_core::TimePoint> m_last_tick;
    NodeStatus m_last_status{NodeStatus::Invalid};
    std::uint64_t m_tick_count{0};
};

// =============================================================================
// Behavior Tree Builder
// =============================================================================

/// @brief Fluent builder for behavior trees
///
/// Composites stay open until end(); decorators close as soon as they receive
/// their child. build() closes any open scopes.
class BehaviorTreeBuilder {
public:
    BehaviorTreeBuilder(std::string_view name, EntityId entity_id, float tick_rate_hz = 30.0f);

    // Composites
    BehaviorTreeBuilder& sequence(std::string_view name = "Sequence");
    BehaviorTreeBuilder& selector(std::string_view name = "Selector");
    BehaviorTreeBuilder& parallel(ParallelPolicy success = ParallelPolicy::RequireAll,
                                  ParallelPolicy failure = ParallelPolicy::RequireOne,
                                  std::string_view name = "Parallel");

    // Decorators
    BehaviorTreeBuilder& inverter(std::string_view name = "Inverter");
    BehaviorTreeBuilder& repeater(std::optional<std::uint32_t> count = std::nullopt,
                                  std::string_view name = "Repeater");
    BehaviorTreeBuilder& retry(std::uint32_t max_attempts, std::string_view name = "Retry");

    // Leaf nodes
    BehaviorTreeBuilder& action(std::string_view name, ActionCallback callback);
    BehaviorTreeBuilder& condition(std::string_view name, ConditionCallback callback);
    BehaviorTreeBuilder& wait(float duration, std::string_view name = "Wait");

    // Structure
    BehaviorTreeBuilder& end();  ///< End current composite
    BehaviorTreeBuilder& describe(std::string_view description);  ///< Describe the next node

    // Flat sub-builders; they keep a reference to this builder, so temporaries are rejected
    SequenceBuilder with_sequence(std::string_view name) &;
    SelectorBuilder with_selector(std::string_view name) &;
    ParallelBuilder with_parallel(std::string_view name, ParallelPolicy success, ParallelPolicy failure) &;
    SequenceBuilder with_sequence(std::string_view name) && = delete;
    SelectorBuilder with_selector(std::string_view name) && = delete;
    ParallelBuilder with_parallel(std::string_view name, ParallelPolicy success, ParallelPolicy failure) && = delete;

    // Build
    BehaviorTreePtr build();

private:
    friend class SequenceBuilder;
    friend class SelectorBuilder;
    friend class ParallelBuilder;

    struct BuildContext {
        BehaviorNodePtr node;
        bool is_composite{false};
    };

    void push_node(BehaviorNodePtr node, bool is_composite);
    void attach_to_parent(BehaviorNodePtr node);
    void apply_pending_description(IBehaviorNode* node);

    std::string m_name;
    EntityId m_entity_id;
    float m_tick_rate_hz;
    std::vector<BuildContext> m_stack;
    BehaviorNodePtr m_root;
    std::string m_pending_description;
};

/// @brief Builds a tree whose root is a single sequence of leaves
class SequenceBuilder {
public:
    SequenceBuilder(BehaviorTreeBuilder& tree_builder, std::string_view name);

    SequenceBuilder& add_condition(std::string_view name, ConditionCallback condition);
    SequenceBuilder& add_action(std::string_view name, ActionCallback action);
    SequenceBuilder& add_wait(std::string_view name, float duration);

    BehaviorTreePtr build();

private:
    BehaviorTreeBuilder& m_tree_builder;
    std::unique_ptr<SequenceNode> m_node;
};

/// @brief Builds a tree whose root is a single selector of leaves
class SelectorBuilder {
public:
    SelectorBuilder(BehaviorTreeBuilder& tree_builder, std::string_view name);

    SelectorBuilder& add_condition(std::string_view name, ConditionCallback condition);
    SelectorBuilder& add_action(std::string_view name, ActionCallback action);

    BehaviorTreePtr build();

private:
    BehaviorTreeBuilder& m_tree_builder;
    std::unique_ptr<SelectorNode> m_node;
};

/// @brief Builds a tree whose root is a single parallel of leaves
class ParallelBuilder {
public:
    ParallelBuilder(BehaviorTreeBuilder& tree_builder, std::string_view name,
                    ParallelPolicy success, ParallelPolicy failure);

    ParallelBuilder& add_condition(std::string_view name, ConditionCallback condition);
    ParallelBuilder& add_action(std::string_view name, ActionCallback action);

    BehaviorTreePtr build();

private:
    BehaviorTreeBuilder& m_tree_builder;
    std::unique_ptr<ParallelNode> m_node;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Create a simple action node
inline BehaviorNodePtr make_action(std::string_view name, ActionCallback callback) {
    return std::make_unique<ActionNode>(name, std::move(callback));
}

/// @brief Create a simple condition node
inline BehaviorNodePtr make_condition(std::string_view name, ConditionCallback callback) {
    return std::make_unique<ConditionNode>(name, std::move(callback));
}

/// @brief Create a wait node
inline BehaviorNodePtr make_wait(float duration) {
    return std::make_unique<WaitNode>(duration);
}

} // namespace cortex_ai
