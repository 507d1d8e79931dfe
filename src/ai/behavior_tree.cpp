/// @file behavior_tree.cpp
/// @brief Behavior tree implementation for cortex_ai module

#include <cortex/ai/behavior_tree.hpp>

#include <algorithm>
#include <cmath>

namespace cortex_ai {

// =============================================================================
// CompositeNode Implementation
// =============================================================================

void CompositeNode::add_child(BehaviorNodePtr child) {
    if (child) {
        m_children.push_back(std::move(child));
    }
}

void CompositeNode::clear_children() {
    m_children.clear();
    m_current_child = 0;
}

const IBehaviorNode* CompositeNode::child_at(std::size_t index) const {
    return child(index);
}

IBehaviorNode* CompositeNode::child(std::size_t index) const {
    return index < m_children.size() ? m_children[index].get() : nullptr;
}

void CompositeNode::reset() {
    IBehaviorNode::reset();
    m_current_child = 0;
    for (auto& child : m_children) {
        child->reset();
    }
}

std::size_t CompositeNode::depth() const {
    std::size_t deepest = 0;
    for (const auto& child : m_children) {
        deepest = std::max(deepest, child->depth());
    }
    return deepest + 1;
}

// =============================================================================
// SequenceNode Implementation
// =============================================================================

NodeStatus SequenceNode::tick(Blackboard& bb, float dt) {
    if (m_children.empty()) {
        return finish(NodeStatus::Success);
    }

    while (m_current_child < m_children.size()) {
        auto status = m_children[m_current_child]->tick(bb, dt);

        switch (status) {
            case NodeStatus::Success:
                m_current_child++;
                break;
            case NodeStatus::Running:
                return finish(NodeStatus::Running);
            case NodeStatus::Failure:
            case NodeStatus::Invalid:
                reset();
                return finish(status);
        }
    }

    // All children succeeded
    reset();
    return finish(NodeStatus::Success);
}

// =============================================================================
// SelectorNode Implementation
// =============================================================================

NodeStatus SelectorNode::tick(Blackboard& bb, float dt) {
    if (m_children.empty()) {
        return finish(NodeStatus::Failure);
    }

    while (m_current_child < m_children.size()) {
        auto status = m_children[m_current_child]->tick(bb, dt);

        switch (status) {
            case NodeStatus::Success:
                reset();
                return finish(NodeStatus::Success);
            case NodeStatus::Running:
                return finish(NodeStatus::Running);
            case NodeStatus::Failure:
            case NodeStatus::Invalid:
                // Try next child
                m_current_child++;
                break;
        }
    }

    // All children failed
    reset();
    return finish(NodeStatus::Failure);
}

// =============================================================================
// ParallelNode Implementation
// =============================================================================

ParallelNode::ParallelNode(ParallelPolicy success_policy, ParallelPolicy failure_policy,
                           std::string_view name, std::string_view description)
    : CompositeNode(name, description)
    , m_success_policy(success_policy)
    , m_failure_policy(failure_policy) {
}

std::size_t ParallelNode::threshold(ParallelPolicy policy) const {
    return policy == ParallelPolicy::RequireOne ? 1 : m_children.size();
}

NodeStatus ParallelNode::tick(Blackboard& bb, float dt) {
    if (m_children.empty()) {
        return finish(NodeStatus::Success);
    }

    std::size_t success_count = 0;
    std::size_t failure_count = 0;
    std::size_t running_count = 0;

    for (auto& child : m_children) {
        switch (child->tick(bb, dt)) {
            case NodeStatus::Success:
                success_count++;
                break;
            case NodeStatus::Running:
                running_count++;
                break;
            case NodeStatus::Failure:
            case NodeStatus::Invalid:
                failure_count++;
                break;
        }
    }

    if (success_count >= threshold(m_success_policy)) {
        reset();
        return finish(NodeStatus::Success);
    }

    if (failure_count >= threshold(m_failure_policy)) {
        reset();
        return finish(NodeStatus::Failure);
    }

    if (running_count > 0) {
        return finish(NodeStatus::Running);
    }

    reset();
    return finish(NodeStatus::Failure);
}

// =============================================================================
// DecoratorNode Implementation
// =============================================================================

const IBehaviorNode* DecoratorNode::child_at(std::size_t index) const {
    return index == 0 ? m_child.get() : nullptr;
}

void DecoratorNode::reset() {
    IBehaviorNode::reset();
    if (m_child) {
        m_child->reset();
    }
}

std::size_t DecoratorNode::depth() const {
    return m_child ? m_child->depth() + 1 : 1;
}

// =============================================================================
// InverterNode Implementation
// =============================================================================

NodeStatus InverterNode::tick(Blackboard& bb, float dt) {
    if (!m_child) {
        return finish(NodeStatus::Invalid);
    }

    switch (m_child->tick(bb, dt)) {
        case NodeStatus::Success:
            return finish(NodeStatus::Failure);
        case NodeStatus::Failure:
            return finish(NodeStatus::Success);
        case NodeStatus::Running:
            return finish(NodeStatus::Running);
        case NodeStatus::Invalid:
        default:
            return finish(NodeStatus::Invalid);
    }
}

// =============================================================================
// RepeaterNode Implementation
// =============================================================================

NodeStatus RepeaterNode::tick(Blackboard& bb, float dt) {
    if (!m_child) {
        return finish(NodeStatus::Invalid);
    }

    if (m_repeat_count && m_current_count >= *m_repeat_count) {
        return finish(NodeStatus::Success);
    }

    auto status = m_child->tick(bb, dt);
    if (status == NodeStatus::Running || status == NodeStatus::Invalid) {
        return finish(status);
    }

    // One completed run, whatever its outcome
    m_current_count++;
    m_child->reset();

    if (m_repeat_count && m_current_count >= *m_repeat_count) {
        return finish(NodeStatus::Success);
    }
    return finish(NodeStatus::Running);
}

void RepeaterNode::reset() {
    DecoratorNode::reset();
    m_current_count = 0;
}

// =============================================================================
// RetryNode Implementation
// =============================================================================

NodeStatus RetryNode::tick(Blackboard& bb, float dt) {
    if (!m_child) {
        return finish(NodeStatus::Invalid);
    }

    switch (m_child->tick(bb, dt)) {
        case NodeStatus::Success:
            reset();
            return finish(NodeStatus::Success);
        case NodeStatus::Failure:
            m_current_attempts++;
            if (m_current_attempts >= m_max_attempts) {
                reset();
                return finish(NodeStatus::Failure);
            }
            m_child->reset();
            return finish(NodeStatus::Running);
        case NodeStatus::Running:
            return finish(NodeStatus::Running);
        case NodeStatus::Invalid:
        default:
            return finish(NodeStatus::Invalid);
    }
}

void RetryNode::reset() {
    DecoratorNode::reset();
    m_current_attempts = 0;
}

// =============================================================================
// ActionNode Implementation
// =============================================================================

ActionNode::ActionNode(ActionCallback action)
    : IBehaviorNode("Action", "Action node")
    , m_action(std::move(action)) {
}

ActionNode::ActionNode(std::string_view name, ActionCallback action, std::string_view description)
    : IBehaviorNode(name, description)
    , m_action(std::move(action)) {
}

NodeStatus ActionNode::tick(Blackboard& bb, float dt) {
    if (!m_action) {
        return finish(NodeStatus::Invalid);
    }

    return finish(m_action(bb, dt));
}

// =============================================================================
// ConditionNode Implementation
// =============================================================================

ConditionNode::ConditionNode(ConditionCallback condition)
    : IBehaviorNode("Condition", "Condition node")
    , m_condition(std::move(condition)) {
}

ConditionNode::ConditionNode(std::string_view name, ConditionCallback condition, std::string_view description)
    : IBehaviorNode(name, description)
    , m_condition(std::move(condition)) {
}

NodeStatus ConditionNode::tick(Blackboard& bb, float /*dt*/) {
    if (!m_condition) {
        return finish(NodeStatus::Invalid);
    }

    return finish(m_condition(bb) ? NodeStatus::Success : NodeStatus::Failure);
}

// =============================================================================
// WaitNode Implementation
// =============================================================================

WaitNode::WaitNode(float wait_time)
    : IBehaviorNode("Wait", "Wait node")
    , m_wait_time(wait_time) {
}

WaitNode::WaitNode(std::string_view name, std::string_view description, float wait_time)
    : IBehaviorNode(name, description)
    , m_wait_time(wait_time) {
}

NodeStatus WaitNode::tick(Blackboard& /*bb*/, float dt) {
    m_elapsed += dt;

    if (m_elapsed >= m_wait_time) {
        return finish(NodeStatus::Success);
    }

    return finish(NodeStatus::Running);
}

void WaitNode::reset() {
    IBehaviorNode::reset();
    m_elapsed = 0;
}

// =============================================================================
// BehaviorTree Implementation
// =============================================================================

BehaviorTree::BehaviorTree(std::string_view name, EntityId entity_id, float tick_rate_hz)
    : m_name(name)
    , m_blackboard(std::move(entity_id))
    , m_time_source(cortex_core::steady_time_source()) {
    set_tick_rate(tick_rate_hz);
}

void BehaviorTree::set_tick_rate(float tick_rate_hz) {
    if (tick_rate_hz > 0.0f && std::isfinite(tick_rate_hz)) {
        m_tick_interval = std::chrono::duration_cast<cortex_core::SteadyClock::duration>(
            std::chrono::duration<double>(1.0 / static_cast<double>(tick_rate_hz)));
    } else {
        // Non-positive rate disables throttling
        m_tick_interval = cortex_core::SteadyClock::duration::zero();
    }
}

NodeStatus BehaviorTree::tick(float dt) {
    if (!is_active()) {
        return NodeStatus::Invalid;
    }

    auto now = m_time_source();
    if (m_last_tick && now - *m_last_tick < m_tick_interval) {
        return NodeStatus::Running;
    }
    m_last_tick = now;

    if (!m_root) {
        m_last_status = NodeStatus::Invalid;
        return m_last_status;
    }

    m_tick_count++;
    m_last_status = m_root->tick(m_blackboard, dt);
    return m_last_status;
}

void BehaviorTree::reset() {
    if (m_root) {
        m_root->reset();
    }
}

void BehaviorTree::start() {
    reset();
    m_last_tick.reset();
    m_state = TreeState::Active;
}

void BehaviorTree::stop() {
    m_state = TreeState::Stopped;
    reset();
}

void BehaviorTree::pause() {
    if (m_state == TreeState::Active) {
        m_state = TreeState::Paused;
    }
}

void BehaviorTree::resume() {
    m_state = TreeState::Active;
}

// =============================================================================
// BehaviorTreeBuilder Implementation
// =============================================================================

BehaviorTreeBuilder::BehaviorTreeBuilder(std::string_view name, EntityId entity_id, float tick_rate_hz)
    : m_name(name)
    , m_entity_id(std::move(entity_id))
    , m_tick_rate_hz(tick_rate_hz) {
}

BehaviorTreeBuilder& BehaviorTreeBuilder::sequence(std::string_view name) {
    push_node(std::make_unique<SequenceNode>(name), true);
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::selector(std::string_view name) {
    push_node(std::make_unique<SelectorNode>(name), true);
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::parallel(ParallelPolicy success, ParallelPolicy failure,
                                                   std::string_view name) {
    push_node(std::make_unique<ParallelNode>(success, failure, name), true);
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::inverter(std::string_view name) {
    push_node(std::make_unique<InverterNode>(nullptr, name), false);
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::repeater(std::optional<std::uint32_t> count, std::string_view name) {
    push_node(std::make_unique<RepeaterNode>(nullptr, count, name), false);
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::retry(std::uint32_t max_attempts, std::string_view name) {
    push_node(std::make_unique<RetryNode>(nullptr, max_attempts, name), false);
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::action(std::string_view name, ActionCallback callback) {
    auto node = std::make_unique<ActionNode>(name, std::move(callback));
    apply_pending_description(node.get());
    attach_to_parent(std::move(node));
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::condition(std::string_view name, ConditionCallback callback) {
    auto node = std::make_unique<ConditionNode>(name, std::move(callback));
    apply_pending_description(node.get());
    attach_to_parent(std::move(node));
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::wait(float duration, std::string_view name) {
    auto node = std::make_unique<WaitNode>(name, "Wait node", duration);
    apply_pending_description(node.get());
    attach_to_parent(std::move(node));
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::end() {
    if (!m_stack.empty()) {
        auto context = std::move(m_stack.back());
        m_stack.pop_back();
        attach_to_parent(std::move(context.node));
    }
    return *this;
}

BehaviorTreeBuilder& BehaviorTreeBuilder::describe(std::string_view description) {
    m_pending_description = std::string(description);
    return *this;
}

SequenceBuilder BehaviorTreeBuilder::with_sequence(std::string_view name) & {
    return SequenceBuilder(*this, name);
}

SelectorBuilder BehaviorTreeBuilder::with_selector(std::string_view name) & {
    return SelectorBuilder(*this, name);
}

ParallelBuilder BehaviorTreeBuilder::with_parallel(std::string_view name, ParallelPolicy success,
                                                   ParallelPolicy failure) & {
    return ParallelBuilder(*this, name, success, failure);
}

BehaviorTreePtr BehaviorTreeBuilder::build() {
    // Close all open scopes
    while (!m_stack.empty()) {
        end();
    }

    auto tree = std::make_unique<BehaviorTree>(m_name, m_entity_id, m_tick_rate_hz);
    tree->set_root(std::move(m_root));
    return tree;
}

void BehaviorTreeBuilder::push_node(BehaviorNodePtr node, bool is_composite) {
    apply_pending_description(node.get());

    BuildContext context;
    context.node = std::move(node);
    context.is_composite = is_composite;
    m_stack.push_back(std::move(context));
}

void BehaviorTreeBuilder::attach_to_parent(BehaviorNodePtr node) {
    if (m_stack.empty()) {
        m_root = std::move(node);
        return;
    }

    auto& parent_ctx = m_stack.back();

    if (parent_ctx.is_composite) {
        auto* composite = static_cast<CompositeNode*>(parent_ctx.node.get());
        composite->add_child(std::move(node));
    } else {
        auto* decorator = static_cast<DecoratorNode*>(parent_ctx.node.get());
        decorator->set_child(std::move(node));
        // Pop decorator since it now has its child
        auto context = std::move(m_stack.back());
        m_stack.pop_back();
        attach_to_parent(std::move(context.node));
    }
}

void BehaviorTreeBuilder::apply_pending_description(IBehaviorNode* node) {
    if (!m_pending_description.empty()) {
        node->set_description(m_pending_description);
        m_pending_description.clear();
    }
}

// =============================================================================
// Flat Builders
// =============================================================================

SequenceBuilder::SequenceBuilder(BehaviorTreeBuilder& tree_builder, std::string_view name)
    : m_tree_builder(tree_builder)
    , m_node(std::make_unique<SequenceNode>(name)) {
}

SequenceBuilder& SequenceBuilder::add_condition(std::string_view name, ConditionCallback condition) {
    m_node->add_child(make_condition(name, std::move(condition)));
    return *this;
}

SequenceBuilder& SequenceBuilder::add_action(std::string_view name, ActionCallback action) {
    m_node->add_child(make_action(name, std::move(action)));
    return *this;
}

SequenceBuilder& SequenceBuilder::add_wait(std::string_view name, float duration) {
    m_node->add_child(std::make_unique<WaitNode>(name, "Wait node", duration));
    return *this;
}

BehaviorTreePtr SequenceBuilder::build() {
    m_tree_builder.attach_to_parent(std::move(m_node));
    return m_tree_builder.build();
}

SelectorBuilder::SelectorBuilder(BehaviorTreeBuilder& tree_builder, std::string_view name)
    : m_tree_builder(tree_builder)
    , m_node(std::make_unique<SelectorNode>(name)) {
}

SelectorBuilder& SelectorBuilder::add_condition(std::string_view name, ConditionCallback condition) {
    m_node->add_child(make_condition(name, std::move(condition)));
    return *this;
}

SelectorBuilder& SelectorBuilder::add_action(std::string_view name, ActionCallback action) {
    m_node->add_child(make_action(name, std::move(action)));
    return *this;
}

BehaviorTreePtr SelectorBuilder::build() {
    m_tree_builder.attach_to_parent(std::move(m_node));
    return m_tree_builder.build();
}

ParallelBuilder::ParallelBuilder(BehaviorTreeBuilder& tree_builder, std::string_view name,
                                 ParallelPolicy success, ParallelPolicy failure)
    : m_tree_builder(tree_builder)
    , m_node(std::make_unique<ParallelNode>(success, failure, name)) {
}

ParallelBuilder& ParallelBuilder::add_condition(std::string_view name, ConditionCallback condition) {
    m_node->add_child(make_condition(name, std::move(condition)));
    return *this;
}

ParallelBuilder& ParallelBuilder::add_action(std::string_view name, ActionCallback action) {
    m_node->add_child(make_action(name, std::move(action)));
    return *this;
}

BehaviorTreePtr ParallelBuilder::build() {
    m_tree_builder.attach_to_parent(std::move(m_node));
    return m_tree_builder.build();
}

// =============================================================================
// Utility Functions
// =============================================================================

const char* node_status_to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::Success: return "Success";
        case NodeStatus::Failure: return "Failure";
        case NodeStatus::Running: return "Running";
        case NodeStatus::Invalid: return "Invalid";
        default: return "Unknown";
    }
}

const char* node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::Sequence: return "Sequence";
        case NodeType::Selector: return "Selector";
        case NodeType::Parallel: return "Parallel";
        case NodeType::Inverter: return "Inverter";
        case NodeType::Repeater: return "Repeater";
        case NodeType::Retry: return "Retry";
        case NodeType::Action: return "Action";
        case NodeType::Condition: return "Condition";
        case NodeType::Wait: return "Wait";
        default: return "Unknown";
    }
}

const char* tree_state_to_string(TreeState state) {
    switch (state) {
        case TreeState::Stopped: return "Stopped";
        case TreeState::Active: return "Active";
        case TreeState::Paused: return "Paused";
        default: return "Unknown";
    }
}

} // namespace cortex_ai
