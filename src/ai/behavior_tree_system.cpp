/// @file behavior_tree_system.cpp
/// @brief BehaviorTreeSystem implementation

#include <cortex/ai/behavior_tree_system.hpp>

#include <cortex/core/log.hpp>
#include <cortex/core/value_json.hpp>

#include <algorithm>

namespace cortex_ai {

using cortex_core::Err;
using cortex_core::Error;
using cortex_core::Ok;
using cortex_core::TreeError;

namespace {

std::string id_string(BehaviorTreeId id) {
    return std::to_string(id.value);
}

nlohmann::json node_snapshot(const IBehaviorNode& node) {
    nlohmann::json j;
    j["name"] = std::string(node.name());
    j["type"] = node_type_to_string(node.type());
    j["status"] = node_status_to_string(node.status());

    if (node.child_count() > 0) {
        nlohmann::json children = nlohmann::json::array();
        for (std::size_t i = 0; i < node.child_count(); ++i) {
            if (auto* child = node.child_at(i)) {
                children.push_back(node_snapshot(*child));
            }
        }
        j["children"] = std::move(children);
    }
    return j;
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

BehaviorTreeSystem::BehaviorTreeSystem(TreeConfig config)
    : m_config(config)
    , m_shared_store(std::make_shared<ValueMap>())
    , m_time_source(cortex_core::steady_time_source()) {
}

Result<void> BehaviorTreeSystem::initialize() {
    auto valid = m_config.validate();
    if (!valid) {
        cortex_core::tree_logger()->error("Rejected tree configuration: {}", valid.error().message());
        return valid;
    }

    auto logger = cortex_core::tree_logger();
    logger->info("Behavior tree system initialized");
    logger->info("  Max execution time: {}ms", m_config.max_execution_time_ms);
    logger->info("  Max tree depth: {}", m_config.max_depth);
    logger->info("  Tick rate: {}Hz", m_config.tick_rate_hz);
    logger->info("  Blackboard sharing: {}", m_config.enable_blackboard_sharing);
    return Ok();
}

Result<void> BehaviorTreeSystem::shutdown() {
    auto logger = cortex_core::tree_logger();
    logger->info("Behavior tree system shutdown");
    logger->info("  Trees at shutdown: {}", m_trees.size());
    logger->info("  Active trees at shutdown: {}", get_active_tree_count());
    logger->info("  Trees ticked: {}", m_stats.trees_ticked);

    m_trees.clear();
    m_entity_trees.clear();
    m_shared_store->clear();
    cortex_core::flush_all_loggers();
    return Ok();
}

// =============================================================================
// Tree Management
// =============================================================================

BehaviorTreeId BehaviorTreeSystem::insert_tree(BehaviorTreePtr tree) {
    auto id = next_id();
    tree->set_id(id);
    tree->set_time_source(m_time_source);
    if (m_config.enable_blackboard_sharing) {
        tree->blackboard().set_shared_store(m_shared_store);
    }
    m_trees.emplace(id, std::move(tree));
    return id;
}

BehaviorTreeId BehaviorTreeSystem::create_tree(std::string_view name) {
    // Placeholder entity until the tree is assigned
    auto tree = std::make_unique<BehaviorTree>(name, "entity_" + std::to_string(m_next_id),
                                               m_config.tick_rate_hz);
    auto id = insert_tree(std::move(tree));
    cortex_core::tree_logger()->info("Created behavior tree: {} (ID: {})", name, id.value);
    return id;
}

Result<BehaviorTreeId> BehaviorTreeSystem::add_tree(BehaviorTreePtr tree) {
    if (!tree) {
        return Err<BehaviorTreeId>(Error(cortex_core::ErrorCode::InvalidArgument, "Cannot add a null tree"));
    }

    auto depth = tree->depth();
    if (depth > m_config.max_depth) {
        return Err<BehaviorTreeId>(Error(TreeError::depth_exceeded(tree->name(), depth, m_config.max_depth)));
    }

    std::string name = tree->name();
    auto id = insert_tree(std::move(tree));
    cortex_core::tree_logger()->info("Added behavior tree: {} (ID: {}, depth {})", name, id.value, depth);
    return Ok(id);
}

Result<void> BehaviorTreeSystem::assign_tree_to_entity(const EntityId& entity_id, BehaviorTreeId tree_id) {
    auto it = m_trees.find(tree_id);
    if (it == m_trees.end()) {
        return Err(Error(TreeError::tree_not_found(id_string(tree_id))).with_context("entity", entity_id));
    }

    m_entity_trees[entity_id] = tree_id;
    it->second->blackboard().set_entity_id(entity_id);
    it->second->start();

    cortex_core::tree_logger()->debug("Assigned tree {} to entity {}", tree_id.value, entity_id);
    return Ok();
}

Result<void> BehaviorTreeSystem::pause_tree(BehaviorTreeId tree_id) {
    auto* tree = get_tree(tree_id);
    if (!tree) {
        return Err(Error(TreeError::tree_not_found(id_string(tree_id))));
    }
    tree->pause();
    return Ok();
}

Result<void> BehaviorTreeSystem::resume_tree(BehaviorTreeId tree_id) {
    auto* tree = get_tree(tree_id);
    if (!tree) {
        return Err(Error(TreeError::tree_not_found(id_string(tree_id))));
    }
    tree->resume();
    return Ok();
}

Result<void> BehaviorTreeSystem::remove_tree(BehaviorTreeId tree_id) {
    auto it = m_trees.find(tree_id);
    if (it == m_trees.end()) {
        return Err(Error(TreeError::tree_not_found(id_string(tree_id))));
    }

    cortex_core::tree_logger()->info("Removed behavior tree: {} (ID: {})", it->second->name(), tree_id.value);
    m_trees.erase(it);

    for (auto mapping = m_entity_trees.begin(); mapping != m_entity_trees.end();) {
        if (mapping->second == tree_id) {
            mapping = m_entity_trees.erase(mapping);
        } else {
            ++mapping;
        }
    }
    return Ok();
}

BehaviorTree* BehaviorTreeSystem::get_tree(BehaviorTreeId tree_id) {
    auto it = m_trees.find(tree_id);
    return it != m_trees.end() ? it->second.get() : nullptr;
}

const BehaviorTree* BehaviorTreeSystem::get_tree(BehaviorTreeId tree_id) const {
    auto it = m_trees.find(tree_id);
    return it != m_trees.end() ? it->second.get() : nullptr;
}

std::optional<BehaviorTreeId> BehaviorTreeSystem::tree_for_entity(const EntityId& entity_id) const {
    auto it = m_entity_trees.find(entity_id);
    if (it == m_entity_trees.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Ticking
// =============================================================================

void BehaviorTreeSystem::update(float dt) {
    auto start = m_time_source();
    m_stats.updates++;

    bool over_budget = false;
    std::size_t skipped = 0;

    for (auto& [id, tree] : m_trees) {
        if (!tree->is_active()) {
            continue;
        }
        if (over_budget) {
            skipped++;
            continue;
        }

        tree->tick(dt);
        m_stats.trees_ticked++;

        if (cortex_core::elapsed_ms(start, m_time_source()) > static_cast<double>(m_config.max_execution_time_ms)) {
            over_budget = true;
        }
    }

    if (over_budget) {
        m_stats.budget_overruns++;
        m_stats.trees_skipped += skipped;
        cortex_core::tree_logger()->warn(
            "Behavior tree execution exceeded {}ms budget, deferred {} tree(s)",
            m_config.max_execution_time_ms, skipped);
    }

    m_stats.last_update_ms = cortex_core::elapsed_ms(start, m_time_source());
}

void BehaviorTreeSystem::set_time_source(cortex_core::TimeSource source) {
    m_time_source = source ? std::move(source) : cortex_core::steady_time_source();
    for (auto& [id, tree] : m_trees) {
        tree->set_time_source(m_time_source);
    }
}

// =============================================================================
// Blackboard Access
// =============================================================================

Result<void> BehaviorTreeSystem::update_blackboard(const EntityId& entity_id, std::string_view key,
                                                   RuntimeValue value) {
    auto tree_id = tree_for_entity(entity_id);
    auto* tree = tree_id ? get_tree(*tree_id) : nullptr;
    if (!tree) {
        return Err(Error(TreeError::entity_not_assigned(entity_id)));
    }

    tree->blackboard().set(key, std::move(value));
    return Ok();
}

Result<std::optional<RuntimeValue>> BehaviorTreeSystem::get_blackboard_value(const EntityId& entity_id,
                                                                             std::string_view key) const {
    auto tree_id = tree_for_entity(entity_id);
    auto* tree = tree_id ? get_tree(*tree_id) : nullptr;
    if (!tree) {
        return Err<std::optional<RuntimeValue>>(Error(TreeError::entity_not_assigned(entity_id)));
    }

    return Ok(tree->blackboard().get_value(key));
}

// =============================================================================
// Queries
// =============================================================================

std::optional<bool> BehaviorTreeSystem::get_tree_status(BehaviorTreeId tree_id) const {
    auto* tree = get_tree(tree_id);
    if (!tree) {
        return std::nullopt;
    }
    return tree->is_active();
}

std::vector<std::string> BehaviorTreeSystem::get_tree_names() const {
    std::vector<std::string> names;
    names.reserve(m_trees.size());
    for (const auto& [id, tree] : m_trees) {
        names.push_back(tree->name());
    }
    return names;
}

std::uint32_t BehaviorTreeSystem::get_active_tree_count() const {
    return static_cast<std::uint32_t>(std::count_if(m_trees.begin(), m_trees.end(),
        [](const auto& entry) { return entry.second->is_active(); }));
}

nlohmann::json BehaviorTreeSystem::debug_snapshot() const {
    nlohmann::json snapshot = nlohmann::json::object();
    if (!m_config.enable_debugging) {
        return snapshot;
    }

    nlohmann::json trees = nlohmann::json::array();
    for (const auto& [id, tree] : m_trees) {
        nlohmann::json t;
        t["id"] = id.value;
        t["name"] = tree->name();
        t["entity"] = tree->entity_id();
        t["state"] = tree_state_to_string(tree->state());
        t["last_status"] = node_status_to_string(tree->last_status());
        t["ticks"] = tree->tick_count();

        nlohmann::json blackboard = nlohmann::json::object();
        for (const auto& key : tree->blackboard().keys()) {
            if (auto* value = tree->blackboard().get(key)) {
                blackboard[key] = cortex_core::to_json(*value);
            }
        }
        t["blackboard"] = std::move(blackboard);

        if (auto* root = tree->root()) {
            t["root"] = node_snapshot(*root);
        }
        trees.push_back(std::move(t));
    }

    snapshot["trees"] = std::move(trees);
    snapshot["active_trees"] = get_active_tree_count();
    snapshot["stats"] = {
        {"updates", m_stats.updates},
        {"trees_ticked", m_stats.trees_ticked},
        {"trees_skipped", m_stats.trees_skipped},
        {"budget_overruns", m_stats.budget_overruns},
        {"last_update_ms", m_stats.last_update_ms},
    };
    return snapshot;
}

} // namespace cortex_ai
