/// @file behavior_tree_system.hpp
/// @brief Scheduler ticking many behavior trees under a frame budget

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "behavior_tree.hpp"

#include <cortex/core/error.hpp>
#include <cortex/core/time.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortex_ai {

// =============================================================================
// Statistics
// =============================================================================

/// @brief Counters maintained by BehaviorTreeSystem::update()
struct TreeSystemStats {
    std::uint64_t updates = 0;              ///< update() calls
    std::uint64_t trees_ticked = 0;         ///< tree ticks performed
    std::uint64_t trees_skipped = 0;        ///< active trees deferred by the budget
    std::uint64_t budget_overruns = 0;      ///< update() calls that hit the budget
    double last_update_ms = 0.0;            ///< duration of the last update()
};

// =============================================================================
// BehaviorTreeSystem
// =============================================================================

/// @brief Owns behavior trees, maps entities to them and ticks them each frame
///
/// Trees are kept in creation order and ticked in that order. When the time
/// spent in one update() exceeds max_execution_time_ms, the remaining trees
/// are skipped until the next update().
class BehaviorTreeSystem {
public:
    explicit BehaviorTreeSystem(TreeConfig config = {});
    ~BehaviorTreeSystem() = default;

    BehaviorTreeSystem(const BehaviorTreeSystem&) = delete;
    BehaviorTreeSystem& operator=(const BehaviorTreeSystem&) = delete;

    /// @brief Validate the configuration and log it
    Result<void> initialize();

    /// @brief Release all trees and mappings
    Result<void> shutdown();

    // -------------------------------------------------------------------------
    // Tree management
    // -------------------------------------------------------------------------

    /// @brief Create an inactive, rootless tree with its own blackboard
    BehaviorTreeId create_tree(std::string_view name);

    /// @brief Take ownership of a prebuilt tree (inactive until assigned)
    /// @return DepthExceeded if the structure is deeper than max_depth
    Result<BehaviorTreeId> add_tree(BehaviorTreePtr tree);

    /// @brief Map an entity to a tree and start it; replaces any prior mapping
    Result<void> assign_tree_to_entity(const EntityId& entity_id, BehaviorTreeId tree_id);

    Result<void> pause_tree(BehaviorTreeId tree_id);
    Result<void> resume_tree(BehaviorTreeId tree_id);

    /// @brief Destroy a tree and every entity mapping pointing at it
    Result<void> remove_tree(BehaviorTreeId tree_id);

    BehaviorTree* get_tree(BehaviorTreeId tree_id);
    const BehaviorTree* get_tree(BehaviorTreeId tree_id) const;

    /// @brief Tree currently mapped to the entity
    std::optional<BehaviorTreeId> tree_for_entity(const EntityId& entity_id) const;

    // -------------------------------------------------------------------------
    // Ticking
    // -------------------------------------------------------------------------

    /// @brief Tick every active tree once, within the time budget
    void update(float dt);

    // -------------------------------------------------------------------------
    // Blackboard access
    // -------------------------------------------------------------------------

    Result<void> update_blackboard(const EntityId& entity_id, std::string_view key, RuntimeValue value);

    /// @return EntityNotAssigned if the entity has no tree, nullopt if the key is absent
    Result<std::optional<RuntimeValue>> get_blackboard_value(const EntityId& entity_id,
                                                             std::string_view key) const;

    /// @brief Store wired into every tree when blackboard sharing is enabled
    const SharedStorePtr& shared_store() const { return m_shared_store; }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /// @brief Whether the tree is active (nullopt for unknown ids)
    std::optional<bool> get_tree_status(BehaviorTreeId tree_id) const;

    /// @brief Names of all trees, in creation order
    std::vector<std::string> get_tree_names() const;

    /// @brief Number of active trees, computed from the trees themselves
    std::uint32_t get_active_tree_count() const;

    std::size_t tree_count() const { return m_trees.size(); }

    const TreeConfig& config() const { return m_config; }
    const TreeSystemStats& stats() const { return m_stats; }

    /// @brief Structure and state of every tree (empty unless debugging is enabled)
    nlohmann::json debug_snapshot() const;

    /// @brief Time source used for the budget and handed to every tree
    void set_time_source(cortex_core::TimeSource source);

private:
    BehaviorTreeId next_id() { return BehaviorTreeId{m_next_id++}; }
    BehaviorTreeId insert_tree(BehaviorTreePtr tree);

    TreeConfig m_config;
    std::map<BehaviorTreeId, BehaviorTreePtr> m_trees;
    std::unordered_map<EntityId, BehaviorTreeId> m_entity_trees;
    SharedStorePtr m_shared_store;
    cortex_core::TimeSource m_time_source;
    TreeSystemStats m_stats;
    std::uint32_t m_next_id{1};
};

} // namespace cortex_ai
