/// @file config.hpp
/// @brief Scheduler configuration for cortex_ai module

#pragma once

#include "fwd.hpp"

#include <cortex/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace cortex_ai {

using cortex_core::Result;

// =============================================================================
// TreeConfig
// =============================================================================

/// @brief Configuration of a BehaviorTreeSystem
struct TreeConfig {
    std::uint32_t max_execution_time_ms = 16;   ///< Soft budget per update()
    std::uint32_t max_depth = 20;               ///< Enforced by add_tree()
    bool enable_blackboard_sharing = true;      ///< Wire trees to one shared store
    bool enable_debugging = true;               ///< Populate debug_snapshot()
    float tick_rate_hz = 30.0f;                 ///< Default rate for created trees
    std::uint32_t memory_limit_mb = 64;         ///< Informational only

    /// @brief Check value ranges
    [[nodiscard]] Result<void> validate() const;

    /// @brief Parse from JSON; absent fields keep their defaults
    [[nodiscard]] static Result<TreeConfig> from_json_string(const std::string& json_str);

    /// @brief Load from a JSON file
    [[nodiscard]] static Result<TreeConfig> load(const std::filesystem::path& path);

    /// @brief Serialize to a JSON document
    [[nodiscard]] std::string to_json_string() const;
};

} // namespace cortex_ai
