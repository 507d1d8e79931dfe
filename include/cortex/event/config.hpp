#pragma once

/// @file config.hpp
/// @brief EventSystem configuration

#include "fwd.hpp"

#include <cortex/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace cortex_event {

using cortex_core::Result;

// =============================================================================
// EventSystemConfig
// =============================================================================

struct EventSystemConfig {
    std::size_t bus_capacity = 10000;           ///< Global bus bound
    std::uint32_t max_processing_time_ms = 16;  ///< Soft budget per update()
    bool isolate_action_errors = true;          ///< Log and continue instead of failing update()
    bool register_builtin_hooks = true;         ///< Install the stock hooks on initialize()
    std::uint32_t stats_interval_ms = 1000;     ///< Refresh period of rate statistics

    [[nodiscard]] Result<void> validate() const;

    /// Parse from JSON; absent fields keep their defaults
    [[nodiscard]] static Result<EventSystemConfig> from_json_string(const std::string& json_str);

    [[nodiscard]] static Result<EventSystemConfig> load(const std::filesystem::path& path);

    [[nodiscard]] std::string to_json_string() const;
};

} // namespace cortex_event
