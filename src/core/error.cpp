/// @file error.cpp
/// @brief Error handling implementation for cortex_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Process-wide error statistics

#include <cortex/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace cortex_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* tree_error_kind_name(TreeError::Kind kind) {
    switch (kind) {
        case TreeError::Kind::TreeNotFound: return "TreeNotFound";
        case TreeError::Kind::EntityNotAssigned: return "EntityNotAssigned";
        case TreeError::Kind::DepthExceeded: return "DepthExceeded";
        case TreeError::Kind::InvalidConfig: return "InvalidConfig";
        default: return "Unknown";
    }
}

const char* event_error_kind_name(EventError::Kind kind) {
    switch (kind) {
        case EventError::Kind::HandlerNotFound: return "HandlerNotFound";
        case EventError::Kind::TriggerNotFound: return "TriggerNotFound";
        case EventError::Kind::CustomActionNotFound: return "CustomActionNotFound";
        case EventError::Kind::InvalidHook: return "InvalidHook";
        case EventError::Kind::ActionFailed: return "ActionFailed";
        default: return "Unknown";
    }
}

/// Format tree error with full context
std::string format_tree_error(const TreeError& err) {
    std::ostringstream oss;
    oss << "[TreeError:" << tree_error_kind_name(err.kind) << "] " << err.message;

    if (!err.tree.empty()) {
        oss << " (tree: " << err.tree << ")";
    }
    if (!err.entity.empty()) {
        oss << " (entity: " << err.entity << ")";
    }

    return oss.str();
}

/// Format event error with full context
std::string format_event_error(const EventError& err) {
    std::ostringstream oss;
    oss << "[EventError:" << event_error_kind_name(err.kind) << "] " << err.message;

    if (!err.subject.empty()) {
        oss << " (subject: " << err.subject << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, TreeError>) {
            oss << detail::format_tree_error(err);
        } else if constexpr (std::is_same_v<T, EventError>) {
            oss << detail::format_event_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> tree_errors{0};
    std::atomic<std::uint64_t> event_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<TreeError>()) {
        s_error_stats.tree_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<EventError>()) {
        s_error_stats.event_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.tree_errors.store(0, std::memory_order_relaxed);
    s_error_stats.event_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Tree: " << s_error_stats.tree_errors.load() << "\n"
        << "  Event: " << s_error_stats.event_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace cortex_core
