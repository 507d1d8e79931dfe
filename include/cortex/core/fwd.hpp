#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for cortex_core module

#include <cstdint>

namespace cortex_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Values
// =============================================================================

struct Vec3;
enum class ValueType : std::uint8_t;
class RuntimeValue;

// =============================================================================
// Time
// =============================================================================

class ManualClock;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace cortex_core
