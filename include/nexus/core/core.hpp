#pragma once

/// @file core.hpp
/// @brief Main include file for nexus_core module

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

/// @namespace nexus_core
/// @brief Shared infrastructure for nexus
///
/// - **Error Handling**: Result<T> monadic error handling with SkillError kinds
/// - **Logging**: spdlog named loggers, console and rotating file sinks
///
/// Example usage:
/// @code
/// #include <nexus/core/core.hpp>
///
/// using namespace nexus_core;
///
/// Result<int> checked_level(int level) {
///     if (level < 1 || level > 5) {
///         return Err<int>(SkillError::invalid_level(0, level));
///     }
///     return Ok(level);
/// }
/// @endcode

namespace nexus_core {

/// Library version string
[[nodiscard]] inline const char* nexus_version_string() {
    return "nexus 0.1.0";
}

} // namespace nexus_core
