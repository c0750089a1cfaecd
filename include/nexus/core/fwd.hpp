#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for nexus_core module

#include <cstdint>

namespace nexus_core {

enum class ErrorCode : std::uint8_t;
struct SkillError;
class Error;

template<typename T>
class Result;

struct LogConfig;

} // namespace nexus_core
