#pragma once

/// @file log.hpp
/// @brief Loggers for the resolver and the nexus_plan tool
///
/// Two spdlog loggers exist: `nexus_skill` (catalog and resolution) and
/// `nexus_plan` (command line tool). Both write to stderr so stdout stays
/// reserved for the training queue, and optionally to a rotating file per
/// logger under LogConfig::log_directory.

#include "error.hpp"
#include "fwd.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace nexus_core {

inline constexpr const char* kSkillLoggerName = "nexus_skill";
inline constexpr const char* kPlanLoggerName = "nexus_plan";

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;                     ///< Required when file_enabled
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

/// Rebuild both loggers from config
///
/// Fails with IOError if a log file cannot be opened; the previous loggers stay
/// in place in that case.
[[nodiscard]] Result<void> configure_logging(const LogConfig& config);

/// Catalog and resolver logger
std::shared_ptr<spdlog::logger> skill_logger();

/// Command line tool logger
std::shared_ptr<spdlog::logger> app_logger();

/// Accepts trace, debug, info, warn/warning, error/err, critical/fatal, off
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

/// Flush and release both loggers
void shutdown_logging();

} // namespace nexus_core
