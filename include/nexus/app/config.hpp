#pragma once

/// @file config.hpp
/// @brief Configuration for the nexus_plan tool
///
/// Loaded from a TOML file:
///
/// ```toml
/// [logging]
/// level = "info"
/// console = true
/// file = false
/// directory = "logs"
///
/// [data]
/// skills = "skills.json"
///
/// [output]
/// show_names = true
/// ```
///
/// Missing keys keep their defaults. Relative data paths resolve against the
/// directory of the config file.

#include <nexus/core/error.hpp>
#include <nexus/core/log.hpp>

#include <filesystem>
#include <string>

namespace nexus_app {

/// [logging] section
struct LoggingSettings {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    bool file = false;
    std::string directory = "logs";
};

/// Tool configuration
struct PlannerConfig {
    LoggingSettings logging;
    std::filesystem::path skills_path = "skills.json";  ///< [data] skills
    bool show_names = true;                             ///< [output] show_names

    /// Load from a TOML file
    [[nodiscard]] static nexus_core::Result<PlannerConfig> load(const std::filesystem::path& path);

    /// Parse from TOML text
    ///
    /// @param content TOML text
    /// @param source_name Used in error messages
    /// @param base_dir Directory relative data paths resolve against
    [[nodiscard]] static nexus_core::Result<PlannerConfig> from_toml_string(
        const std::string& content,
        const std::string& source_name = "<string>",
        const std::filesystem::path& base_dir = {});

    /// Logging section as a nexus_core::LogConfig
    [[nodiscard]] nexus_core::LogConfig to_log_config() const;
};

} // namespace nexus_app
