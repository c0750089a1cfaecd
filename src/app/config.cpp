/// @file config.cpp
/// @brief PlannerConfig (planner.toml) parsing implementation

#include <nexus/app/config.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace nexus_app {

namespace {

nexus_core::Result<void> parse_logging(const toml::table& tbl, LoggingSettings& logging) {
    if (auto level = tbl["level"].value<std::string>()) {
        auto parsed = nexus_core::parse_log_level(*level);
        if (!parsed) {
            return nexus_core::Err(nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Unknown log level '" + *level + "'"));
        }
        logging.level = *parsed;
    }
    if (auto console = tbl["console"].value<bool>()) {
        logging.console = *console;
    }
    if (auto file = tbl["file"].value<bool>()) {
        logging.file = *file;
    }
    if (auto directory = tbl["directory"].value<std::string>()) {
        logging.directory = *directory;
    }
    return nexus_core::Ok();
}

} // anonymous namespace

// =============================================================================
// PlannerConfig Implementation
// =============================================================================

nexus_core::Result<PlannerConfig> PlannerConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return nexus_core::Err<PlannerConfig>(nexus_core::Error(nexus_core::ErrorCode::IOError,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return from_toml_string(buffer.str(), path.string(), path.parent_path());
}

nexus_core::Result<PlannerConfig> PlannerConfig::from_toml_string(
    const std::string& content,
    const std::string& source_name,
    const std::filesystem::path& base_dir)
{
    PlannerConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        // [logging]
        if (auto logging = tbl["logging"].as_table()) {
            auto result = parse_logging(*logging, config.logging);
            if (!result) {
                return nexus_core::Err<PlannerConfig>(nexus_core::Error(nexus_core::ErrorCode::ParseError,
                    source_name + ": " + result.error().message()));
            }
        }

        // [data]
        if (auto data = tbl["data"].as_table()) {
            if (auto skills = (*data)["skills"].value<std::string>()) {
                std::filesystem::path skills_path = *skills;
                if (skills_path.is_relative() && !base_dir.empty()) {
                    skills_path = base_dir / skills_path;
                }
                config.skills_path = skills_path;
            }
        }

        // [output]
        if (auto output = tbl["output"].as_table()) {
            if (auto show_names = (*output)["show_names"].value<bool>()) {
                config.show_names = *show_names;
            }
        }

    } catch (const toml::parse_error& err) {
        return nexus_core::Err<PlannerConfig>(nexus_core::Error(nexus_core::ErrorCode::ParseError,
            "TOML parse error: " + std::string(err.what())));
    }

    return config;
}

nexus_core::LogConfig PlannerConfig::to_log_config() const {
    nexus_core::LogConfig log_config;
    log_config.console_enabled = logging.console;
    log_config.file_enabled = logging.file;
    log_config.log_directory = logging.directory;
    log_config.level = logging.level;
    return log_config;
}

} // namespace nexus_app
