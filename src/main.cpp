/// @file main.cpp
/// @brief nexus_plan entry point - corrects a skill plan against a skill catalog
///
/// Reads a "Name Level" plan, resolves every prerequisite through the
/// QueueResolver and prints the complete training queue, one step per line.

#include <nexus/app/config.hpp>
#include <nexus/core/core.hpp>
#include <nexus/skill/skill.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitPartial = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [PLAN_FILE]\n"
              << "\n"
              << "Reads a skill plan (one \"<skill name> <level>\" per line) from PLAN_FILE\n"
              << "or stdin and prints the corrected training queue.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE   Configuration file (default: planner.toml if present)\n"
              << "  -s, --skills FILE   Skill catalog JSON (overrides [data] skills)\n"
              << "      --verbose       Enable debug logging\n"
              << "  -h, --help          Show this help\n"
              << "  -v, --version       Show version\n";
}

void print_version() {
    std::cout << nexus_core::nexus_version_string() << "\n";
}

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path config_path;
    fs::path skills_override;
    fs::path plan_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return kExitOk;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--skills" || arg == "-s") && i + 1 < argc) {
            skills_override = argv[++i];
        } else if (arg[0] != '-' && plan_path.empty()) {
            plan_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    // Configuration
    nexus_app::PlannerConfig config;
    if (config_path.empty() && fs::exists("planner.toml")) {
        config_path = "planner.toml";
    }
    if (!config_path.empty()) {
        auto loaded = nexus_app::PlannerConfig::load(config_path);
        if (!loaded) {
            std::cerr << nexus_core::build_error_chain(loaded.error()) << "\n";
            return kExitUsage;
        }
        config = std::move(*loaded);
    }
    if (!skills_override.empty()) {
        config.skills_path = skills_override;
    }

    auto log_config = config.to_log_config();
    if (verbose) {
        log_config.level = spdlog::level::debug;
    }
    auto logging = nexus_core::configure_logging(log_config);
    if (!logging) {
        std::cerr << nexus_core::build_error_chain(logging.error()) << "\n";
        return kExitUsage;
    }
    auto logger = nexus_core::app_logger();

    // Skill catalog
    logger->info("Loading skill catalog: {}", config.skills_path.string());
    auto tree = nexus_skill::SkillTree::load(config.skills_path);
    if (!tree) {
        logger->error("Failed to load skill catalog: {}", nexus_core::build_error_chain(tree.error()));
        nexus_core::shutdown_logging();
        return kExitUsage;
    }

    // Plan text
    std::string plan_text;
    if (plan_path.empty()) {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        plan_text = buffer.str();
    } else {
        auto text = read_text(plan_path);
        if (!text) {
            logger->error("Failed to open plan file: {}", plan_path.string());
            nexus_core::shutdown_logging();
            return kExitUsage;
        }
        plan_text = std::move(*text);
    }

    nexus_skill::SkillPlanReader reader(*tree);
    auto plan = reader.parse(plan_text);

    for (const auto& line : plan.parse_errors) {
        std::cerr << "unparsable line: " << line << "\n";
    }
    for (const auto& name : plan.not_found) {
        std::cerr << "unknown skill: " << name << "\n";
    }

    // Resolution
    nexus_skill::QueueResolver resolver(*tree);
    auto correction = resolver.correct_queue(plan.requests);

    for (const auto& step : correction.steps) {
        std::cout << step.to_string();
        if (config.show_names) {
            auto name = tree->skill_name(step.skill_id);
            std::cout << "\t" << (name ? *name : "Unknown Skill (" + std::to_string(step.skill_id) + ")");
        }
        std::cout << "\n";
    }

    for (const auto& warning : correction.warnings) {
        std::cerr << "warning: " << warning.message << "\n";
    }
    for (const auto& failure : correction.failures) {
        std::cerr << "failed item " << (failure.index + 1) << ": "
                  << nexus_core::build_error_chain(failure.error) << "\n";
    }

    logger->info("Queue: {} step(s) from {} request(s)", correction.steps.size(), plan.requests.size());
    nexus_core::shutdown_logging();

    if (!correction.complete() || plan.has_errors()) {
        return kExitPartial;
    }
    return kExitOk;
}
