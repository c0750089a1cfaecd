/// @file log.cpp
/// @brief nexus_skill / nexus_plan logger setup

#include <nexus/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <vector>

namespace nexus_core {

namespace {

struct Loggers {
    std::mutex mutex;
    LogConfig config;
    std::shared_ptr<spdlog::logger> skill;
    std::shared_ptr<spdlog::logger> plan;
};

Loggers& loggers() {
    static Loggers instance;
    return instance;
}

/// Throws spdlog::spdlog_ex when the log file cannot be opened
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled) {
        auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), config.max_file_size, config.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(std::move(file));
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> get_or_create(std::shared_ptr<spdlog::logger> Loggers::*slot,
                                              const char* name) {
    auto& state = loggers();
    std::lock_guard<std::mutex> lock(state.mutex);

    auto& logger = state.*slot;
    if (!logger) {
        try {
            logger = make_logger(name, state.config);
        } catch (const spdlog::spdlog_ex&) {
            // File sink became unavailable since configure_logging; keep the console
            LogConfig console_only = state.config;
            console_only.file_enabled = false;
            logger = make_logger(name, console_only);
        }
    }
    return logger;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

Result<void> configure_logging(const LogConfig& config) {
    if (config.file_enabled && config.log_directory.empty()) {
        return Err(Error(ErrorCode::InvalidArgument, "File logging enabled without a log directory"));
    }

    std::shared_ptr<spdlog::logger> skill;
    std::shared_ptr<spdlog::logger> plan;
    try {
        skill = make_logger(kSkillLoggerName, config);
        plan = make_logger(kPlanLoggerName, config);
    } catch (const spdlog::spdlog_ex& ex) {
        return Err(Error(ErrorCode::IOError, std::string("Failed to open log file: ") + ex.what())
            .with_context("directory", config.log_directory));
    }

    auto& state = loggers();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.skill) state.skill->flush();
    if (state.plan) state.plan->flush();
    state.config = config;
    state.skill = std::move(skill);
    state.plan = std::move(plan);
    return Ok();
}

std::shared_ptr<spdlog::logger> skill_logger() {
    return get_or_create(&Loggers::skill, kSkillLoggerName);
}

std::shared_ptr<spdlog::logger> app_logger() {
    return get_or_create(&Loggers::plan, kPlanLoggerName);
}

// =============================================================================
// Levels
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical" || name == "fatal") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Shutdown
// =============================================================================

void shutdown_logging() {
    auto& state = loggers();
    std::lock_guard<std::mutex> lock(state.mutex);

    for (auto* logger : {&state.skill, &state.plan}) {
        if (*logger) {
            (*logger)->flush();
            logger->reset();
        }
    }
}

} // namespace nexus_core
