#pragma once

/// @file types.hpp
/// @brief Value types shared by the skill queue resolver

#include "fwd.hpp"
#include <nexus/core/error.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace nexus_skill {

// =============================================================================
// Levels
// =============================================================================

/// Untrained
inline constexpr int kMinSkillLevel = 0;

/// Highest trainable level
inline constexpr int kMaxSkillLevel = 5;

/// Check that a level can be requested as a training target (1..5)
[[nodiscard]] constexpr bool is_valid_target_level(int level) noexcept {
    return level > kMinSkillLevel && level <= kMaxSkillLevel;
}

/// Check that a level can describe an already trained skill (0..5)
[[nodiscard]] constexpr bool is_valid_baseline_level(int level) noexcept {
    return level >= kMinSkillLevel && level <= kMaxSkillLevel;
}

// =============================================================================
// SkillRequirement
// =============================================================================

/// A direct prerequisite: skill_id must be trained to at least level
struct SkillRequirement {
    SkillId skill_id = 0;
    int level = 0;

    bool operator==(const SkillRequirement& other) const = default;
};

// =============================================================================
// TrainingStep
// =============================================================================

/// "Train skill_id to exactly this level next"
struct TrainingStep {
    SkillId skill_id = 0;
    int level = 0;

    bool operator==(const TrainingStep& other) const = default;

    bool operator<(const TrainingStep& other) const {
        if (skill_id != other.skill_id) return skill_id < other.skill_id;
        return level < other.level;
    }

    /// Plan string form "<id>:<level>"
    [[nodiscard]] std::string to_string() const {
        return std::to_string(skill_id) + ":" + std::to_string(level);
    }
};

// =============================================================================
// Requests and Results
// =============================================================================

/// One input item of a batch correction
struct SkillRequest {
    SkillId skill_id = 0;
    int level = 0;

    bool operator==(const SkillRequest& other) const = default;
};

/// Non-fatal condition surfaced alongside a result
struct ResolveWarning {
    enum class Kind : std::uint8_t {
        UnknownSkill,  ///< Provider had no data; treated as depth 0 without prerequisites
    };

    Kind kind = Kind::UnknownSkill;
    SkillId skill_id = 0;
    std::string message;

    bool operator==(const ResolveWarning& other) const = default;
};

/// Output of an interactive request
struct ResolveResult {
    std::vector<TrainingStep> steps;       ///< Newly emitted steps, in training order
    std::vector<ResolveWarning> warnings;  ///< Degraded lookups hit while resolving

    [[nodiscard]] bool empty() const noexcept { return steps.empty(); }
};

/// A batch item that could not be resolved
struct RequestFailure {
    std::size_t index = 0;  ///< Position in the input list
    SkillRequest request;
    nexus_core::Error error;
};

/// Output of a batch correction
struct QueueCorrection {
    std::vector<TrainingStep> steps;
    std::vector<ResolveWarning> warnings;
    std::vector<RequestFailure> failures;

    /// True when every input item was resolved
    [[nodiscard]] bool complete() const noexcept { return failures.empty(); }
};

/// Join steps into plan string form, one "<id>:<level>" per line
[[nodiscard]] std::string format_steps(const std::vector<TrainingStep>& steps);

} // namespace nexus_skill
