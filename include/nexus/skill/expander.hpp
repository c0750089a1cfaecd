#pragma once

/// @file expander.hpp
/// @brief Transitive prerequisite expansion into training steps

#include "fwd.hpp"
#include "provider.hpp"
#include "types.hpp"
#include <nexus/core/error.hpp>

#include <map>
#include <set>
#include <vector>

namespace nexus_skill {

/// Every ancestor of a skill with the highest level any path demands
struct RequirementClosure {
    std::map<SkillId, int> required_levels;
    std::vector<SkillId> unknown_skills;  ///< Visited skills the provider had no data for, ascending
};

/// Unordered steps needed to train a skill to a target level
struct Expansion {
    std::set<TrainingStep> steps;
    std::map<SkillId, int> required_levels;
    std::vector<SkillId> unknown_skills;
};

/// Expands a (skill, level) request into its full prerequisite closure
///
/// Each ancestor is expanded to its complete ladder, levels 1 through the
/// maximum required level, since every intermediate level is itself a step.
class PrerequisiteExpander {
public:
    explicit PrerequisiteExpander(const SkillRequirementProvider& provider)
        : m_provider(&provider) {}

    /// Collect all ancestors of a skill
    [[nodiscard]] nexus_core::Result<RequirementClosure> collect(SkillId id) const;

    /// Expand a skill into prerequisite ladders plus its own ladder
    ///
    /// @param id Skill to train
    /// @param target_level Level to reach (1..5)
    /// @param first_level First level of the skill's own ladder; a value above
    ///        target_level contributes no steps for the skill itself
    [[nodiscard]] nexus_core::Result<Expansion> expand(
        SkillId id,
        int target_level,
        int first_level = 1) const;

    /// Turn a closure into steps, optionally adding the target's ladder
    [[nodiscard]] static Expansion to_expansion(
        const RequirementClosure& closure,
        SkillId id,
        int first_level,
        int target_level);

    /// Insert levels [from, to] of a skill
    static void append_ladder(std::set<TrainingStep>& steps, SkillId id, int from, int to);

private:
    nexus_core::Result<void> visit(
        SkillId id,
        RequirementClosure& closure,
        std::set<SkillId>& visited,
        std::set<SkillId>& in_stack,
        std::vector<SkillId>& current_path) const;

    const SkillRequirementProvider* m_provider;
};

} // namespace nexus_skill
