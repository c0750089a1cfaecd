/// @file expander.cpp
/// @brief PrerequisiteExpander implementation

#include <nexus/skill/expander.hpp>

#include <algorithm>

namespace nexus_skill {

nexus_core::Result<RequirementClosure> PrerequisiteExpander::collect(SkillId id) const {
    RequirementClosure closure;
    std::set<SkillId> visited;
    std::set<SkillId> in_stack;
    std::vector<SkillId> current_path;

    auto result = visit(id, closure, visited, in_stack, current_path);
    if (!result) {
        return nexus_core::Err<RequirementClosure>(result.error());
    }

    std::sort(closure.unknown_skills.begin(), closure.unknown_skills.end());
    return nexus_core::Ok(std::move(closure));
}

nexus_core::Result<Expansion> PrerequisiteExpander::expand(
    SkillId id,
    int target_level,
    int first_level) const {

    if (!is_valid_target_level(target_level)) {
        return nexus_core::Err<Expansion>(nexus_core::SkillError::invalid_level(id, target_level));
    }
    if (first_level < 1) {
        return nexus_core::Err<Expansion>(nexus_core::SkillError::invalid_level(id, first_level));
    }

    auto closure = collect(id);
    if (!closure) {
        return nexus_core::Err<Expansion>(closure.error());
    }

    return nexus_core::Ok(to_expansion(*closure, id, first_level, target_level));
}

Expansion PrerequisiteExpander::to_expansion(
    const RequirementClosure& closure,
    SkillId id,
    int first_level,
    int target_level) {

    Expansion expansion;
    expansion.required_levels = closure.required_levels;
    expansion.unknown_skills = closure.unknown_skills;

    for (const auto& [skill_id, max_level] : closure.required_levels) {
        append_ladder(expansion.steps, skill_id, 1, max_level);
    }
    append_ladder(expansion.steps, id, first_level, target_level);

    return expansion;
}

void PrerequisiteExpander::append_ladder(std::set<TrainingStep>& steps, SkillId id, int from, int to) {
    for (int level = std::max(from, 1); level <= std::min(to, kMaxSkillLevel); ++level) {
        steps.insert(TrainingStep{id, level});
    }
}

// =============================================================================
// Private Methods
// =============================================================================

nexus_core::Result<void> PrerequisiteExpander::visit(
    SkillId id,
    RequirementClosure& closure,
    std::set<SkillId>& visited,
    std::set<SkillId>& in_stack,
    std::vector<SkillId>& current_path) const {

    if (in_stack.count(id)) {
        auto start = std::find(current_path.begin(), current_path.end(), id);
        std::vector<SkillId> cycle(start, current_path.end());
        cycle.push_back(id);
        return nexus_core::Err(nexus_core::SkillError::cyclic_dependency(std::move(cycle)));
    }

    // An ancestor's own prerequisites do not depend on the level it is needed at
    if (visited.count(id)) {
        return nexus_core::Ok();
    }
    visited.insert(id);

    auto reqs = m_provider->requirements_of(id);
    if (!reqs) {
        if (reqs.error().code() != nexus_core::ErrorCode::NotFound) {
            return nexus_core::Err(reqs.error());
        }
        closure.unknown_skills.push_back(id);
        return nexus_core::Ok();
    }

    in_stack.insert(id);
    current_path.push_back(id);

    for (const auto& req : *reqs) {
        auto& level = closure.required_levels[req.skill_id];
        level = std::max(level, req.level);

        auto result = visit(req.skill_id, closure, visited, in_stack, current_path);
        if (!result) {
            return result;
        }
    }

    in_stack.erase(id);
    current_path.pop_back();

    return nexus_core::Ok();
}

} // namespace nexus_skill
