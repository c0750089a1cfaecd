/// @file resolver.cpp
/// @brief QueueResolver implementation

#include <nexus/skill/resolver.hpp>
#include <nexus/skill/orderer.hpp>
#include <nexus/core/log.hpp>

#include <spdlog/stopwatch.h>

#include <algorithm>

namespace nexus_skill {

// =============================================================================
// Construction
// =============================================================================

QueueResolver::QueueResolver(const SkillRequirementProvider& provider)
    : m_depths(provider)
    , m_expander(provider)
{
}

// =============================================================================
// Character State
// =============================================================================

void QueueResolver::set_trained_levels(std::map<SkillId, int> levels) {
    m_trained_levels = std::move(levels);
}

int QueueResolver::trained_level(SkillId id) const {
    auto it = m_trained_levels.find(id);
    return it != m_trained_levels.end() ? it->second : 0;
}

// =============================================================================
// Interactive Mode
// =============================================================================

nexus_core::Result<ResolveResult> QueueResolver::add_skill_request(SkillId id, int target_level) {
    return add_skill_request(id, target_level, trained_level(id));
}

nexus_core::Result<ResolveResult> QueueResolver::add_skill_request(
    SkillId id,
    int target_level,
    int baseline_level) {

    auto logger = nexus_core::skill_logger();

    if (!is_valid_target_level(target_level)) {
        logger->error("Rejected request for skill {}: target level {} outside 1-{}",
            id, target_level, kMaxSkillLevel);
        return nexus_core::Err<ResolveResult>(nexus_core::SkillError::invalid_level(id, target_level));
    }
    if (!is_valid_baseline_level(baseline_level)) {
        logger->error("Rejected request for skill {}: baseline level {} outside 0-{}",
            id, baseline_level, kMaxSkillLevel);
        return nexus_core::Err<ResolveResult>(
            nexus_core::Error(nexus_core::SkillError::invalid_level(id, baseline_level))
                .with_context("field", "baseline_level"));
    }

    ResolveResult result;

    if (!m_session.is_added(id)) {
        logger->debug("Skill {} not in plan yet, expanding prerequisites", id);

        // First touch always walks the full ladder from level 1
        auto expansion = m_expander.expand(id, target_level, 1);
        if (!expansion) {
            logger->error("Failed to expand skill {}: {}", id, expansion.error().message());
            return nexus_core::Err<ResolveResult>(expansion.error());
        }

        auto ordered = order_new_steps(expansion->steps, m_session.emitted_steps);
        if (!ordered) {
            logger->error("Failed to order steps for skill {}: {}", id, ordered.error().message());
            return nexus_core::Err<ResolveResult>(ordered.error());
        }

        result.steps = std::move(*ordered);
        result.warnings = make_warnings(expansion->unknown_skills);

        for (const auto& [prereq_id, required_level] : expansion->required_levels) {
            m_session.added_skills.insert(prereq_id);
            auto& level = m_session.session_levels[prereq_id];
            level = std::max(level, required_level);
        }
        m_session.added_skills.insert(id);
        m_session.session_levels[id] = target_level;
    } else if (target_level > m_session.session_level(id)) {
        logger->debug("Raising skill {} from session level {} to {}",
            id, m_session.session_level(id), target_level);

        for (int level = baseline_level + 1; level <= target_level; ++level) {
            TrainingStep step{id, level};
            if (!m_session.has_emitted(step)) {
                result.steps.push_back(step);
            }
        }
        m_session.session_levels[id] = target_level;
    } else {
        logger->debug("Skill {} already planned to level {}, nothing to add",
            id, m_session.session_level(id));
        return nexus_core::Ok(std::move(result));
    }

    for (const auto& step : result.steps) {
        m_session.emitted_steps.insert(step);
    }

    logger->debug("Added {} step(s) for skill {} level {}", result.steps.size(), id, target_level);
    return nexus_core::Ok(std::move(result));
}

void QueueResolver::reset_session() {
    m_session.clear();
}

// =============================================================================
// Batch Mode
// =============================================================================

QueueCorrection QueueResolver::correct_queue(const std::vector<SkillRequest>& requests) {
    auto logger = nexus_core::skill_logger();
    spdlog::stopwatch timer;

    logger->debug("Correcting skill queue with {} request(s)", requests.size());

    QueueCorrection correction;
    QueueSession batch;
    std::map<SkillId, RequirementClosure> closures;
    std::set<SkillId> warned;

    for (std::size_t i = 0; i < requests.size(); ++i) {
        const auto& request = requests[i];
        logger->debug("Processing request {}: skill {} level {}", i + 1, request.skill_id, request.level);

        auto fail = [&](nexus_core::Error error) {
            logger->error("Request {} (skill {} level {}) failed: {}",
                i + 1, request.skill_id, request.level, error.message());
            error.with_context("index", std::to_string(i));
            correction.failures.push_back(RequestFailure{i, request, std::move(error)});
        };

        if (!is_valid_target_level(request.level)) {
            fail(nexus_core::SkillError::invalid_level(request.skill_id, request.level));
            continue;
        }

        auto cached = closures.find(request.skill_id);
        if (cached == closures.end()) {
            auto closure = m_expander.collect(request.skill_id);
            if (!closure) {
                fail(closure.error());
                continue;
            }
            cached = closures.emplace(request.skill_id, std::move(*closure)).first;
        }

        Expansion expansion = PrerequisiteExpander::to_expansion(
            cached->second, request.skill_id, 1, request.level);

        auto ordered = order_new_steps(expansion.steps, batch.emitted_steps);
        if (!ordered) {
            fail(ordered.error());
            continue;
        }

        for (const auto& step : *ordered) {
            batch.emitted_steps.insert(step);
            correction.steps.push_back(step);
        }

        std::vector<SkillId> newly_unknown;
        for (SkillId unknown : expansion.unknown_skills) {
            if (warned.insert(unknown).second) {
                newly_unknown.push_back(unknown);
            }
        }
        for (auto& warning : make_warnings(newly_unknown)) {
            correction.warnings.push_back(std::move(warning));
        }

        logger->debug("  added {} step(s), skipped {} duplicate(s)",
            ordered->size(), expansion.steps.size() - ordered->size());
    }

    logger->debug("Queue correction finished in {:.3}s: {} step(s), {} failure(s)",
        timer, correction.steps.size(), correction.failures.size());
    return correction;
}

// =============================================================================
// Cache
// =============================================================================

void QueueResolver::invalidate_cache() {
    m_depths.clear();
}

// =============================================================================
// Private Methods
// =============================================================================

nexus_core::Result<std::vector<TrainingStep>> QueueResolver::order_new_steps(
    const std::set<TrainingStep>& steps,
    const std::set<TrainingStep>& emitted) {

    StepOrderer orderer(m_depths);
    auto ordered = orderer.order(steps);
    if (!ordered) {
        return ordered;
    }

    std::vector<TrainingStep> fresh;
    fresh.reserve(ordered->size());
    for (const auto& step : *ordered) {
        if (!emitted.count(step)) {
            fresh.push_back(step);
        }
    }
    return nexus_core::Ok(std::move(fresh));
}

std::vector<ResolveWarning> QueueResolver::make_warnings(const std::vector<SkillId>& unknown_skills) const {
    std::vector<ResolveWarning> warnings;
    warnings.reserve(unknown_skills.size());

    for (SkillId id : unknown_skills) {
        nexus_core::skill_logger()->warn(
            "Skill {} has no catalog data; treating it as having no prerequisites", id);
        warnings.push_back(ResolveWarning{
            ResolveWarning::Kind::UnknownSkill,
            id,
            "Unknown skill " + std::to_string(id) + ": no prerequisite data"});
    }

    return warnings;
}

} // namespace nexus_skill
