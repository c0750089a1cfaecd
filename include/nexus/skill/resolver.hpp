#pragma once

/// @file resolver.hpp
/// @brief Skill queue resolution
///
/// The QueueResolver turns "train skill X to level N" requests into the
/// complete, ordered, duplicate-free list of training steps, including every
/// transitive prerequisite. It supports two modes:
///
/// - Interactive: add_skill_request() is called once per user action and
///   returns only the steps not emitted earlier in the same session.
/// - Batch: correct_queue() repairs a whole plan in one call, processing
///   requests in input order with global deduplication.
///
/// ```cpp
/// auto tree = SkillTree::load("skills.json");
/// QueueResolver resolver(*tree);
///
/// auto added = resolver.add_skill_request(gunnery_id, 3);
/// if (!added) {
///     std::cerr << nexus_core::build_error_chain(added.error()) << "\n";
/// }
///
/// auto fixed = resolver.correct_queue({{turret_id, 4}, {gunnery_id, 5}});
/// ```

#include "fwd.hpp"
#include "depth.hpp"
#include "expander.hpp"
#include "provider.hpp"
#include "types.hpp"
#include <nexus/core/error.hpp>

#include <map>
#include <set>
#include <vector>

namespace nexus_skill {

// =============================================================================
// QueueSession
// =============================================================================

/// Mutable state accumulated across interactive requests
struct QueueSession {
    std::set<SkillId> added_skills;          ///< Skills touched at least once
    std::map<SkillId, int> session_levels;   ///< Highest level emitted per skill
    std::set<TrainingStep> emitted_steps;    ///< Steps already returned

    [[nodiscard]] bool is_added(SkillId id) const { return added_skills.count(id) > 0; }

    [[nodiscard]] int session_level(SkillId id) const {
        auto it = session_levels.find(id);
        return it != session_levels.end() ? it->second : 0;
    }

    [[nodiscard]] bool has_emitted(const TrainingStep& step) const {
        return emitted_steps.count(step) > 0;
    }

    [[nodiscard]] bool empty() const noexcept { return added_skills.empty() && emitted_steps.empty(); }

    void clear() {
        added_skills.clear();
        session_levels.clear();
        emitted_steps.clear();
    }
};

// =============================================================================
// QueueResolver
// =============================================================================

/// Resolves training requests against a prerequisite provider
///
/// Thread-safety: The resolver is NOT thread-safe. add_skill_request() mutates
/// the session and the depth cache; confine an instance to one owner. Build a
/// fresh resolver (or call invalidate_cache()) whenever the provider's data
/// changes, since cached depths are never revalidated.
class QueueResolver {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    explicit QueueResolver(const SkillRequirementProvider& provider);

    // Non-copyable, movable
    QueueResolver(const QueueResolver&) = delete;
    QueueResolver& operator=(const QueueResolver&) = delete;
    QueueResolver(QueueResolver&&) = default;
    QueueResolver& operator=(QueueResolver&&) = default;

    // =========================================================================
    // Character State
    // =========================================================================

    /// Set the character's trained level per skill
    void set_trained_levels(std::map<SkillId, int> levels);

    /// Trained level of a skill (0 when unknown)
    [[nodiscard]] int trained_level(SkillId id) const;

    // =========================================================================
    // Interactive Mode
    // =========================================================================

    /// Add a skill to the plan, using the trained level map as baseline
    [[nodiscard]] nexus_core::Result<ResolveResult> add_skill_request(SkillId id, int target_level);

    /// Add a skill to the plan
    ///
    /// The first request for a skill in a session expands its prerequisites
    /// and emits its ladder from level 1, whatever the baseline. Later
    /// requests for a higher level emit only baseline_level+1 .. target_level.
    /// A request at or below the session level emits nothing.
    ///
    /// @param id Skill to train
    /// @param target_level Level to reach (1..5)
    /// @param baseline_level Level the character already has (0..5)
    /// @return Steps not emitted earlier in this session, in training order
    [[nodiscard]] nexus_core::Result<ResolveResult> add_skill_request(
        SkillId id,
        int target_level,
        int baseline_level);

    /// Current session state
    [[nodiscard]] const QueueSession& session() const noexcept { return m_session; }

    /// Start a new interactive session
    void reset_session();

    // =========================================================================
    // Batch Mode
    // =========================================================================

    /// Correct a whole plan
    ///
    /// Each request is expanded and ordered on its own; steps already emitted
    /// by an earlier request are skipped. A request that fails is recorded in
    /// QueueCorrection::failures and the remaining requests still run. The
    /// interactive session is left untouched.
    [[nodiscard]] QueueCorrection correct_queue(const std::vector<SkillRequest>& requests);

    // =========================================================================
    // Cache
    // =========================================================================

    /// Drop memoized depths
    void invalidate_cache();

    /// Number of memoized depths
    [[nodiscard]] std::size_t cached_depths() const noexcept { return m_depths.cache_size(); }

private:
    /// Order steps and keep those not yet in the emitted set
    nexus_core::Result<std::vector<TrainingStep>> order_new_steps(
        const std::set<TrainingStep>& steps,
        const std::set<TrainingStep>& emitted);

    std::vector<ResolveWarning> make_warnings(const std::vector<SkillId>& unknown_skills) const;

    DepthCalculator m_depths;
    PrerequisiteExpander m_expander;
    QueueSession m_session;
    std::map<SkillId, int> m_trained_levels;
};

} // namespace nexus_skill
