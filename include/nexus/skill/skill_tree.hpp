#pragma once

/// @file skill_tree.hpp
/// @brief In-memory skill catalog
///
/// The SkillTree holds every known skill with its display name and raw
/// requirement rows, and serves them to the resolver through the
/// SkillRequirementProvider interface. It can be populated programmatically
/// or loaded from a JSON catalog:
///
/// ```json
/// {
///   "skills": [
///     { "id": 3300, "name": "Gunnery" },
///     { "id": 3301, "name": "Small Hybrid Turret",
///       "requires": [ { "skill": 3300, "level": 1 } ] }
///   ]
/// }
/// ```

#include "fwd.hpp"
#include "provider.hpp"
#include "types.hpp"
#include <nexus/core/error.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nexus_skill {

// =============================================================================
// SkillInfo
// =============================================================================

/// A catalog entry
struct SkillInfo {
    SkillId id = 0;
    std::string name;
    std::vector<SkillRequirement> requirements;  ///< Raw rows, may repeat a skill
};

/// One edge in a transitive requirement listing
struct RequirementEntry {
    SkillId skill_id = 0;
    std::string name;
    int level = 0;
    std::optional<SkillId> parent_id;  ///< Skill that needs this one (nullopt for the root's direct needs)
};

// =============================================================================
// SkillTree
// =============================================================================

/// Skill catalog implementing SkillRequirementProvider
///
/// Thread-safety: The tree is NOT thread-safe for mutation. Concurrent reads
/// are fine once populated.
class SkillTree : public SkillRequirementProvider {
public:
    SkillTree() = default;

    // Non-copyable, movable
    SkillTree(const SkillTree&) = delete;
    SkillTree& operator=(const SkillTree&) = delete;
    SkillTree(SkillTree&&) = default;
    SkillTree& operator=(SkillTree&&) = default;

    // =========================================================================
    // Loading
    // =========================================================================

    /// Load a catalog from a JSON file
    [[nodiscard]] static nexus_core::Result<SkillTree> load(const std::filesystem::path& path);

    /// Parse a catalog from a JSON string
    ///
    /// @param json_str JSON text
    /// @param source_path Used only in error messages
    [[nodiscard]] static nexus_core::Result<SkillTree> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = {});

    // =========================================================================
    // Registration
    // =========================================================================

    /// Add or replace a skill
    ///
    /// If another skill already uses the same name, find_by_name() answers with
    /// this one until it is removed or renamed.
    void add_skill(SkillInfo info);

    /// Remove a skill
    ///
    /// @return true if the skill was found and removed
    bool remove_skill(SkillId id);

    /// Clear all skills
    void clear();

    // =========================================================================
    // SkillRequirementProvider
    // =========================================================================

    /// Direct prerequisites, one entry per skill at its maximum level
    ///
    /// Sorted by level descending, then skill id descending.
    [[nodiscard]] nexus_core::Result<std::vector<SkillRequirement>> requirements_of(
        SkillId id) const override;

    [[nodiscard]] std::optional<std::string> skill_name(SkillId id) const override;

    [[nodiscard]] bool has_skill(SkillId id) const override;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Look up a skill by exact display name
    [[nodiscard]] std::optional<SkillId> find_by_name(const std::string& name) const;

    /// Get a catalog entry
    [[nodiscard]] const SkillInfo* get(SkillId id) const;

    /// All skill ids in ascending order
    [[nodiscard]] std::vector<SkillId> skill_ids() const;

    /// Skills that list the given skill as a direct requirement
    [[nodiscard]] std::vector<SkillId> dependents_of(SkillId id) const;

    /// Every requirement edge reachable from a skill, depth-first
    ///
    /// Each skill's own requirements are listed once; unknown prerequisite
    /// skills are skipped.
    [[nodiscard]] std::vector<RequirementEntry> all_requirements(SkillId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_skills.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_skills.empty(); }

    // =========================================================================
    // Debugging
    // =========================================================================

    /// Generate GraphViz DOT format of the requirement graph
    [[nodiscard]] std::string to_dot_graph() const;

    /// Format requirement tree as string
    [[nodiscard]] std::string format_requirement_tree(SkillId root) const;

private:
    /// Drop the name lookup for `name` if it points at `id`
    void unindex_name(const std::string& name, SkillId id);

    void collect_requirements(
        SkillId id,
        std::vector<RequirementEntry>& out,
        std::set<SkillId>& visited) const;

    void format_tree_recursive(
        SkillId id,
        int level,
        std::string& output,
        const std::string& prefix,
        std::set<SkillId>& visited) const;

    std::map<SkillId, SkillInfo> m_skills;
    std::map<std::string, SkillId> m_name_index;
};

} // namespace nexus_skill
