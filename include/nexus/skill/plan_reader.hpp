#pragma once

/// @file plan_reader.hpp
/// @brief Text skill plan import
///
/// Reads plans in the common "one skill per line" form:
///
/// ```text
/// Gunnery 3
/// Small Hybrid Turret 4
/// ```

#include "fwd.hpp"
#include "skill_tree.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace nexus_skill {

/// Outcome of parsing a plan text
struct PlanParseResult {
    std::vector<SkillRequest> requests;    ///< Resolved entries, in input order
    std::vector<std::string> parse_errors; ///< Lines not of the form "<name> <1-5>"
    std::vector<std::string> not_found;    ///< Names missing from the catalog

    [[nodiscard]] bool has_errors() const noexcept {
        return !parse_errors.empty() || !not_found.empty();
    }
};

/// Parses plan text against a skill catalog
class SkillPlanReader {
public:
    explicit SkillPlanReader(const SkillTree& tree) : m_tree(&tree) {}

    /// Parse plan text
    ///
    /// Blank lines are ignored. Every other line is trimmed and split into a
    /// name and a trailing level 1-5.
    [[nodiscard]] PlanParseResult parse(const std::string& text) const;

private:
    const SkillTree* m_tree;
};

} // namespace nexus_skill
