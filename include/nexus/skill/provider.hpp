#pragma once

/// @file provider.hpp
/// @brief Source of skill prerequisite data consumed by the resolver

#include "types.hpp"
#include <nexus/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace nexus_skill {

/// Read-only lookup of a skill's direct prerequisites
///
/// Implementations return one entry per prerequisite skill, at the highest
/// level any of the raw requirement rows demands. An unknown skill is reported
/// as an Err with ErrorCode::NotFound.
class SkillRequirementProvider {
public:
    virtual ~SkillRequirementProvider() = default;

    /// Direct prerequisites of a skill
    [[nodiscard]] virtual nexus_core::Result<std::vector<SkillRequirement>> requirements_of(
        SkillId id) const = 0;

    /// Display name of a skill, if known
    [[nodiscard]] virtual std::optional<std::string> skill_name(SkillId id) const = 0;

    /// Check if the provider has data for a skill
    [[nodiscard]] virtual bool has_skill(SkillId id) const = 0;
};

} // namespace nexus_skill
