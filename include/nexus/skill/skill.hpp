#pragma once

/// @file skill.hpp
/// @brief Main include file for nexus_skill module
///
/// # Skill Queue Overview
///
/// | Component | Purpose |
/// |-----------|---------|
/// | SkillTree | Catalog of skills and their raw requirement rows |
/// | DepthCalculator | Memoized prerequisite depth per skill |
/// | PrerequisiteExpander | Transitive closure as (skill, level) steps |
/// | StepOrderer | Sort by depth, skill id, level |
/// | QueueResolver | Interactive and batch resolution with deduplication |
/// | SkillPlanReader | "Name Level" text import |
///
/// # Basic Usage
///
/// ```cpp
/// #include <nexus/skill/skill.hpp>
///
/// using namespace nexus_skill;
///
/// auto tree = SkillTree::load("skills.json");
/// if (!tree) {
///     nexus_core::skill_logger()->error("Failed to load: {}", tree.error().message());
///     return;
/// }
///
/// SkillPlanReader reader(*tree);
/// auto plan = reader.parse(text);
///
/// QueueResolver resolver(*tree);
/// QueueCorrection fixed = resolver.correct_queue(plan.requests);
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "provider.hpp"
#include "skill_tree.hpp"
#include "depth.hpp"
#include "expander.hpp"
#include "orderer.hpp"
#include "resolver.hpp"
#include "plan_reader.hpp"
