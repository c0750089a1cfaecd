#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for nexus_skill module

#include <cstdint>

namespace nexus_skill {

// =============================================================================
// Core Types
// =============================================================================

/// Opaque skill identifier (catalog type id)
using SkillId = std::int64_t;

struct SkillRequirement;
struct TrainingStep;
struct SkillRequest;
struct ResolveWarning;
struct ResolveResult;
struct RequestFailure;
struct QueueCorrection;

// =============================================================================
// Catalog
// =============================================================================

class SkillRequirementProvider;
struct SkillInfo;
struct RequirementEntry;
class SkillTree;

// =============================================================================
// Resolution
// =============================================================================

class DepthCalculator;
struct RequirementClosure;
struct Expansion;
class PrerequisiteExpander;
class StepOrderer;
struct QueueSession;
class QueueResolver;

// =============================================================================
// Plan Import
// =============================================================================

struct PlanParseResult;
class SkillPlanReader;

} // namespace nexus_skill
