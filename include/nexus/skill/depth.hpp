#pragma once

/// @file depth.hpp
/// @brief Structural prerequisite depth with memoization

#include "fwd.hpp"
#include "provider.hpp"
#include <nexus/core/error.hpp>

#include <set>
#include <unordered_map>
#include <vector>

namespace nexus_skill {

/// Computes depth(skill): 0 without prerequisites, otherwise
/// 1 + max(depth(p)) over direct prerequisites p.
///
/// Depths are cached for the lifetime of the calculator. The cache assumes the
/// provider's data does not change; call clear() after it does.
class DepthCalculator {
public:
    explicit DepthCalculator(const SkillRequirementProvider& provider)
        : m_provider(&provider) {}

    /// Depth of a skill
    ///
    /// Skills unknown to the provider (NotFound) have depth 0. Other provider
    /// errors are returned and nothing is cached for the failing path. A
    /// prerequisite cycle yields a CyclicDependency error naming the loop.
    [[nodiscard]] nexus_core::Result<int> depth(SkillId id);

    /// Check if a depth is already cached
    [[nodiscard]] bool is_cached(SkillId id) const { return m_cache.count(id) > 0; }

    /// Number of cached depths
    [[nodiscard]] std::size_t cache_size() const noexcept { return m_cache.size(); }

    /// Drop all cached depths
    void clear() { m_cache.clear(); }

private:
    nexus_core::Result<int> visit(
        SkillId id,
        std::set<SkillId>& in_stack,
        std::vector<SkillId>& current_path);

    const SkillRequirementProvider* m_provider;
    std::unordered_map<SkillId, int> m_cache;
};

} // namespace nexus_skill
