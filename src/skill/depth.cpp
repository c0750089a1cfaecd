/// @file depth.cpp
/// @brief DepthCalculator implementation

#include <nexus/skill/depth.hpp>

#include <algorithm>

namespace nexus_skill {

nexus_core::Result<int> DepthCalculator::depth(SkillId id) {
    auto it = m_cache.find(id);
    if (it != m_cache.end()) {
        return nexus_core::Ok(it->second);
    }

    std::set<SkillId> in_stack;
    std::vector<SkillId> current_path;
    return visit(id, in_stack, current_path);
}

nexus_core::Result<int> DepthCalculator::visit(
    SkillId id,
    std::set<SkillId>& in_stack,
    std::vector<SkillId>& current_path) {

    if (in_stack.count(id)) {
        // Report the loop starting at its first occurrence
        auto start = std::find(current_path.begin(), current_path.end(), id);
        std::vector<SkillId> cycle(start, current_path.end());
        cycle.push_back(id);
        return nexus_core::Err<int>(nexus_core::SkillError::cyclic_dependency(std::move(cycle)));
    }

    auto cached = m_cache.find(id);
    if (cached != m_cache.end()) {
        return nexus_core::Ok(cached->second);
    }

    auto reqs = m_provider->requirements_of(id);
    if (!reqs) {
        if (reqs.error().code() != nexus_core::ErrorCode::NotFound) {
            return nexus_core::Err<int>(reqs.error());
        }
        // Unknown skills are leaves
        m_cache[id] = 0;
        return nexus_core::Ok(0);
    }
    if (reqs->empty()) {
        m_cache[id] = 0;
        return nexus_core::Ok(0);
    }

    in_stack.insert(id);
    current_path.push_back(id);

    int max_prereq_depth = 0;
    for (const auto& req : *reqs) {
        auto d = visit(req.skill_id, in_stack, current_path);
        if (!d) {
            return d;
        }
        max_prereq_depth = std::max(max_prereq_depth, *d);
    }

    in_stack.erase(id);
    current_path.pop_back();

    int result = 1 + max_prereq_depth;
    m_cache[id] = result;
    return nexus_core::Ok(result);
}

} // namespace nexus_skill
