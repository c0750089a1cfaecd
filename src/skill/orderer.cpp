/// @file orderer.cpp
/// @brief StepOrderer implementation

#include <nexus/skill/orderer.hpp>

#include <algorithm>
#include <tuple>
#include <unordered_map>

namespace nexus_skill {

nexus_core::Result<std::vector<TrainingStep>> StepOrderer::order(
    const std::set<TrainingStep>& steps) const {

    // Resolve each skill's depth once before sorting
    std::unordered_map<SkillId, int> depths;
    for (const auto& step : steps) {
        if (depths.count(step.skill_id)) {
            continue;
        }
        auto d = m_depths->depth(step.skill_id);
        if (!d) {
            return nexus_core::Err<std::vector<TrainingStep>>(d.error());
        }
        depths[step.skill_id] = *d;
    }

    std::vector<TrainingStep> ordered(steps.begin(), steps.end());
    std::sort(ordered.begin(), ordered.end(),
        [&depths](const TrainingStep& a, const TrainingStep& b) {
            return std::make_tuple(depths.at(a.skill_id), a.skill_id, a.level) <
                   std::make_tuple(depths.at(b.skill_id), b.skill_id, b.level);
        });

    return nexus_core::Ok(std::move(ordered));
}

} // namespace nexus_skill
