/// @file types.cpp
/// @brief Skill value type helpers

#include <nexus/skill/types.hpp>

namespace nexus_skill {

std::string format_steps(const std::vector<TrainingStep>& steps) {
    std::string out;
    for (const auto& step : steps) {
        out += step.to_string();
        out += '\n';
    }
    return out;
}

} // namespace nexus_skill
