#pragma once

/// @file orderer.hpp
/// @brief Training order for a set of steps

#include "fwd.hpp"
#include "depth.hpp"
#include "types.hpp"
#include <nexus/core/error.hpp>

#include <set>
#include <vector>

namespace nexus_skill {

/// Sorts steps by (depth ascending, skill id ascending, level ascending)
///
/// A prerequisite always has a strictly lower depth than its dependents, so
/// the order places every prerequisite before the skills needing it.
class StepOrderer {
public:
    explicit StepOrderer(DepthCalculator& depths) : m_depths(&depths) {}

    [[nodiscard]] nexus_core::Result<std::vector<TrainingStep>> order(
        const std::set<TrainingStep>& steps) const;

private:
    DepthCalculator* m_depths;
};

} // namespace nexus_skill
