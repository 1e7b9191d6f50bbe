#pragma once

#include <vector>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
namespace ObjectiveConstants
{
    constexpr double PUZZLE_SHARE = 0.5;            // ceil(puzzles * share) must be solved
    constexpr double WITNESS_AFFINITY_GATE = 0.5;   // witness-all only above this
}

// Pure: reads roles from the realized graph, draws nothing.
class ObjectiveDeriver
{
public:
    [[nodiscard]] static std::vector<LevelObjective> Derive(
        const LevelGraph& graph,
        const DifficultyModifiers& modifiers
    );
};
} // namespace dimforge::levelgen
