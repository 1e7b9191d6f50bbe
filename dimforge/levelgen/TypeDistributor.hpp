#pragma once

#include <cstddef>
#include <vector>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
class SeededRandom;

struct RoleRatios
{
    double hidden = 0.0;
    double witness = 0.0;
    double puzzle = 0.0;
    // Remainder is transit.
};

class TypeDistributor
{
public:
    [[nodiscard]] static RoleRatios RatiosFor(const DifficultyModifiers& modifiers);

    /**
     * Pins index 0 to anchor and the last index to nexus, bands the rest by
     * ratio, then shuffles the whole list. The shuffle means anchor and nexus
     * can land on any index; locate them by role, not by position.
     */
    [[nodiscard]] static std::vector<NodeRole> DistributeRoles(
        std::size_t count,
        const DifficultyModifiers& modifiers,
        SeededRandom& rng
    );

    [[nodiscard]] static double BaseRadius(NodeRole role);
    [[nodiscard]] static double RollRadius(NodeRole role, SeededRandom& rng);
    [[nodiscard]] static NodePayload RollPayload(NodeRole role, const DifficultyModifiers& modifiers, SeededRandom& rng);
};
} // namespace dimforge::levelgen
