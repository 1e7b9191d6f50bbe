#pragma once

#include <string>
#include <vector>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
class SeededRandom;

namespace ZoneConstants
{
    constexpr int MAX_ZONES = 3;
    constexpr double ZONE_RADIUS = 8.0;
    constexpr int MIN_REQUIRED_PLAYERS = 2;
    constexpr int MAX_REQUIRED_PLAYERS = 4;
}

/**
 * Places cooperative zones on the first puzzle nodes.
 *
 * Runs on the geometry stream after the graph is finished, so the graph is
 * identical whatever the player count. Callers skip it for solo play.
 */
class MultiplayerZoneAllocator
{
public:
    [[nodiscard]] static std::vector<MultiplayerZone> Allocate(
        const LevelGraph& graph,
        int playerCount,
        SeededRandom& rng
    );

    [[nodiscard]] static const std::vector<std::string>& Mechanics();
};
} // namespace dimforge::levelgen
