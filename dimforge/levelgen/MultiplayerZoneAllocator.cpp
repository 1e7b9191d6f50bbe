#include "dimforge/levelgen/MultiplayerZoneAllocator.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
const std::vector<std::string>& MultiplayerZoneAllocator::Mechanics()
{
    static const std::vector<std::string> kMechanics{
        "split-perception",
        "synchronized-focus",
        "relay-witness",
        "perspective-union",
    };
    return kMechanics;
}

std::vector<MultiplayerZone> MultiplayerZoneAllocator::Allocate(
    const LevelGraph& graph,
    int playerCount,
    SeededRandom& rng
)
{
    std::vector<MultiplayerZone> zones;

    for (const LevelNode& node : graph.nodes)
    {
        if (static_cast<int>(zones.size()) >= ZoneConstants::MAX_ZONES)
        {
            break;
        }
        if (node.role != NodeRole::Puzzle)
        {
            continue;
        }

        MultiplayerZone zone;
        zone.id = "coop-zone-" + std::to_string(zones.size());
        zone.center = node.position;
        zone.radius = ZoneConstants::ZONE_RADIUS;
        zone.requiredPlayers = std::min(
            playerCount,
            rng.Int(ZoneConstants::MIN_REQUIRED_PLAYERS, ZoneConstants::MAX_REQUIRED_PLAYERS));
        zone.mechanic = rng.Pick(Mechanics());
        zones.push_back(std::move(zone));
    }

    return zones;
}
} // namespace dimforge::levelgen
