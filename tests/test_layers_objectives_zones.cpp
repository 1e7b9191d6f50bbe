#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "dimforge/levelgen/LayerPartitioner.hpp"
#include "dimforge/levelgen/MultiplayerZoneAllocator.hpp"
#include "dimforge/levelgen/ObjectiveDeriver.hpp"
#include "dimforge/levelgen/SeededRandom.hpp"

using namespace dimforge::levelgen;

namespace
{
LevelGraph MakeGraph(const std::vector<NodeRole>& roles)
{
    LevelGraph graph;
    for (std::size_t i = 0; i < roles.size(); ++i)
    {
        LevelNode node;
        node.id = NodeIdForIndex(i);
        node.role = roles[i];
        node.position = glm::dvec3(static_cast<double>(i) * 6.0, 1.0, 0.5);
        graph.nodes.push_back(node);
    }
    return graph;
}

const LevelObjective* FindObjective(const std::vector<LevelObjective>& objectives, const std::string& id)
{
    const auto it = std::find_if(objectives.begin(), objectives.end(), [&](const LevelObjective& o) {
        return o.id == id;
    });
    return it != objectives.end() ? &*it : nullptr;
}
} // namespace

// ============================================================================
// Layers
// ============================================================================

TEST_CASE("Layers: contiguous ceil split with a short tail")
{
    LevelGraph graph = MakeGraph(std::vector<NodeRole>(7, NodeRole::Transit));
    SeededRandom rng(3);

    const std::vector<DimensionLayer> layers = LayerPartitioner::Partition(graph, 3, rng);
    REQUIRE(layers.size() == 3);
    CHECK(layers[0].nodes == std::vector<std::string>{"node-0", "node-1", "node-2"});
    CHECK(layers[1].nodes == std::vector<std::string>{"node-3", "node-4", "node-5"});
    CHECK(layers[2].nodes == std::vector<std::string>{"node-6"});

    CHECK(graph.nodes[0].layer == "dimension-0");
    CHECK(graph.nodes[4].layer == "dimension-1");
    CHECK(graph.nodes[6].layer == "dimension-2");
}

TEST_CASE("Layers: more layers than nodes leaves trailing layers empty")
{
    LevelGraph graph = MakeGraph(std::vector<NodeRole>(2, NodeRole::Transit));
    SeededRandom rng(3);

    const std::vector<DimensionLayer> layers = LayerPartitioner::Partition(graph, 3, rng);
    REQUIRE(layers.size() == 3);
    CHECK(layers[0].nodes.size() == 1);
    CHECK(layers[1].nodes.size() == 1);
    CHECK(layers[2].nodes.empty());
}

TEST_CASE("Layers: types cycle and names follow the type")
{
    LevelGraph graph = MakeGraph(std::vector<NodeRole>(8, NodeRole::Transit));
    SeededRandom rng(1);

    const std::vector<DimensionLayer> layers = LayerPartitioner::Partition(graph, 4, rng);
    REQUIRE(layers.size() == 4);
    CHECK(layers[0].type == DimensionType::Lattice);
    CHECK(layers[1].type == DimensionType::Marrow);
    CHECK(layers[2].type == DimensionType::Void);
    CHECK(layers[3].type == DimensionType::Lattice);
    CHECK(layers[0].name == "LATTICE 1");
    CHECK(layers[3].name == "LATTICE 4");
    CHECK(layers[1].visualStyle.geometryStyle == GeometryStyle::Organic);
}

TEST_CASE("Layers: rolled styles stay inside their jitter bands")
{
    SeededRandom rng(77);
    for (int i = 0; i < 50; ++i)
    {
        const LayerStyle style = LayerPartitioner::RollStyle(DimensionType::Marrow, rng);
        REQUIRE(style.fogDensity >= 0.05 * LayerConstants::FOG_JITTER_MIN);
        REQUIRE(style.fogDensity < 0.05 * LayerConstants::FOG_JITTER_MAX);
        REQUIRE(style.particleDensity >= LayerConstants::PARTICLE_DENSITY_MIN);
        REQUIRE(style.particleDensity < LayerConstants::PARTICLE_DENSITY_MAX);
        REQUIRE(ColorToHex(style.primaryColor) == 0xff6b6bU);
        REQUIRE(ColorToHex(style.secondaryColor) == 0xfeca57U);
    }
}

TEST_CASE("Layers: hex colors survive conversion")
{
    CHECK(ColorToHex(ColorFromHex(0x667eea)) == 0x667eeaU);
    CHECK(ColorToHex(ColorFromHex(0x2d3436)) == 0x2d3436U);
    CHECK(ColorFromHex(0xff0000).r == 1.0);
    CHECK(ColorFromHex(0xff0000).g == 0.0);
    CHECK(ColorToHex(glm::dvec3(2.0, -1.0, 0.5)) == 0xff0080U);
}

TEST_CASE("Layers: zero layers gives nothing")
{
    LevelGraph graph = MakeGraph(std::vector<NodeRole>(4, NodeRole::Transit));
    SeededRandom rng(1);
    CHECK(LayerPartitioner::Partition(graph, 0, rng).empty());
}

// ============================================================================
// Objectives
// ============================================================================

TEST_CASE("Objectives: reach, solve and witness rules")
{
    const LevelGraph graph = MakeGraph({
        NodeRole::Puzzle, NodeRole::Anchor, NodeRole::Puzzle, NodeRole::Witness,
        NodeRole::Puzzle, NodeRole::Nexus, NodeRole::Witness, NodeRole::Transit,
    });

    DifficultyModifiers modifiers;
    modifiers.witnessAffinity = 0.8;
    const std::vector<LevelObjective> objectives = ObjectiveDeriver::Derive(graph, modifiers);
    REQUIRE(objectives.size() == 3);

    const LevelObjective* reach = FindObjective(objectives, "reach-nexus");
    REQUIRE(reach != nullptr);
    CHECK(reach->required);
    CHECK(reach->kind == ObjectiveKind::Reach);
    CHECK(reach->targets == std::vector<std::string>{"node-5"});

    const LevelObjective* solve = FindObjective(objectives, "solve-puzzles");
    REQUIRE(solve != nullptr);
    CHECK_FALSE(solve->required);
    CHECK(solve->kind == ObjectiveKind::Activate);
    CHECK(solve->targets == std::vector<std::string>{"node-0", "node-2"});
    CHECK(solve->description == "Solve 2 puzzles");

    const LevelObjective* witness = FindObjective(objectives, "witness-all");
    REQUIRE(witness != nullptr);
    CHECK(witness->targets == std::vector<std::string>{"node-3", "node-6"});
}

TEST_CASE("Objectives: witness-all needs affinity strictly above the gate")
{
    const LevelGraph graph = MakeGraph({NodeRole::Anchor, NodeRole::Witness, NodeRole::Nexus});

    DifficultyModifiers modifiers;
    modifiers.witnessAffinity = 0.5;
    const std::vector<LevelObjective> objectives = ObjectiveDeriver::Derive(graph, modifiers);
    CHECK(objectives.size() == 1);
    CHECK(FindObjective(objectives, "witness-all") == nullptr);
}

TEST_CASE("Objectives: no nexus means no required objective")
{
    const LevelGraph graph = MakeGraph({NodeRole::Anchor, NodeRole::Transit});
    CHECK(ObjectiveDeriver::Derive(graph, DifficultyModifiers{}).empty());
}

// ============================================================================
// Multiplayer zones
// ============================================================================

TEST_CASE("Zones: at most three, on puzzle nodes, capped by the party size")
{
    const LevelGraph graph = MakeGraph({
        NodeRole::Anchor, NodeRole::Puzzle, NodeRole::Puzzle, NodeRole::Transit,
        NodeRole::Puzzle, NodeRole::Puzzle, NodeRole::Nexus,
    });
    SeededRandom rng(12);

    const std::vector<MultiplayerZone> zones = MultiplayerZoneAllocator::Allocate(graph, 2, rng);
    REQUIRE(zones.size() == 3);
    CHECK(zones[0].center == graph.nodes[1].position);
    CHECK(zones[1].center == graph.nodes[2].position);
    CHECK(zones[2].center == graph.nodes[4].position);

    const std::vector<std::string>& mechanics = MultiplayerZoneAllocator::Mechanics();
    for (std::size_t i = 0; i < zones.size(); ++i)
    {
        CHECK(zones[i].id == "coop-zone-" + std::to_string(i));
        CHECK(zones[i].radius == ZoneConstants::ZONE_RADIUS);
        CHECK(zones[i].requiredPlayers == 2);
        CHECK(std::find(mechanics.begin(), mechanics.end(), zones[i].mechanic) != mechanics.end());
    }
}

TEST_CASE("Zones: required players stay within 2 and 4 for large parties")
{
    const LevelGraph graph = MakeGraph({NodeRole::Puzzle, NodeRole::Puzzle, NodeRole::Puzzle});
    for (std::uint32_t seed = 0; seed < 30; ++seed)
    {
        SeededRandom rng(seed);
        for (const MultiplayerZone& zone : MultiplayerZoneAllocator::Allocate(graph, 8, rng))
        {
            REQUIRE(zone.requiredPlayers >= ZoneConstants::MIN_REQUIRED_PLAYERS);
            REQUIRE(zone.requiredPlayers <= ZoneConstants::MAX_REQUIRED_PLAYERS);
        }
    }
}

TEST_CASE("Zones: no puzzles gives an empty list")
{
    const LevelGraph graph = MakeGraph({NodeRole::Anchor, NodeRole::Nexus});
    SeededRandom rng(1);
    CHECK(MultiplayerZoneAllocator::Allocate(graph, 3, rng).empty());
}
