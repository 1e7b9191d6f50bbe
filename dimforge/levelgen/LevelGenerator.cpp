#include "dimforge/levelgen/LevelGenerator.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "dimforge/levelgen/GraphBuilder.hpp"
#include "dimforge/levelgen/LayerPartitioner.hpp"
#include "dimforge/levelgen/LevelFingerprint.hpp"
#include "dimforge/levelgen/MultiplayerZoneAllocator.hpp"
#include "dimforge/levelgen/ObjectiveDeriver.hpp"
#include "dimforge/levelgen/ParameterCalculator.hpp"
#include "dimforge/levelgen/SeededRandom.hpp"
#include "dimforge/levelgen/SpatialSampler.hpp"

namespace dimforge::levelgen
{
LevelGenerator::LevelGenerator()
    : m_clock(&LevelGenerator::SystemClockMs)
{
}

LevelGenerator::LevelGenerator(Clock clock)
{
    SetClock(std::move(clock));
}

void LevelGenerator::SetClock(Clock clock)
{
    m_clock = clock ? std::move(clock) : Clock(&LevelGenerator::SystemClockMs);
}

std::int64_t LevelGenerator::SystemClockMs()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

GeneratedLevel LevelGenerator::Generate(const GenerationRequest& request) const
{
    return Generate(request.seed, request.config, request.modifiers, request.profile);
}

GeneratedLevel LevelGenerator::Generate(
    std::uint32_t seed,
    const GeneratorConfig& rawConfig,
    const DifficultyModifiers& rawModifiers,
    const ProfileContext& profile
) const
{
    const GeneratorConfig config = ParameterCalculator::Sanitize(rawConfig);
    const DifficultyModifiers modifiers = ParameterCalculator::Sanitize(rawModifiers);

    // Sub-seeds are taken from the untouched base state, so the streams are
    // independent of each other and of call order below.
    SeededRandom rng(seed);
    SeededRandom geometryRng(rng.SubSeed("geometry"));
    SeededRandom colorRng(rng.SubSeed("color"));
    // patternSeed feeds the fingerprint; no stage draws from a pattern stream.

    GeneratedLevel level;
    level.parameters = ParameterCalculator::Calculate(config, modifiers, profile, rng);
    const GenerationParameters& params = level.parameters;

    // --- Structure ---
    SamplerSettings sampler;
    sampler.count = params.nodeCount;
    const std::vector<glm::dvec2> positions = SpatialSampler::Sample(sampler, geometryRng);

    GraphBuildResult built = GraphBuilder::Build(positions, params, modifiers, geometryRng);
    level.graph = std::move(built.graph);

    level.layers = LayerPartitioner::Partition(level.graph, params.dimensionLayers, colorRng);
    level.objectives = ObjectiveDeriver::Derive(level.graph, modifiers);

    // --- Spawn / exit ---
    const LevelNode* anchor = FindNodeByRole(level.graph, NodeRole::Anchor);
    const LevelNode* nexus = FindNodeByRole(level.graph, NodeRole::Nexus);
    level.spawnPoint = anchor != nullptr ? anchor->position : glm::dvec3(0.0);
    level.exitPoint = nexus != nullptr ? nexus->position : glm::dvec3(DEFAULT_EXIT_X, DEFAULT_EXIT_Y, 0.0);

    if (config.playerCount > 1)
    {
        level.multiplayerZones = MultiplayerZoneAllocator::Allocate(level.graph, config.playerCount, geometryRng);
    }

    // --- Diagnostics ---
    GenerationDiagnostics& diagnostics = level.diagnostics;
    diagnostics.requestedNodeCount = params.nodeCount;
    diagnostics.sampledNodeCount = static_cast<int>(positions.size());
    diagnostics.connected = built.connected;
    if (diagnostics.sampledNodeCount < diagnostics.requestedNodeCount)
    {
        diagnostics.warnings.push_back(
            "Sampled " + std::to_string(diagnostics.sampledNodeCount) + " of " +
            std::to_string(diagnostics.requestedNodeCount) + " requested nodes");
    }
    if (!built.connected)
    {
        diagnostics.warnings.push_back(
            "Graph is disconnected: spanning tree has " + std::to_string(built.spanningEdgeCount) +
            " edges for " + std::to_string(level.graph.nodes.size()) + " nodes");
    }
    if (nexus == nullptr)
    {
        diagnostics.warnings.push_back("No nexus node, exit placed at default position");
    }

    level.fingerprint = GenerateLevelFingerprint(params, m_clock());

    // The summary line belongs to the callers; only a broken graph is reported here.
    if (!built.connected)
    {
        std::cerr << "[LevelGen] WARNING - Seed " << seed << " (" << level.fingerprint.id
                  << ") produced a disconnected graph\n";
    }

    return level;
}
} // namespace dimforge::levelgen
