#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
class SeededRandom;

namespace GraphConstants
{
    constexpr int MIN_NEIGHBORS = 2;
    constexpr int MAX_NEIGHBORS = 4;
    constexpr double NODE_DEPTH_JITTER = 2.0;   // z in [-2, 2]
    constexpr double PORTAL_LIFT = 1.0;         // Portals float above their node
    constexpr double BRIDGE_THRESHOLD = 0.10;
    constexpr double ONE_WAY_THRESHOLD = 0.15;
    constexpr double CONDITIONAL_THRESHOLD = 0.20;
}

// Node indices, not ids. `from` is the node whose neighbor scan created the edge.
struct CandidateEdge
{
    std::size_t from = 0;
    std::size_t to = 0;
    double length = 0.0;
};

struct GraphBuildResult
{
    LevelGraph graph;
    std::size_t spanningEdgeCount = 0;
    bool connected = true;
};

/**
 * Builds the level graph from sampled positions.
 *
 * Stages run in a fixed order on one geometry stream: node attributes,
 * nearest-neighbor candidates, spanning tree from node 0, shuffled
 * densification, edge typing, portals. Reordering any stage changes every
 * level produced from a given seed.
 */
class GraphBuilder
{
public:
    [[nodiscard]] static GraphBuildResult Build(
        const std::vector<glm::dvec2>& positions,
        const GenerationParameters& params,
        const DifficultyModifiers& modifiers,
        SeededRandom& rng
    );

    [[nodiscard]] static std::vector<LevelNode> CreateNodes(
        const std::vector<glm::dvec2>& positions,
        const DifficultyModifiers& modifiers,
        SeededRandom& rng
    );

    [[nodiscard]] static std::vector<CandidateEdge> BuildCandidateEdges(
        const std::vector<LevelNode>& nodes,
        SeededRandom& rng
    );

    // Indices into `candidates`, in selection order.
    [[nodiscard]] static std::vector<std::size_t> SelectSpanningEdges(
        const std::vector<CandidateEdge>& candidates,
        std::size_t nodeCount
    );

    [[nodiscard]] static std::vector<CandidateEdge> Densify(
        const std::vector<CandidateEdge>& candidates,
        const std::vector<std::size_t>& spanningIndices,
        int targetEdgeCount,
        SeededRandom& rng
    );

    [[nodiscard]] static EdgeKind AssignEdgeKind(
        NodeRole fromRole,
        NodeRole toRole,
        const DifficultyModifiers& modifiers,
        SeededRandom& rng
    );

    [[nodiscard]] static std::vector<LevelPortal> PlacePortals(
        const std::vector<LevelNode>& nodes,
        int portalCount,
        int dimensionLayers,
        SeededRandom& rng
    );

    [[nodiscard]] static bool IsConnected(const LevelGraph& graph);

    [[nodiscard]] static std::string EdgeIdFor(std::size_t a, std::size_t b);

private:
    static void AddUniqueConnection(std::vector<std::string>& connections, const std::string& id);
};
} // namespace dimforge::levelgen
