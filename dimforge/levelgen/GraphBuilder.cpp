#include "dimforge/levelgen/GraphBuilder.hpp"

#include <algorithm>
#include <initializer_list>
#include <array>
#include <iostream>
#include <limits>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include <glm/geometric.hpp>

#include "dimforge/levelgen/SeededRandom.hpp"
#include "dimforge/levelgen/TypeDistributor.hpp"

namespace dimforge::levelgen
{
namespace
{
constexpr std::array<RevealCondition, 3> kPortalReveals{
    RevealCondition::Attention,
    RevealCondition::Witness,
    RevealCondition::Puzzle,
};

struct NeighborDistance
{
    std::size_t index = 0;
    double distance = 0.0;
};
} // namespace

GraphBuildResult GraphBuilder::Build(
    const std::vector<glm::dvec2>& positions,
    const GenerationParameters& params,
    const DifficultyModifiers& modifiers,
    SeededRandom& rng
)
{
    GraphBuildResult result;
    LevelGraph& graph = result.graph;

    graph.nodes = CreateNodes(positions, modifiers, rng);
    if (graph.nodes.empty())
    {
        return result;
    }

    const std::vector<CandidateEdge> candidates = BuildCandidateEdges(graph.nodes, rng);
    const std::vector<std::size_t> spanning = SelectSpanningEdges(candidates, graph.nodes.size());
    const std::vector<CandidateEdge> additional = Densify(candidates, spanning, params.edgeCount, rng);
    result.spanningEdgeCount = spanning.size();

    std::vector<CandidateEdge> selected;
    selected.reserve(spanning.size() + additional.size());
    for (const std::size_t index : spanning)
    {
        selected.push_back(candidates[index]);
    }
    selected.insert(selected.end(), additional.begin(), additional.end());

    graph.edges.reserve(selected.size());
    for (const CandidateEdge& candidate : selected)
    {
        LevelNode& from = graph.nodes[candidate.from];
        LevelNode& to = graph.nodes[candidate.to];

        LevelEdge edge;
        edge.id = EdgeIdFor(candidate.from, candidate.to);
        edge.from = from.id;
        edge.to = to.id;
        edge.length = candidate.length;
        edge.kind = AssignEdgeKind(from.role, to.role, modifiers, rng);
        graph.edges.push_back(std::move(edge));

        AddUniqueConnection(from.connections, to.id);
        AddUniqueConnection(to.connections, from.id);
    }

    graph.portals = PlacePortals(graph.nodes, params.portalCount, params.dimensionLayers, rng);

    result.connected = IsConnected(graph);
    if (!result.connected)
    {
        std::cerr << "[GraphBuilder] WARNING - Candidate edges do not span " << graph.nodes.size()
                  << " nodes, graph left disconnected (" << spanning.size() << " spanning edges)\n";
    }

    return result;
}

std::vector<LevelNode> GraphBuilder::CreateNodes(
    const std::vector<glm::dvec2>& positions,
    const DifficultyModifiers& modifiers,
    SeededRandom& rng
)
{
    const std::vector<NodeRole> roles = TypeDistributor::DistributeRoles(positions.size(), modifiers, rng);

    std::vector<LevelNode> nodes;
    nodes.reserve(positions.size());

    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        LevelNode node;
        node.id = NodeIdForIndex(i);
        node.role = roles[i];

        // Draw order per node: depth, radius, payload.
        const double z = rng.Range(-GraphConstants::NODE_DEPTH_JITTER, GraphConstants::NODE_DEPTH_JITTER);
        node.position = glm::dvec3(positions[i].x, positions[i].y, z);
        node.radius = TypeDistributor::RollRadius(node.role, rng);
        node.payload = TypeDistributor::RollPayload(node.role, modifiers, rng);

        nodes.push_back(std::move(node));
    }

    return nodes;
}

std::vector<CandidateEdge> GraphBuilder::BuildCandidateEdges(const std::vector<LevelNode>& nodes, SeededRandom& rng)
{
    std::vector<CandidateEdge> edges;
    std::set<std::pair<std::size_t, std::size_t>> seen;

    std::vector<NeighborDistance> sorted;
    sorted.reserve(nodes.size());

    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        sorted.clear();
        for (std::size_t j = 0; j < nodes.size(); ++j)
        {
            if (j == i)
            {
                continue;
            }
            sorted.push_back(NeighborDistance{j, glm::distance(nodes[i].position, nodes[j].position)});
        }

        // Stable so equidistant neighbors keep index order.
        std::stable_sort(sorted.begin(), sorted.end(), [](const NeighborDistance& a, const NeighborDistance& b) {
            return a.distance < b.distance;
        });

        const int connectionCount = rng.Int(GraphConstants::MIN_NEIGHBORS, GraphConstants::MAX_NEIGHBORS);
        const std::size_t limit = std::min(static_cast<std::size_t>(connectionCount), sorted.size());

        for (std::size_t k = 0; k < limit; ++k)
        {
            const std::size_t j = sorted[k].index;
            const auto key = std::make_pair(std::min(i, j), std::max(i, j));
            if (!seen.insert(key).second)
            {
                continue;
            }
            edges.push_back(CandidateEdge{i, j, sorted[k].distance});
        }
    }

    return edges;
}

std::vector<std::size_t> GraphBuilder::SelectSpanningEdges(
    const std::vector<CandidateEdge>& candidates,
    std::size_t nodeCount
)
{
    std::vector<std::size_t> selected;
    if (nodeCount == 0)
    {
        return selected;
    }

    std::vector<bool> connected(nodeCount, false);
    connected[0] = true;
    std::size_t connectedCount = 1;

    while (connectedCount < nodeCount)
    {
        std::size_t bestIndex = candidates.size();
        double bestLength = std::numeric_limits<double>::infinity();

        for (std::size_t c = 0; c < candidates.size(); ++c)
        {
            const CandidateEdge& edge = candidates[c];
            if (connected[edge.from] == connected[edge.to])
            {
                continue;
            }
            // Strict comparison: first candidate wins ties.
            if (edge.length < bestLength)
            {
                bestLength = edge.length;
                bestIndex = c;
            }
        }

        if (bestIndex == candidates.size())
        {
            break;
        }

        selected.push_back(bestIndex);
        const CandidateEdge& best = candidates[bestIndex];
        for (const std::size_t endpoint : {best.from, best.to})
        {
            if (!connected[endpoint])
            {
                connected[endpoint] = true;
                ++connectedCount;
            }
        }
    }

    return selected;
}

std::vector<CandidateEdge> GraphBuilder::Densify(
    const std::vector<CandidateEdge>& candidates,
    const std::vector<std::size_t>& spanningIndices,
    int targetEdgeCount,
    SeededRandom& rng
)
{
    std::vector<bool> inTree(candidates.size(), false);
    for (const std::size_t index : spanningIndices)
    {
        inTree[index] = true;
    }

    std::vector<CandidateEdge> remaining;
    remaining.reserve(candidates.size());
    for (std::size_t c = 0; c < candidates.size(); ++c)
    {
        if (!inTree[c])
        {
            remaining.push_back(candidates[c]);
        }
    }

    // Shuffled even when nothing is taken; the draws are part of the stream.
    std::vector<CandidateEdge> shuffled = rng.Shuffle(remaining);

    const int wanted = std::max(0, targetEdgeCount - static_cast<int>(spanningIndices.size()));
    if (static_cast<std::size_t>(wanted) < shuffled.size())
    {
        shuffled.resize(static_cast<std::size_t>(wanted));
    }
    return shuffled;
}

EdgeKind GraphBuilder::AssignEdgeKind(
    NodeRole fromRole,
    NodeRole toRole,
    const DifficultyModifiers& modifiers,
    SeededRandom& rng
)
{
    if (fromRole == NodeRole::Hidden || toRole == NodeRole::Hidden)
    {
        return rng.Next() < modifiers.witnessAffinity ? EdgeKind::WitnessOnly : EdgeKind::Conditional;
    }

    if (fromRole == NodeRole::Witness || toRole == NodeRole::Witness)
    {
        if (rng.Next() < modifiers.witnessAffinity * 0.5)
        {
            return EdgeKind::WitnessOnly;
        }
        // Falls through to the general roll with a fresh draw.
    }

    const double r = rng.Next();
    if (r < GraphConstants::BRIDGE_THRESHOLD)
    {
        return EdgeKind::Bridge;
    }
    if (r < GraphConstants::ONE_WAY_THRESHOLD)
    {
        return EdgeKind::OneWay;
    }
    if (r < GraphConstants::CONDITIONAL_THRESHOLD)
    {
        return EdgeKind::Conditional;
    }
    return EdgeKind::Path;
}

std::vector<LevelPortal> GraphBuilder::PlacePortals(
    const std::vector<LevelNode>& nodes,
    int portalCount,
    int dimensionLayers,
    SeededRandom& rng
)
{
    std::vector<const LevelNode*> visible;
    for (const LevelNode& node : nodes)
    {
        if (node.role != NodeRole::Hidden)
        {
            visible.push_back(&node);
        }
    }

    std::vector<LevelPortal> portals;
    if (visible.empty())
    {
        if (portalCount > 0)
        {
            std::cerr << "[GraphBuilder] WARNING - No visible node to host " << portalCount << " portal(s)\n";
        }
        return portals;
    }

    const int layers = std::max(1, dimensionLayers);
    portals.reserve(static_cast<std::size_t>(std::max(0, portalCount)));

    for (int i = 0; i < portalCount; ++i)
    {
        const LevelNode* host = rng.Pick(visible);

        LevelPortal portal;
        portal.id = "portal-" + std::to_string(i);
        portal.position = host->position + glm::dvec3(0.0, 0.0, GraphConstants::PORTAL_LIFT);
        portal.destination = "dimension-" + std::to_string(i % layers);
        portal.revealedBy = rng.Pick(kPortalReveals);
        portals.push_back(std::move(portal));
    }

    return portals;
}

bool GraphBuilder::IsConnected(const LevelGraph& graph)
{
    if (graph.nodes.size() < 2)
    {
        return true;
    }

    std::unordered_map<std::string, std::size_t> indexById;
    indexById.reserve(graph.nodes.size());
    for (std::size_t i = 0; i < graph.nodes.size(); ++i)
    {
        indexById.emplace(graph.nodes[i].id, i);
    }

    std::vector<std::vector<std::size_t>> adjacency(graph.nodes.size());
    for (const LevelEdge& edge : graph.edges)
    {
        const auto from = indexById.find(edge.from);
        const auto to = indexById.find(edge.to);
        if (from == indexById.end() || to == indexById.end())
        {
            continue;
        }
        adjacency[from->second].push_back(to->second);
        adjacency[to->second].push_back(from->second);
    }

    std::vector<bool> visited(graph.nodes.size(), false);
    std::queue<std::size_t> frontier;
    frontier.push(0);
    visited[0] = true;
    std::size_t reached = 1;

    while (!frontier.empty())
    {
        const std::size_t current = frontier.front();
        frontier.pop();
        for (const std::size_t next : adjacency[current])
        {
            if (!visited[next])
            {
                visited[next] = true;
                ++reached;
                frontier.push(next);
            }
        }
    }

    return reached == graph.nodes.size();
}

std::string GraphBuilder::EdgeIdFor(std::size_t a, std::size_t b)
{
    return "edge-" + std::to_string(std::min(a, b)) + "-" + std::to_string(std::max(a, b));
}

void GraphBuilder::AddUniqueConnection(std::vector<std::string>& connections, const std::string& id)
{
    if (std::find(connections.begin(), connections.end(), id) == connections.end())
    {
        connections.push_back(id);
    }
}
} // namespace dimforge::levelgen
