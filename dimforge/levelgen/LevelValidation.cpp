#include "dimforge/levelgen/LevelValidation.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "dimforge/levelgen/GraphBuilder.hpp"
#include "dimforge/levelgen/LevelFingerprint.hpp"
#include "dimforge/levelgen/SpatialSampler.hpp"

namespace dimforge::levelgen
{
namespace
{
// Sampler distances are compared in 2D; allow for rounding in cos/sin.
constexpr double kDistanceTolerance = 1e-9;

void AddIssue(std::vector<ValidationIssue>& issues, IssueSeverity severity, std::string message)
{
    issues.push_back(ValidationIssue{severity, std::move(message)});
}

bool Contains(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}
} // namespace

const char* IssueSeverityToText(IssueSeverity severity)
{
    switch (severity)
    {
        case IssueSeverity::Warning: return "warning";
        case IssueSeverity::Error: return "error";
        default: return "error";
    }
}

bool HasErrors(const std::vector<ValidationIssue>& issues)
{
    return std::any_of(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.severity == IssueSeverity::Error;
    });
}

std::vector<ValidationIssue> ValidateLevel(const GeneratedLevel& level)
{
    std::vector<ValidationIssue> issues;
    const LevelGraph& graph = level.graph;
    const std::size_t nodeCount = graph.nodes.size();

    std::unordered_map<std::string, const LevelNode*> nodesById;
    for (const LevelNode& node : graph.nodes)
    {
        if (!nodesById.emplace(node.id, &node).second)
        {
            AddIssue(issues, IssueSeverity::Error, "Duplicate node id " + node.id + ".");
        }
    }

    if (level.diagnostics.sampledNodeCount < level.diagnostics.requestedNodeCount)
    {
        AddIssue(issues, IssueSeverity::Warning,
            "Sampler delivered " + std::to_string(level.diagnostics.sampledNodeCount) + " of " +
            std::to_string(level.diagnostics.requestedNodeCount) + " nodes.");
    }

    // --- Edges ---
    std::unordered_set<std::string> edgeIds;
    for (const LevelEdge& edge : graph.edges)
    {
        if (!edgeIds.insert(edge.id).second)
        {
            AddIssue(issues, IssueSeverity::Error, "Duplicate edge id " + edge.id + ".");
        }
        if (edge.from == edge.to)
        {
            AddIssue(issues, IssueSeverity::Error, "Edge " + edge.id + " is a self loop.");
        }

        const auto from = nodesById.find(edge.from);
        const auto to = nodesById.find(edge.to);
        if (from == nodesById.end() || to == nodesById.end())
        {
            AddIssue(issues, IssueSeverity::Error, "Edge " + edge.id + " references a missing node.");
            continue;
        }
        if (!Contains(from->second->connections, edge.to) || !Contains(to->second->connections, edge.from))
        {
            AddIssue(issues, IssueSeverity::Error, "Edge " + edge.id + " missing from endpoint adjacency.");
        }
    }

    if (nodeCount >= 2)
    {
        const std::size_t minimum = nodeCount - 1;
        const std::size_t maximum = std::max(minimum, static_cast<std::size_t>(std::max(0, level.parameters.edgeCount)));
        if (graph.edges.size() < minimum || graph.edges.size() > maximum)
        {
            AddIssue(issues, IssueSeverity::Error,
                "Edge count " + std::to_string(graph.edges.size()) + " outside [" + std::to_string(minimum) + ", " +
                std::to_string(maximum) + "].");
        }
        if (!GraphBuilder::IsConnected(graph))
        {
            AddIssue(issues, IssueSeverity::Error, "Graph is not connected from " + graph.nodes.front().id + ".");
        }
    }

    // --- Adjacency must be backed by an edge in either direction ---
    std::unordered_set<std::string> undirected;
    for (const LevelEdge& edge : graph.edges)
    {
        undirected.insert(edge.from + "|" + edge.to);
        undirected.insert(edge.to + "|" + edge.from);
    }
    for (const LevelNode& node : graph.nodes)
    {
        for (const std::string& neighbor : node.connections)
        {
            if (undirected.count(node.id + "|" + neighbor) == 0)
            {
                AddIssue(issues, IssueSeverity::Error, "Node " + node.id + " lists " + neighbor + " without an edge.");
            }
        }
    }

    // --- Sampling distance ---
    for (std::size_t i = 0; i < nodeCount; ++i)
    {
        for (std::size_t j = i + 1; j < nodeCount; ++j)
        {
            const double dx = graph.nodes[i].position.x - graph.nodes[j].position.x;
            const double dy = graph.nodes[i].position.y - graph.nodes[j].position.y;
            if (std::sqrt(dx * dx + dy * dy) + kDistanceTolerance < SamplerConstants::DEFAULT_MIN_DISTANCE)
            {
                AddIssue(issues, IssueSeverity::Error,
                    "Nodes " + graph.nodes[i].id + " and " + graph.nodes[j].id + " closer than the sampling distance.");
            }
        }
    }

    // --- Roles ---
    const auto anchors = std::count_if(graph.nodes.begin(), graph.nodes.end(), [](const LevelNode& node) {
        return node.role == NodeRole::Anchor;
    });
    const auto nexuses = std::count_if(graph.nodes.begin(), graph.nodes.end(), [](const LevelNode& node) {
        return node.role == NodeRole::Nexus;
    });
    if (nodeCount > 0 && anchors != 1)
    {
        AddIssue(issues, IssueSeverity::Error, "Expected exactly one anchor, found " + std::to_string(anchors) + ".");
    }
    if (nexuses > 1)
    {
        AddIssue(issues, IssueSeverity::Error, "Expected at most one nexus, found " + std::to_string(nexuses) + ".");
    }
    else if (nodeCount > 0 && nexuses == 0)
    {
        AddIssue(issues, IssueSeverity::Warning, "Level has no nexus.");
    }

    // --- Layers ---
    std::unordered_set<std::string> layerIds;
    std::unordered_map<std::string, std::string> layerOfNode;
    for (const DimensionLayer& layer : level.layers)
    {
        layerIds.insert(layer.id);
        for (const std::string& nodeId : layer.nodes)
        {
            if (!layerOfNode.emplace(nodeId, layer.id).second)
            {
                AddIssue(issues, IssueSeverity::Error, "Node " + nodeId + " belongs to more than one layer.");
            }
        }
    }
    for (const LevelNode& node : graph.nodes)
    {
        const auto it = layerOfNode.find(node.id);
        if (it == layerOfNode.end())
        {
            AddIssue(issues, IssueSeverity::Error, "Node " + node.id + " is in no layer.");
        }
        else if (it->second != node.layer)
        {
            AddIssue(issues, IssueSeverity::Error, "Node " + node.id + " layer tag disagrees with " + it->second + ".");
        }
    }

    for (const LevelPortal& portal : graph.portals)
    {
        if (layerIds.count(portal.destination) == 0)
        {
            AddIssue(issues, IssueSeverity::Error, "Portal " + portal.id + " targets unknown layer " + portal.destination + ".");
        }
    }

    // --- Objectives ---
    for (const LevelObjective& objective : level.objectives)
    {
        for (const std::string& target : objective.targets)
        {
            if (nodesById.count(target) == 0)
            {
                AddIssue(issues, IssueSeverity::Error, "Objective " + objective.id + " targets missing node " + target + ".");
            }
        }
    }

    // --- Fingerprint ---
    if (level.fingerprint.id != HashLevelParameters(level.parameters))
    {
        AddIssue(issues, IssueSeverity::Error, "Fingerprint id does not match the level parameters.");
    }
    else if (level.fingerprint.shortCode != GenerateShortCode(level.fingerprint.id))
    {
        AddIssue(issues, IssueSeverity::Error, "Short code does not match the fingerprint id.");
    }

    return issues;
}
} // namespace dimforge::levelgen
