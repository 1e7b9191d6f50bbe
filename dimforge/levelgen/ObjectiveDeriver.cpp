#include "dimforge/levelgen/ObjectiveDeriver.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace dimforge::levelgen
{
namespace
{
std::vector<std::string> NodeIdsWithRole(const LevelGraph& graph, NodeRole role)
{
    std::vector<std::string> ids;
    for (const LevelNode& node : graph.nodes)
    {
        if (node.role == role)
        {
            ids.push_back(node.id);
        }
    }
    return ids;
}
} // namespace

std::vector<LevelObjective> ObjectiveDeriver::Derive(const LevelGraph& graph, const DifficultyModifiers& modifiers)
{
    std::vector<LevelObjective> objectives;

    if (const LevelNode* nexus = FindNodeByRole(graph, NodeRole::Nexus))
    {
        LevelObjective reach;
        reach.id = "reach-nexus";
        reach.kind = ObjectiveKind::Reach;
        reach.targets.push_back(nexus->id);
        reach.required = true;
        reach.description = "Reach the nexus";
        objectives.push_back(std::move(reach));
    }

    std::vector<std::string> puzzles = NodeIdsWithRole(graph, NodeRole::Puzzle);
    if (!puzzles.empty())
    {
        const auto required = static_cast<std::size_t>(
            std::ceil(static_cast<double>(puzzles.size()) * ObjectiveConstants::PUZZLE_SHARE));
        puzzles.resize(required);

        LevelObjective solve;
        solve.id = "solve-puzzles";
        solve.kind = ObjectiveKind::Activate;
        solve.targets = std::move(puzzles);
        solve.required = false;
        solve.description = "Solve " + std::to_string(required) + " puzzles";
        objectives.push_back(std::move(solve));
    }

    std::vector<std::string> witnesses = NodeIdsWithRole(graph, NodeRole::Witness);
    if (!witnesses.empty() && modifiers.witnessAffinity > ObjectiveConstants::WITNESS_AFFINITY_GATE)
    {
        LevelObjective witnessAll;
        witnessAll.id = "witness-all";
        witnessAll.kind = ObjectiveKind::Witness;
        witnessAll.targets = std::move(witnesses);
        witnessAll.required = false;
        witnessAll.description = "Witness all observation points";
        objectives.push_back(std::move(witnessAll));
    }

    return objectives;
}
} // namespace dimforge::levelgen
