#include "dimforge/levelgen/LevelTypes.hpp"

#include <algorithm>

namespace dimforge::levelgen
{
const char* NodeRoleToText(NodeRole role)
{
    switch (role)
    {
        case NodeRole::Anchor: return "anchor";
        case NodeRole::Transit: return "transit";
        case NodeRole::Puzzle: return "puzzle";
        case NodeRole::Witness: return "witness";
        case NodeRole::Hidden: return "hidden";
        case NodeRole::Nexus: return "nexus";
        default: return "transit";
    }
}

const char* EdgeKindToText(EdgeKind kind)
{
    switch (kind)
    {
        case EdgeKind::Path: return "path";
        case EdgeKind::Bridge: return "bridge";
        case EdgeKind::Conditional: return "conditional";
        case EdgeKind::OneWay: return "one-way";
        case EdgeKind::WitnessOnly: return "witness-only";
        default: return "path";
    }
}

const char* RevealConditionToText(RevealCondition condition)
{
    switch (condition)
    {
        case RevealCondition::Attention: return "attention";
        case RevealCondition::Witness: return "witness";
        case RevealCondition::Puzzle: return "puzzle";
        case RevealCondition::Always: return "always";
        default: return "always";
    }
}

const char* PuzzleKindToText(PuzzleKind kind)
{
    switch (kind)
    {
        case PuzzleKind::Pattern: return "pattern";
        case PuzzleKind::Sequence: return "sequence";
        case PuzzleKind::Spatial: return "spatial";
        case PuzzleKind::Rhythm: return "rhythm";
        default: return "pattern";
    }
}

const char* HiddenRevealToText(HiddenReveal reveal)
{
    switch (reveal)
    {
        case HiddenReveal::Witness: return "witness";
        case HiddenReveal::Proximity: return "proximity";
        case HiddenReveal::PuzzleComplete: return "puzzle-complete";
        default: return "witness";
    }
}

const char* DimensionTypeToText(DimensionType type)
{
    switch (type)
    {
        case DimensionType::Lattice: return "LATTICE";
        case DimensionType::Marrow: return "MARROW";
        case DimensionType::Void: return "VOID";
        default: return "LATTICE";
    }
}

const char* GeometryStyleToText(GeometryStyle style)
{
    switch (style)
    {
        case GeometryStyle::Crystalline: return "crystalline";
        case GeometryStyle::Organic: return "organic";
        case GeometryStyle::Void: return "void";
        case GeometryStyle::Fractal: return "fractal";
        default: return "crystalline";
    }
}

const char* ObjectiveKindToText(ObjectiveKind kind)
{
    switch (kind)
    {
        case ObjectiveKind::Reach: return "reach";
        case ObjectiveKind::Activate: return "activate";
        case ObjectiveKind::Witness: return "witness";
        default: return "reach";
    }
}

const char* DifficultyTierToText(DifficultyTier tier)
{
    switch (tier)
    {
        case DifficultyTier::Beginner: return "beginner";
        case DifficultyTier::Intermediate: return "intermediate";
        case DifficultyTier::Advanced: return "advanced";
        case DifficultyTier::Expert: return "expert";
        case DifficultyTier::Transcendent: return "transcendent";
        default: return "beginner";
    }
}

const LevelNode* FindNodeByRole(const LevelGraph& graph, NodeRole role)
{
    const auto it = std::find_if(graph.nodes.begin(), graph.nodes.end(), [role](const LevelNode& node) {
        return node.role == role;
    });
    return it != graph.nodes.end() ? &(*it) : nullptr;
}

const LevelNode* FindNodeById(const LevelGraph& graph, std::string_view id)
{
    const auto it = std::find_if(graph.nodes.begin(), graph.nodes.end(), [id](const LevelNode& node) {
        return node.id == id;
    });
    return it != graph.nodes.end() ? &(*it) : nullptr;
}

std::string NodeIdForIndex(std::size_t index)
{
    return "node-" + std::to_string(index);
}
} // namespace dimforge::levelgen
