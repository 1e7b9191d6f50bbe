#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

namespace dimforge::levelgen
{
// ============================================================================
// Inputs
// ============================================================================

struct GeneratorConfig
{
    int baseNodeCount = 15;
    int baseDimensionCount = 1;
    double difficultyScale = 0.5; // 0-1 overall difficulty
    int playerCount = 1;
    int levelProgression = 0;     // Which level in sequence
};

// Supplied by the player-profile subsystem. All values in [0,1].
struct DifficultyModifiers
{
    double complexityTolerance = 0.5;
    double explorationBias = 0.5;
    double witnessAffinity = 0.5;
    double perceptionDemand = 0.5;
    double timePressure = 0.5;
};

struct ProfileContext
{
    std::string profileId = "default";
    double adaptationLevel = 0.0; // -1..1, negative eases the level
};

struct GenerationParameters
{
    // Core structure
    int nodeCount = 0;
    int edgeCount = 0;
    int portalCount = 0;
    int dimensionLayers = 1;

    // Difficulty factors
    double complexityScore = 0.0;
    double perceptionDemand = 0.0;
    double timePressure = 0.0;
    double coordinationDemand = 0.0;

    // Profile adaptation
    std::string profileSeed = "default";
    double adaptationLevel = 0.0;

    // Stream seeds (exact recreation)
    std::uint32_t geometrySeed = 0;
    std::uint32_t patternSeed = 0;
    std::uint32_t colorSeed = 0;
};

// ============================================================================
// Graph
// ============================================================================

enum class NodeRole
{
    Anchor,
    Transit,
    Puzzle,
    Witness,
    Hidden,
    Nexus
};

enum class EdgeKind
{
    Path,
    Bridge,
    Conditional,
    OneWay,
    WitnessOnly
};

enum class RevealCondition
{
    Attention,
    Witness,
    Puzzle,
    Always
};

enum class PuzzleKind
{
    Pattern,
    Sequence,
    Spatial,
    Rhythm
};

enum class HiddenReveal
{
    Witness,
    Proximity,
    PuzzleComplete
};

struct PuzzleData
{
    PuzzleKind kind = PuzzleKind::Pattern;
    double difficulty = 0.0;
};

struct WitnessData
{
    double revealRadius = 5.0;
    double duration = 1.0;
};

struct HiddenData
{
    HiddenReveal revealCondition = HiddenReveal::Witness;
};

// Anchor, transit and nexus nodes carry no payload.
using NodePayload = std::variant<std::monostate, PuzzleData, WitnessData, HiddenData>;

struct LevelNode
{
    std::string id;
    glm::dvec3 position{0.0};
    NodeRole role = NodeRole::Transit;
    double radius = 1.0;
    std::string layer;
    std::vector<std::string> connections;
    NodePayload payload;
};

struct LevelEdge
{
    std::string id;
    std::string from;
    std::string to;
    EdgeKind kind = EdgeKind::Path;
    double length = 0.0;
};

struct LevelPortal
{
    std::string id;
    glm::dvec3 position{0.0};
    std::string destination; // Layer id
    RevealCondition revealedBy = RevealCondition::Always;
};

struct LevelGraph
{
    std::vector<LevelNode> nodes;
    std::vector<LevelEdge> edges;
    std::vector<LevelPortal> portals;
};

// ============================================================================
// Layers, objectives, zones
// ============================================================================

enum class DimensionType
{
    Lattice,
    Marrow,
    Void
};

enum class GeometryStyle
{
    Crystalline,
    Organic,
    Void,
    Fractal
};

struct LayerStyle
{
    glm::dvec3 primaryColor{0.0};   // RGB, 0-1 per channel
    glm::dvec3 secondaryColor{0.0};
    double fogDensity = 0.0;
    double particleDensity = 1.0;
    GeometryStyle geometryStyle = GeometryStyle::Crystalline;
};

struct DimensionLayer
{
    std::string id;
    std::string name;
    DimensionType type = DimensionType::Lattice;
    std::vector<std::string> nodes;
    LayerStyle visualStyle;
};

enum class ObjectiveKind
{
    Reach,
    Activate,
    Witness
};

struct LevelObjective
{
    std::string id;
    ObjectiveKind kind = ObjectiveKind::Reach;
    std::vector<std::string> targets;
    bool required = false;
    std::string description;
};

struct MultiplayerZone
{
    std::string id;
    glm::dvec3 center{0.0};
    double radius = 8.0;
    int requiredPlayers = 2;
    std::string mechanic;
};

// ============================================================================
// Fingerprint and assembled level
// ============================================================================

enum class DifficultyTier
{
    Beginner,
    Intermediate,
    Advanced,
    Expert,
    Transcendent
};

struct LevelFingerprint
{
    std::string id;        // lvl-<base36>
    std::string shortCode; // XXXX-XXXX
    double difficultyRating = 0.0;
    DifficultyTier difficultyTier = DifficultyTier::Beginner;
    std::int64_t createdAtMs = 0;

    // Owned by the leaderboard service, zero at generation time.
    int playCount = 0;
    double averageCompletionTime = 0.0;
    double completionRate = 0.0;
};

struct GenerationDiagnostics
{
    int requestedNodeCount = 0;
    int sampledNodeCount = 0;
    bool connected = true;
    std::vector<std::string> warnings;
};

struct GeneratedLevel
{
    LevelFingerprint fingerprint;
    GenerationParameters parameters;
    LevelGraph graph;
    std::vector<DimensionLayer> layers;
    std::vector<LevelObjective> objectives;
    glm::dvec3 spawnPoint{0.0};
    glm::dvec3 exitPoint{0.0};
    std::optional<std::vector<MultiplayerZone>> multiplayerZones;
    GenerationDiagnostics diagnostics;
};

// ============================================================================
// Text conversions (wire names used in JSON and logs)
// ============================================================================

const char* NodeRoleToText(NodeRole role);
const char* EdgeKindToText(EdgeKind kind);
const char* RevealConditionToText(RevealCondition condition);
const char* PuzzleKindToText(PuzzleKind kind);
const char* HiddenRevealToText(HiddenReveal reveal);
const char* DimensionTypeToText(DimensionType type);
const char* GeometryStyleToText(GeometryStyle style);
const char* ObjectiveKindToText(ObjectiveKind kind);
const char* DifficultyTierToText(DifficultyTier tier);

[[nodiscard]] const LevelNode* FindNodeByRole(const LevelGraph& graph, NodeRole role);
[[nodiscard]] const LevelNode* FindNodeById(const LevelGraph& graph, std::string_view id);
[[nodiscard]] std::string NodeIdForIndex(std::size_t index);
} // namespace dimforge::levelgen
