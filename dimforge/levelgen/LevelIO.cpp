#include "dimforge/levelgen/LevelIO.hpp"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>
#include <variant>

#include "dimforge/levelgen/LayerPartitioner.hpp"

namespace dimforge::levelgen
{
namespace
{
using json = nlohmann::json;

json Vec3ToJson(const glm::dvec3& value)
{
    return json::array({value.x, value.y, value.z});
}

json PayloadToJson(const NodePayload& payload)
{
    if (const auto* puzzle = std::get_if<PuzzleData>(&payload))
    {
        return json{
            {"kind", "puzzle"},
            {"puzzle_type", PuzzleKindToText(puzzle->kind)},
            {"difficulty", puzzle->difficulty},
        };
    }
    if (const auto* witness = std::get_if<WitnessData>(&payload))
    {
        return json{
            {"kind", "witness"},
            {"reveal_radius", witness->revealRadius},
            {"duration", witness->duration},
        };
    }
    if (const auto* hidden = std::get_if<HiddenData>(&payload))
    {
        return json{
            {"kind", "hidden"},
            {"reveal_condition", HiddenRevealToText(hidden->revealCondition)},
        };
    }
    return json::object();
}

json NodeToJson(const LevelNode& node)
{
    return json{
        {"id", node.id},
        {"position", Vec3ToJson(node.position)},
        {"role", NodeRoleToText(node.role)},
        {"radius", node.radius},
        {"layer", node.layer},
        {"connections", node.connections},
        {"data", PayloadToJson(node.payload)},
    };
}

json LayerToJson(const DimensionLayer& layer)
{
    const LayerStyle& style = layer.visualStyle;
    return json{
        {"id", layer.id},
        {"name", layer.name},
        {"type", DimensionTypeToText(layer.type)},
        {"nodes", layer.nodes},
        {"visual_style", {
            {"primary_color", LevelIO::ColorToHexString(style.primaryColor)},
            {"secondary_color", LevelIO::ColorToHexString(style.secondaryColor)},
            {"fog_density", style.fogDensity},
            {"particle_density", style.particleDensity},
            {"geometry_style", GeometryStyleToText(style.geometryStyle)},
        }},
    };
}

json ObjectiveToJson(const LevelObjective& objective)
{
    return json{
        {"id", objective.id},
        {"type", ObjectiveKindToText(objective.kind)},
        {"targets", objective.targets},
        {"required", objective.required},
        {"description", objective.description},
    };
}

json ZoneToJson(const MultiplayerZone& zone)
{
    return json{
        {"id", zone.id},
        {"center", Vec3ToJson(zone.center)},
        {"radius", zone.radius},
        {"required_players", zone.requiredPlayers},
        {"mechanic", zone.mechanic},
    };
}

bool DumpJson(const json& value, int indent, std::string* outText, std::string* outError)
{
    try
    {
        *outText = value.dump(indent);
    }
    catch (const json::exception& ex)
    {
        // Strings that are not valid UTF-8 (type_error.316).
        if (outError != nullptr)
        {
            *outError = std::string("Unable to serialize JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

bool WriteJsonFile(const std::filesystem::path& path, const json& value, std::string* outError)
{
    // Serialized first so a failed dump never leaves a truncated file behind.
    std::string text;
    if (!DumpJson(value, 2, &text, outError))
    {
        return false;
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open file for writing: " + path.string();
        }
        return false;
    }

    stream << text << "\n";
    if (!stream.good())
    {
        if (outError != nullptr)
        {
            *outError = "Failed writing " + path.string();
        }
        return false;
    }
    return true;
}

bool ReadJsonFile(const std::filesystem::path& path, json* outValue, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open file: " + path.string();
        }
        return false;
    }

    try
    {
        stream >> *outValue;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid JSON in " + path.string() + ": " + ex.what();
        }
        return false;
    }
    return true;
}
} // namespace

std::string LevelIO::ColorToHexString(const glm::dvec3& color)
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%06x", static_cast<unsigned int>(ColorToHex(color)));
    return buffer;
}

json LevelIO::ParametersToJson(const GenerationParameters& params)
{
    return json{
        {"node_count", params.nodeCount},
        {"edge_count", params.edgeCount},
        {"portal_count", params.portalCount},
        {"dimension_layers", params.dimensionLayers},
        {"complexity_score", params.complexityScore},
        {"perception_demand", params.perceptionDemand},
        {"time_pressure", params.timePressure},
        {"coordination_demand", params.coordinationDemand},
        {"profile_seed", params.profileSeed},
        {"adaptation_level", params.adaptationLevel},
        {"geometry_seed", params.geometrySeed},
        {"pattern_seed", params.patternSeed},
        {"color_seed", params.colorSeed},
    };
}

json LevelIO::FingerprintToJson(const LevelFingerprint& fingerprint)
{
    return json{
        {"id", fingerprint.id},
        {"short_code", fingerprint.shortCode},
        {"difficulty_rating", fingerprint.difficultyRating},
        {"difficulty_tier", DifficultyTierToText(fingerprint.difficultyTier)},
        {"created_at_ms", fingerprint.createdAtMs},
        {"play_count", fingerprint.playCount},
        {"average_completion_time", fingerprint.averageCompletionTime},
        {"completion_rate", fingerprint.completionRate},
    };
}

json LevelIO::LevelToJson(const GeneratedLevel& level)
{
    json root;
    root["fingerprint"] = FingerprintToJson(level.fingerprint);
    root["parameters"] = ParametersToJson(level.parameters);

    json nodes = json::array();
    for (const LevelNode& node : level.graph.nodes)
    {
        nodes.push_back(NodeToJson(node));
    }

    json edges = json::array();
    for (const LevelEdge& edge : level.graph.edges)
    {
        edges.push_back({
            {"id", edge.id},
            {"from", edge.from},
            {"to", edge.to},
            {"type", EdgeKindToText(edge.kind)},
            {"length", edge.length},
        });
    }

    json portals = json::array();
    for (const LevelPortal& portal : level.graph.portals)
    {
        portals.push_back({
            {"id", portal.id},
            {"position", Vec3ToJson(portal.position)},
            {"destination", portal.destination},
            {"type", "inter-dimension"},
            {"revealed_by", RevealConditionToText(portal.revealedBy)},
        });
    }

    root["graph"] = {
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)},
        {"portals", std::move(portals)},
    };

    json layers = json::array();
    for (const DimensionLayer& layer : level.layers)
    {
        layers.push_back(LayerToJson(layer));
    }
    root["layers"] = std::move(layers);

    json objectives = json::array();
    for (const LevelObjective& objective : level.objectives)
    {
        objectives.push_back(ObjectiveToJson(objective));
    }
    root["objectives"] = std::move(objectives);

    root["spawn_point"] = Vec3ToJson(level.spawnPoint);
    root["exit_point"] = Vec3ToJson(level.exitPoint);

    if (level.multiplayerZones.has_value())
    {
        json zones = json::array();
        for (const MultiplayerZone& zone : *level.multiplayerZones)
        {
            zones.push_back(ZoneToJson(zone));
        }
        root["multiplayer_zones"] = std::move(zones);
    }

    root["diagnostics"] = {
        {"requested_node_count", level.diagnostics.requestedNodeCount},
        {"sampled_node_count", level.diagnostics.sampledNodeCount},
        {"connected", level.diagnostics.connected},
        {"warnings", level.diagnostics.warnings},
    };

    return root;
}

json LevelIO::RequestToJson(const GenerationRequest& request)
{
    json root;
    root["asset_version"] = kRequestAssetVersion;
    root["seed"] = request.seed;
    root["config"] = {
        {"base_node_count", request.config.baseNodeCount},
        {"base_dimension_count", request.config.baseDimensionCount},
        {"difficulty_scale", request.config.difficultyScale},
        {"player_count", request.config.playerCount},
        {"level_progression", request.config.levelProgression},
    };
    root["modifiers"] = {
        {"complexity_tolerance", request.modifiers.complexityTolerance},
        {"exploration_bias", request.modifiers.explorationBias},
        {"witness_affinity", request.modifiers.witnessAffinity},
        {"perception_demand", request.modifiers.perceptionDemand},
        {"time_pressure", request.modifiers.timePressure},
    };
    root["profile"] = {
        {"profile_id", request.profile.profileId},
        {"adaptation_level", request.profile.adaptationLevel},
    };
    return root;
}

bool LevelIO::RequestFromJson(const json& root, GenerationRequest* outRequest, std::string* outError)
{
    if (outRequest == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "RequestFromJson called with null outRequest.";
        }
        return false;
    }
    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Generation request must be a JSON object.";
        }
        return false;
    }

    GenerationRequest result;
    try
    {
        const int version = root.value("asset_version", -1);
        if (version != kRequestAssetVersion)
        {
            if (outError != nullptr)
            {
                std::ostringstream oss;
                oss << "Unsupported request version. Expected " << kRequestAssetVersion << ", got " << version;
                *outError = oss.str();
            }
            return false;
        }

        const std::int64_t seed = root.value("seed", static_cast<std::int64_t>(0));
        if (!SeedFromInteger(seed, &result.seed))
        {
            if (outError != nullptr)
            {
                *outError = "Seed out of 32-bit range: " + std::to_string(seed);
            }
            return false;
        }

        const json config = root.value("config", json::object());
        result.config.baseNodeCount = config.value("base_node_count", result.config.baseNodeCount);
        result.config.baseDimensionCount = config.value("base_dimension_count", result.config.baseDimensionCount);
        result.config.difficultyScale = config.value("difficulty_scale", result.config.difficultyScale);
        result.config.playerCount = config.value("player_count", result.config.playerCount);
        result.config.levelProgression = config.value("level_progression", result.config.levelProgression);

        const json modifiers = root.value("modifiers", json::object());
        result.modifiers.complexityTolerance = modifiers.value("complexity_tolerance", result.modifiers.complexityTolerance);
        result.modifiers.explorationBias = modifiers.value("exploration_bias", result.modifiers.explorationBias);
        result.modifiers.witnessAffinity = modifiers.value("witness_affinity", result.modifiers.witnessAffinity);
        result.modifiers.perceptionDemand = modifiers.value("perception_demand", result.modifiers.perceptionDemand);
        result.modifiers.timePressure = modifiers.value("time_pressure", result.modifiers.timePressure);

        const json profile = root.value("profile", json::object());
        result.profile.profileId = profile.value("profile_id", result.profile.profileId);
        result.profile.adaptationLevel = profile.value("adaptation_level", result.profile.adaptationLevel);
    }
    catch (const std::exception& ex)
    {
        // Wrong value types (e.g. a string where a number belongs).
        if (outError != nullptr)
        {
            *outError = std::string("Malformed generation request: ") + ex.what();
        }
        return false;
    }

    *outRequest = result;
    return true;
}

bool LevelIO::SeedFromInteger(std::int64_t value, std::uint32_t* outSeed)
{
    if (value < static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::min()) ||
        value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
    {
        return false;
    }
    // Negative seeds wrap to the same 32-bit pattern, so -1 and 4294967295 name one level.
    *outSeed = static_cast<std::uint32_t>(value);
    return true;
}

bool LevelIO::IsValidUtf8(const std::string& text)
{
    std::string ignored;
    return DumpJson(json(text), -1, &ignored, nullptr);
}

bool LevelIO::LevelToJsonText(const GeneratedLevel& level, int indent, std::string* outText, std::string* outError)
{
    return DumpJson(LevelToJson(level), indent, outText, outError);
}

bool LevelIO::WriteLevelFile(const std::filesystem::path& path, const GeneratedLevel& level, std::string* outError)
{
    if (!WriteJsonFile(path, LevelToJson(level), outError))
    {
        return false;
    }
    std::cout << "[LevelIO] Wrote " << level.fingerprint.id << " to " << path.string() << "\n";
    return true;
}

bool LevelIO::WriteGenerationRequestFile(const std::filesystem::path& path, const GenerationRequest& request, std::string* outError)
{
    return WriteJsonFile(path, RequestToJson(request), outError);
}

bool LevelIO::ReadGenerationRequestFile(const std::filesystem::path& path, GenerationRequest* outRequest, std::string* outError)
{
    json root;
    if (!ReadJsonFile(path, &root, outError))
    {
        return false;
    }
    return RequestFromJson(root, outRequest, outError);
}
} // namespace dimforge::levelgen
