#include "dimforge/levelgen/ParameterCalculator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include <glm/common.hpp>

#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
namespace
{
[[nodiscard]] double Clamp01(double value)
{
    // NaN from a broken profile collapses to zero.
    if (std::isnan(value))
    {
        return 0.0;
    }
    return glm::clamp(value, 0.0, 1.0);
}
} // namespace

GeneratorConfig ParameterCalculator::Sanitize(const GeneratorConfig& config)
{
    GeneratorConfig result = config;
    result.baseNodeCount = std::max(0, config.baseNodeCount);
    result.baseDimensionCount = std::max(1, config.baseDimensionCount);
    result.difficultyScale = Clamp01(config.difficultyScale);
    result.playerCount = std::max(1, config.playerCount);
    result.levelProgression = std::max(0, config.levelProgression);
    return result;
}

DifficultyModifiers ParameterCalculator::Sanitize(const DifficultyModifiers& modifiers)
{
    DifficultyModifiers result;
    result.complexityTolerance = Clamp01(modifiers.complexityTolerance);
    result.explorationBias = Clamp01(modifiers.explorationBias);
    result.witnessAffinity = Clamp01(modifiers.witnessAffinity);
    result.perceptionDemand = Clamp01(modifiers.perceptionDemand);
    result.timePressure = Clamp01(modifiers.timePressure);
    return result;
}

double ParameterCalculator::ComplexityScore(int nodeCount, int edgeCount, int dimensionLayers)
{
    if (nodeCount <= 0)
    {
        return 0.0;
    }
    const double n = static_cast<double>(nodeCount);
    const double score =
        (n / 30.0) * 0.3 +
        (static_cast<double>(edgeCount) / n / 2.0) * 0.3 +
        (static_cast<double>(dimensionLayers) / 3.0) * 0.4;
    return Clamp01(score);
}

double ParameterCalculator::CoordinationDemand(int playerCount)
{
    return playerCount > 1 ? 0.5 + static_cast<double>(playerCount) * 0.1 : 0.0;
}

GenerationParameters ParameterCalculator::Calculate(
    const GeneratorConfig& rawConfig,
    const DifficultyModifiers& rawModifiers,
    const ProfileContext& profile,
    const SeededRandom& rng
)
{
    const GeneratorConfig config = Sanitize(rawConfig);
    const DifficultyModifiers modifiers = Sanitize(rawModifiers);

    GenerationParameters params;

    const double progressionScale = 1.0 + static_cast<double>(config.levelProgression) * ParameterConstants::PROGRESSION_STEP;

    const double scaledNodes = static_cast<double>(config.baseNodeCount) * progressionScale *
        (0.8 + modifiers.complexityTolerance * 0.4);
    const double roundedNodes = glm::clamp(
        RoundHalfUp(scaledNodes),
        static_cast<double>(ParameterConstants::MIN_NODE_COUNT),
        static_cast<double>(ParameterConstants::MAX_NODE_COUNT));
    params.nodeCount = static_cast<int>(roundedNodes);

    // Edge density follows exploration bias
    const double edgeMultiplier = 1.2 + modifiers.explorationBias * 0.6;
    params.edgeCount = static_cast<int>(RoundHalfUp(static_cast<double>(params.nodeCount) * edgeMultiplier));

    params.portalCount = static_cast<int>(RoundHalfUp(2.0 + modifiers.witnessAffinity * 4.0));

    // Summed in 64 bits: both inputs may sit near INT_MAX.
    const std::int64_t requestedLayers = static_cast<std::int64_t>(config.baseDimensionCount) +
        config.levelProgression / ParameterConstants::LEVELS_PER_EXTRA_DIMENSION;
    params.dimensionLayers = static_cast<int>(std::min<std::int64_t>(
        ParameterConstants::MAX_DIMENSION_LAYERS, requestedLayers));

    params.complexityScore = ComplexityScore(params.nodeCount, params.edgeCount, params.dimensionLayers);
    params.perceptionDemand = modifiers.perceptionDemand;
    params.timePressure = modifiers.timePressure;
    params.coordinationDemand = CoordinationDemand(config.playerCount);

    params.profileSeed = profile.profileId.empty() ? std::string("default") : profile.profileId;
    params.adaptationLevel = std::isfinite(profile.adaptationLevel) ? glm::clamp(profile.adaptationLevel, -1.0, 1.0) : 0.0;

    params.geometrySeed = rng.SubSeed("geometry");
    params.patternSeed = rng.SubSeed("pattern");
    params.colorSeed = rng.SubSeed("color");

    return params;
}
} // namespace dimforge::levelgen
