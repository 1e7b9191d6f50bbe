#pragma once

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
class SeededRandom;

namespace ParameterConstants
{
    constexpr int MIN_NODE_COUNT = 2;
    constexpr int MAX_NODE_COUNT = 10000;          // Sampler saturates far below this
    constexpr int MAX_DIMENSION_LAYERS = 3;
    constexpr double PROGRESSION_STEP = 0.2;       // Node scale per level in sequence
    constexpr int LEVELS_PER_EXTRA_DIMENSION = 3;
}

/**
 * Turns the base config and profile modifiers into concrete generation counts.
 *
 * The formulas are leaderboard contracts: changing any constant here changes
 * every fingerprint. Inputs are clamped instead of rejected.
 */
class ParameterCalculator
{
public:
    [[nodiscard]] static GenerationParameters Calculate(
        const GeneratorConfig& config,
        const DifficultyModifiers& modifiers,
        const ProfileContext& profile,
        const SeededRandom& rng
    );

    [[nodiscard]] static GeneratorConfig Sanitize(const GeneratorConfig& config);
    [[nodiscard]] static DifficultyModifiers Sanitize(const DifficultyModifiers& modifiers);

    [[nodiscard]] static double ComplexityScore(int nodeCount, int edgeCount, int dimensionLayers);
    [[nodiscard]] static double CoordinationDemand(int playerCount);
};
} // namespace dimforge::levelgen
