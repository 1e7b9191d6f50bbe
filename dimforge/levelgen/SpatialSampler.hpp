#pragma once

#include <vector>

#include <glm/vec2.hpp>

namespace dimforge::levelgen
{
class SeededRandom;

namespace SamplerConstants
{
    constexpr double DEFAULT_MIN_DISTANCE = 5.0;
    constexpr double DEFAULT_DOMAIN_SIZE = 50.0;
    constexpr int ATTEMPTS_PER_ACTIVE_POINT = 30;
    constexpr int NEIGHBOR_CELL_RADIUS = 2; // 5x5 cell neighborhood
}

struct SamplerSettings
{
    int count = 0;
    double minDistance = SamplerConstants::DEFAULT_MIN_DISTANCE;
    double domainSize = SamplerConstants::DEFAULT_DOMAIN_SIZE; // Square side, points in [0, size)
};

/**
 * Bridson-style Poisson-disk sampler seeded from the square's center.
 *
 * Background grid cell = minDistance / sqrt(2), so at most one sample per cell.
 * The active list can drain before `count` is reached; callers must size their
 * work from the returned vector, never from the requested count.
 */
class SpatialSampler
{
public:
    [[nodiscard]] static std::vector<glm::dvec2> Sample(const SamplerSettings& settings, SeededRandom& rng);
};
} // namespace dimforge::levelgen
