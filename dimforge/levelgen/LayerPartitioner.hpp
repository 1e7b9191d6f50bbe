#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
class SeededRandom;

namespace LayerConstants
{
    constexpr double FOG_JITTER_MIN = 0.8;
    constexpr double FOG_JITTER_MAX = 1.2;
    constexpr double PARTICLE_DENSITY_MIN = 0.5;
    constexpr double PARTICLE_DENSITY_MAX = 1.5;
}

/**
 * Splits the node list into contiguous dimension layers and rolls one visual
 * style per layer from the color stream. Assigns `LevelNode::layer`.
 */
class LayerPartitioner
{
public:
    [[nodiscard]] static std::vector<DimensionLayer> Partition(
        LevelGraph& graph,
        int dimensionLayers,
        SeededRandom& rng
    );

    [[nodiscard]] static DimensionType TypeForLayer(int layerIndex);
    [[nodiscard]] static LayerStyle BaseStyle(DimensionType type);
    [[nodiscard]] static LayerStyle RollStyle(DimensionType type, SeededRandom& rng);
    [[nodiscard]] static std::string LayerIdFor(int layerIndex);
};

// 0xRRGGBB to 0-1 channels.
[[nodiscard]] glm::dvec3 ColorFromHex(std::uint32_t hex);
[[nodiscard]] std::uint32_t ColorToHex(const glm::dvec3& color);
} // namespace dimforge::levelgen
