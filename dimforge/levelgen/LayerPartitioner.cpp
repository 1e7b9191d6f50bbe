#include "dimforge/levelgen/LayerPartitioner.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include <glm/common.hpp>

#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
namespace
{
constexpr DimensionType kLayerCycle[] = {
    DimensionType::Lattice,
    DimensionType::Marrow,
    DimensionType::Void,
};
} // namespace

glm::dvec3 ColorFromHex(std::uint32_t hex)
{
    return glm::dvec3(
        static_cast<double>((hex >> 16U) & 0xFFU) / 255.0,
        static_cast<double>((hex >> 8U) & 0xFFU) / 255.0,
        static_cast<double>(hex & 0xFFU) / 255.0);
}

std::uint32_t ColorToHex(const glm::dvec3& color)
{
    const auto channel = [](double value) {
        return static_cast<std::uint32_t>(RoundHalfUp(glm::clamp(value, 0.0, 1.0) * 255.0));
    };
    return (channel(color.r) << 16U) | (channel(color.g) << 8U) | channel(color.b);
}

DimensionType LayerPartitioner::TypeForLayer(int layerIndex)
{
    const int cycle = static_cast<int>(std::size(kLayerCycle));
    return kLayerCycle[((layerIndex % cycle) + cycle) % cycle];
}

std::string LayerPartitioner::LayerIdFor(int layerIndex)
{
    return "dimension-" + std::to_string(layerIndex);
}

LayerStyle LayerPartitioner::BaseStyle(DimensionType type)
{
    LayerStyle style;
    switch (type)
    {
        case DimensionType::Lattice:
            style.primaryColor = ColorFromHex(0x667eea);
            style.secondaryColor = ColorFromHex(0x764ba2);
            style.fogDensity = 0.02;
            style.geometryStyle = GeometryStyle::Crystalline;
            break;
        case DimensionType::Marrow:
            style.primaryColor = ColorFromHex(0xff6b6b);
            style.secondaryColor = ColorFromHex(0xfeca57);
            style.fogDensity = 0.05;
            style.geometryStyle = GeometryStyle::Organic;
            break;
        case DimensionType::Void:
            style.primaryColor = ColorFromHex(0x2d3436);
            style.secondaryColor = ColorFromHex(0x636e72);
            style.fogDensity = 0.1;
            style.geometryStyle = GeometryStyle::Void;
            break;
    }
    return style;
}

LayerStyle LayerPartitioner::RollStyle(DimensionType type, SeededRandom& rng)
{
    LayerStyle style = BaseStyle(type);
    style.fogDensity *= rng.Range(LayerConstants::FOG_JITTER_MIN, LayerConstants::FOG_JITTER_MAX);
    style.particleDensity = rng.Range(LayerConstants::PARTICLE_DENSITY_MIN, LayerConstants::PARTICLE_DENSITY_MAX);
    return style;
}

std::vector<DimensionLayer> LayerPartitioner::Partition(LevelGraph& graph, int dimensionLayers, SeededRandom& rng)
{
    std::vector<DimensionLayer> layers;
    if (dimensionLayers <= 0)
    {
        return layers;
    }

    const std::size_t nodeCount = graph.nodes.size();
    const std::size_t layerCount = static_cast<std::size_t>(dimensionLayers);
    const std::size_t perLayer = (nodeCount + layerCount - 1) / layerCount;

    layers.reserve(layerCount);
    for (int i = 0; i < dimensionLayers; ++i)
    {
        DimensionLayer layer;
        layer.id = LayerIdFor(i);
        layer.type = TypeForLayer(i);
        layer.name = std::string(DimensionTypeToText(layer.type)) + " " + std::to_string(i + 1);

        // Trailing layers may be empty when there are fewer nodes than layers.
        const std::size_t begin = std::min(nodeCount, static_cast<std::size_t>(i) * perLayer);
        const std::size_t end = std::min(nodeCount, begin + perLayer);
        for (std::size_t n = begin; n < end; ++n)
        {
            graph.nodes[n].layer = layer.id;
            layer.nodes.push_back(graph.nodes[n].id);
        }

        layer.visualStyle = RollStyle(layer.type, rng);
        layers.push_back(std::move(layer));
    }

    return layers;
}
} // namespace dimforge::levelgen
