#include "dimforge/levelgen/SpatialSampler.hpp"

#include <cmath>
#include <cstddef>

#include <glm/gtc/constants.hpp>

#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
namespace
{
class SampleGrid
{
public:
    SampleGrid(double cellSize, int side)
        : m_cellSize(cellSize)
        , m_side(side)
        , m_cells(static_cast<std::size_t>(side) * static_cast<std::size_t>(side), -1)
    {
    }

    [[nodiscard]] int CellCoord(double value) const
    {
        return static_cast<int>(std::floor(value / m_cellSize));
    }

    [[nodiscard]] bool Contains(int x, int y) const
    {
        return x >= 0 && x < m_side && y >= 0 && y < m_side;
    }

    [[nodiscard]] int At(int x, int y) const
    {
        return m_cells[static_cast<std::size_t>(x) * static_cast<std::size_t>(m_side) + static_cast<std::size_t>(y)];
    }

    void Set(int x, int y, int sampleIndex)
    {
        if (Contains(x, y))
        {
            m_cells[static_cast<std::size_t>(x) * static_cast<std::size_t>(m_side) + static_cast<std::size_t>(y)] = sampleIndex;
        }
    }

private:
    double m_cellSize;
    int m_side;
    std::vector<int> m_cells;
};

[[nodiscard]] bool IsFarEnough(
    const SampleGrid& grid,
    const std::vector<glm::dvec2>& points,
    const glm::dvec2& candidate,
    double minDistance
)
{
    const int gridX = grid.CellCoord(candidate.x);
    const int gridY = grid.CellCoord(candidate.y);
    const int radius = SamplerConstants::NEIGHBOR_CELL_RADIUS;

    for (int dx = -radius; dx <= radius; ++dx)
    {
        for (int dy = -radius; dy <= radius; ++dy)
        {
            const int checkX = gridX + dx;
            const int checkY = gridY + dy;
            if (!grid.Contains(checkX, checkY))
            {
                continue;
            }
            const int neighbor = grid.At(checkX, checkY);
            if (neighbor < 0)
            {
                continue;
            }
            const glm::dvec2& other = points[static_cast<std::size_t>(neighbor)];
            const double ddx = candidate.x - other.x;
            const double ddy = candidate.y - other.y;
            if (std::sqrt(ddx * ddx + ddy * ddy) < minDistance)
            {
                return false;
            }
        }
    }
    return true;
}
} // namespace

std::vector<glm::dvec2> SpatialSampler::Sample(const SamplerSettings& settings, SeededRandom& rng)
{
    std::vector<glm::dvec2> points;
    if (settings.count <= 0 || !(settings.minDistance > 0.0) || !(settings.domainSize > 0.0))
    {
        return points;
    }

    const double minDistance = settings.minDistance;
    const double maxDistance = settings.domainSize;
    const double cellSize = minDistance / std::sqrt(2.0);
    const int gridSide = static_cast<int>(std::ceil(maxDistance / cellSize));
    SampleGrid grid(cellSize, gridSide);

    const glm::dvec2 first{maxDistance / 2.0, maxDistance / 2.0};
    points.push_back(first);
    grid.Set(grid.CellCoord(first.x), grid.CellCoord(first.y), 0);

    std::vector<int> active{0};
    const std::size_t target = static_cast<std::size_t>(settings.count);

    while (!active.empty() && points.size() < target)
    {
        const int activeSlot = rng.Int(0, static_cast<int>(active.size()) - 1);
        const glm::dvec2 origin = points[static_cast<std::size_t>(active[static_cast<std::size_t>(activeSlot)])];

        bool found = false;
        for (int attempt = 0; attempt < SamplerConstants::ATTEMPTS_PER_ACTIVE_POINT; ++attempt)
        {
            const double angle = rng.Next() * glm::pi<double>() * 2.0;
            const double dist = rng.Range(minDistance, minDistance * 2.0);
            const glm::dvec2 candidate{
                origin.x + std::cos(angle) * dist,
                origin.y + std::sin(angle) * dist,
            };

            if (candidate.x < 0.0 || candidate.x >= maxDistance || candidate.y < 0.0 || candidate.y >= maxDistance)
            {
                continue;
            }

            if (IsFarEnough(grid, points, candidate, minDistance))
            {
                points.push_back(candidate);
                const int index = static_cast<int>(points.size()) - 1;
                grid.Set(grid.CellCoord(candidate.x), grid.CellCoord(candidate.y), index);
                active.push_back(index);
                found = true;
                break;
            }
        }

        if (!found)
        {
            active.erase(active.begin() + activeSlot);
        }
    }

    return points;
}
} // namespace dimforge::levelgen
