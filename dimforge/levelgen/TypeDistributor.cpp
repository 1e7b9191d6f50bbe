#include "dimforge/levelgen/TypeDistributor.hpp"

#include <array>

#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
namespace
{
constexpr std::array<PuzzleKind, 4> kPuzzleKinds{
    PuzzleKind::Pattern,
    PuzzleKind::Sequence,
    PuzzleKind::Spatial,
    PuzzleKind::Rhythm,
};

constexpr std::array<HiddenReveal, 3> kHiddenReveals{
    HiddenReveal::Witness,
    HiddenReveal::Proximity,
    HiddenReveal::PuzzleComplete,
};
} // namespace

RoleRatios TypeDistributor::RatiosFor(const DifficultyModifiers& modifiers)
{
    RoleRatios ratios;
    ratios.hidden = 0.1 + modifiers.explorationBias * 0.15;
    ratios.witness = 0.1 + modifiers.witnessAffinity * 0.15;
    ratios.puzzle = 0.2 + modifiers.complexityTolerance * 0.1;
    return ratios;
}

std::vector<NodeRole> TypeDistributor::DistributeRoles(
    std::size_t count,
    const DifficultyModifiers& modifiers,
    SeededRandom& rng
)
{
    const RoleRatios ratios = RatiosFor(modifiers);

    std::vector<NodeRole> roles;
    roles.reserve(count);

    for (std::size_t i = 0; i < count; ++i)
    {
        // Drawn for every index so the stream position only depends on count.
        const double r = rng.Next();

        if (i == 0)
        {
            roles.push_back(NodeRole::Anchor);
        }
        else if (i == count - 1)
        {
            roles.push_back(NodeRole::Nexus);
        }
        else if (r < ratios.hidden)
        {
            roles.push_back(NodeRole::Hidden);
        }
        else if (r < ratios.hidden + ratios.witness)
        {
            roles.push_back(NodeRole::Witness);
        }
        else if (r < ratios.hidden + ratios.witness + ratios.puzzle)
        {
            roles.push_back(NodeRole::Puzzle);
        }
        else
        {
            roles.push_back(NodeRole::Transit);
        }
    }

    return rng.Shuffle(roles);
}

double TypeDistributor::BaseRadius(NodeRole role)
{
    switch (role)
    {
        case NodeRole::Anchor: return 2.0;
        case NodeRole::Transit: return 1.0;
        case NodeRole::Puzzle: return 1.5;
        case NodeRole::Witness: return 1.2;
        case NodeRole::Hidden: return 0.8;
        case NodeRole::Nexus: return 2.5;
        default: return 1.0;
    }
}

double TypeDistributor::RollRadius(NodeRole role, SeededRandom& rng)
{
    return BaseRadius(role) * rng.Range(0.9, 1.1);
}

NodePayload TypeDistributor::RollPayload(NodeRole role, const DifficultyModifiers& modifiers, SeededRandom& rng)
{
    switch (role)
    {
        case NodeRole::Puzzle:
        {
            PuzzleData data;
            data.kind = rng.Pick(kPuzzleKinds);
            data.difficulty = modifiers.complexityTolerance;
            return data;
        }
        case NodeRole::Witness:
        {
            WitnessData data;
            data.revealRadius = 5.0 + modifiers.witnessAffinity * 5.0;
            data.duration = 1.0 + modifiers.perceptionDemand * 2.0;
            return data;
        }
        case NodeRole::Hidden:
        {
            HiddenData data;
            data.revealCondition = rng.Pick(kHiddenReveals);
            return data;
        }
        default:
            return std::monostate{};
    }
}
} // namespace dimforge::levelgen
