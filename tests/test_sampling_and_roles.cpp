#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <variant>
#include <vector>

#include "dimforge/levelgen/SeededRandom.hpp"
#include "dimforge/levelgen/SpatialSampler.hpp"
#include "dimforge/levelgen/TypeDistributor.hpp"

using namespace dimforge::levelgen;

TEST_CASE("Sampler: points respect the minimum distance and the domain")
{
    for (std::uint32_t seed : {1U, 42U, 777U, 123456U})
    {
        SeededRandom rng(seed);
        SamplerSettings settings;
        settings.count = 40;
        const std::vector<glm::dvec2> points = SpatialSampler::Sample(settings, rng);

        REQUIRE(!points.empty());
        CHECK(points.size() <= 40);
        CHECK(points.front().x == 25.0);
        CHECK(points.front().y == 25.0);

        for (std::size_t i = 0; i < points.size(); ++i)
        {
            CHECK(points[i].x >= 0.0);
            CHECK(points[i].x < settings.domainSize);
            CHECK(points[i].y >= 0.0);
            CHECK(points[i].y < settings.domainSize);
            for (std::size_t j = i + 1; j < points.size(); ++j)
            {
                const double dx = points[i].x - points[j].x;
                const double dy = points[i].y - points[j].y;
                REQUIRE(std::sqrt(dx * dx + dy * dy) >= settings.minDistance);
            }
        }
    }
}

TEST_CASE("Sampler: under-delivers when the domain saturates")
{
    SeededRandom rng(11);
    SamplerSettings settings;
    settings.count = 500; // A 50x50 square cannot hold 500 points 5 apart
    const std::vector<glm::dvec2> points = SpatialSampler::Sample(settings, rng);

    CHECK(points.size() < 500);
    CHECK(points.size() > 30);
}

TEST_CASE("Sampler: degenerate settings give no points")
{
    SeededRandom rng(1);
    SamplerSettings settings;
    settings.count = 0;
    CHECK(SpatialSampler::Sample(settings, rng).empty());

    settings.count = 10;
    settings.minDistance = 0.0;
    CHECK(SpatialSampler::Sample(settings, rng).empty());
}

TEST_CASE("Sampler: deterministic per seed")
{
    SamplerSettings settings;
    settings.count = 20;
    SeededRandom a(2024);
    SeededRandom b(2024);
    const auto first = SpatialSampler::Sample(settings, a);
    const auto second = SpatialSampler::Sample(settings, b);
    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        CHECK(first[i].x == second[i].x);
        CHECK(first[i].y == second[i].y);
    }
}

TEST_CASE("Roles: exactly one anchor and one nexus after the shuffle")
{
    for (std::uint32_t seed = 0; seed < 50; ++seed)
    {
        SeededRandom rng(seed);
        const std::vector<NodeRole> roles = TypeDistributor::DistributeRoles(15, DifficultyModifiers{}, rng);
        REQUIRE(roles.size() == 15);
        CHECK(std::count(roles.begin(), roles.end(), NodeRole::Anchor) == 1);
        CHECK(std::count(roles.begin(), roles.end(), NodeRole::Nexus) == 1);
    }
}

TEST_CASE("Roles: the shuffle moves anchor and nexus off their pinned slots")
{
    bool anchorMoved = false;
    bool nexusMoved = false;
    for (std::uint32_t seed = 0; seed < 50; ++seed)
    {
        SeededRandom rng(seed);
        const std::vector<NodeRole> roles = TypeDistributor::DistributeRoles(15, DifficultyModifiers{}, rng);
        anchorMoved = anchorMoved || roles.front() != NodeRole::Anchor;
        nexusMoved = nexusMoved || roles.back() != NodeRole::Nexus;
    }
    CHECK(anchorMoved);
    CHECK(nexusMoved);
}

TEST_CASE("Roles: a single node is the anchor")
{
    SeededRandom rng(4);
    const std::vector<NodeRole> roles = TypeDistributor::DistributeRoles(1, DifficultyModifiers{}, rng);
    REQUIRE(roles.size() == 1);
    CHECK(roles.front() == NodeRole::Anchor);
}

TEST_CASE("Roles: ratios follow the modifiers")
{
    DifficultyModifiers modifiers;
    modifiers.explorationBias = 1.0;
    modifiers.witnessAffinity = 0.0;
    modifiers.complexityTolerance = 0.0;

    const RoleRatios ratios = TypeDistributor::RatiosFor(modifiers);
    CHECK(ratios.hidden == doctest::Approx(0.25));
    CHECK(ratios.witness == doctest::Approx(0.10));
    CHECK(ratios.puzzle == doctest::Approx(0.20));
}

TEST_CASE("Roles: payload matches the role")
{
    DifficultyModifiers modifiers;
    modifiers.complexityTolerance = 0.8;
    modifiers.witnessAffinity = 1.0;
    modifiers.perceptionDemand = 0.5;
    SeededRandom rng(10);

    const NodePayload puzzle = TypeDistributor::RollPayload(NodeRole::Puzzle, modifiers, rng);
    REQUIRE(std::holds_alternative<PuzzleData>(puzzle));
    CHECK(std::get<PuzzleData>(puzzle).difficulty == doctest::Approx(0.8));

    const NodePayload witness = TypeDistributor::RollPayload(NodeRole::Witness, modifiers, rng);
    REQUIRE(std::holds_alternative<WitnessData>(witness));
    CHECK(std::get<WitnessData>(witness).revealRadius == doctest::Approx(10.0));
    CHECK(std::get<WitnessData>(witness).duration == doctest::Approx(2.0));

    CHECK(std::holds_alternative<HiddenData>(TypeDistributor::RollPayload(NodeRole::Hidden, modifiers, rng)));
    CHECK(std::holds_alternative<std::monostate>(TypeDistributor::RollPayload(NodeRole::Transit, modifiers, rng)));
    CHECK(std::holds_alternative<std::monostate>(TypeDistributor::RollPayload(NodeRole::Anchor, modifiers, rng)));

    for (int i = 0; i < 100; ++i)
    {
        const double radius = TypeDistributor::RollRadius(NodeRole::Nexus, rng);
        REQUIRE(radius >= 2.5 * 0.9);
        REQUIRE(radius < 2.5 * 1.1);
    }
}
