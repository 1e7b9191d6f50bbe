#include <doctest/doctest.h>

#include <chrono>
#include <vector>

#include "dimforge/core/JobSystem.hpp"
#include "dimforge/levelgen/ChallengeSchedule.hpp"

using namespace dimforge::levelgen;
using namespace std::chrono;

namespace
{
LevelGenerator FixedClockGenerator()
{
    return LevelGenerator([] { return std::int64_t{42}; });
}
} // namespace

TEST_CASE("Challenges: daily seeds encode date and party size")
{
    const year_month_day date{year{2026}, month{10}, day{18}};
    CHECK(ChallengeSchedule::DailySeed(date, 2) == 202610182U);
    CHECK(ChallengeSchedule::DailySeed(date, 1) == 202610181U);
    CHECK(ChallengeSchedule::DailySeed(date, 9) == 202610184U); // Clamped to 4
    CHECK(ChallengeSchedule::DailySeed(date, 0) == 202610181U);
}

TEST_CASE("Challenges: week numbering starts at zero on January 1st")
{
    CHECK(ChallengeSchedule::WeekOfYear(year{2026} / January / 1) == 0);
    CHECK(ChallengeSchedule::WeekOfYear(year{2026} / January / 7) == 0);
    CHECK(ChallengeSchedule::WeekOfYear(year{2026} / January / 8) == 1);
    CHECK(ChallengeSchedule::WeekOfYear(year{2026} / December / 31) == 52);
}

TEST_CASE("Challenges: weekly seeds")
{
    CHECK(ChallengeSchedule::WeeklySeed(2026, 41, 3) == 202963U);
    // October 18th is 290 days after January 1st: week 41.
    CHECK(ChallengeSchedule::WeeklySeed(year{2026} / October / 18, 3) == 202963U);
    CHECK(ChallengeSchedule::WeeklySeed(year{2026} / October / 15, 3) == ChallengeSchedule::WeeklySeed(year{2026} / October / 18, 3));
}

TEST_CASE("Challenges: requests carry the challenge profile")
{
    const year_month_day date = year{2026} / October / 18;

    const GenerationRequest daily = ChallengeSchedule::MakeRequest(ChallengeKind::Daily, date, 2, DifficultyModifiers{});
    CHECK(daily.seed == 202610182U);
    CHECK(daily.config.playerCount == 2);
    CHECK(daily.config.difficultyScale == ChallengeConstants::DAILY_DIFFICULTY);
    CHECK(daily.profile.profileId == "daily-challenge");

    const GenerationRequest weekly = ChallengeSchedule::MakeRequest(ChallengeKind::Weekly, date, 3, DifficultyModifiers{});
    CHECK(weekly.seed == 202963U);
    CHECK(weekly.config.difficultyScale == ChallengeConstants::WEEKLY_DIFFICULTY);
    CHECK(weekly.profile.profileId == "weekly-elite");
}

TEST_CASE("Challenges: pregeneration is ordered and independent of the job system")
{
    const LevelGenerator generator = FixedClockGenerator();
    const year_month_day date = year{2026} / October / 18;

    const ChallengeSchedule serial(generator, nullptr);
    const std::vector<ChallengeLevel> expected = serial.PregenerateChallenges(ChallengeKind::Daily, date, DifficultyModifiers{});
    REQUIRE(expected.size() == 4);

    dimforge::core::JobSystem jobs(3);
    const ChallengeSchedule parallel(generator, &jobs);
    const std::vector<ChallengeLevel> actual = parallel.PregenerateChallenges(ChallengeKind::Daily, date, DifficultyModifiers{});
    REQUIRE(actual.size() == 4);

    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        CAPTURE(i);
        CHECK(expected[i].playerCount == static_cast<int>(i) + 1);
        CHECK(actual[i].playerCount == static_cast<int>(i) + 1);
        CHECK(actual[i].request.seed == ChallengeSchedule::DailySeed(date, static_cast<int>(i) + 1));
        CHECK(actual[i].level.fingerprint.id == expected[i].level.fingerprint.id);
        CHECK(actual[i].level.graph.edges.size() == expected[i].level.graph.edges.size());
        CHECK(actual[i].level.multiplayerZones.has_value() == (i > 0));
    }
}

TEST_CASE("Challenges: player cap and invalid dates")
{
    const LevelGenerator generator = FixedClockGenerator();
    const ChallengeSchedule schedule(generator, nullptr);

    CHECK(schedule.PregenerateChallenges(ChallengeKind::Weekly, year{2026} / October / 18, DifficultyModifiers{}, 2).size() == 2);
    CHECK(schedule.PregenerateChallenges(ChallengeKind::Daily, year{2026} / February / 30, DifficultyModifiers{}).empty());
}
