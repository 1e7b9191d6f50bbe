#include "dimforge/levelgen/ChallengeSchedule.hpp"

#include <algorithm>
#include <iostream>

#include "dimforge/core/JobSystem.hpp"

namespace dimforge::levelgen
{
namespace
{
[[nodiscard]] int ClampPlayers(int playerCount)
{
    return std::clamp(playerCount, ChallengeConstants::MIN_PLAYERS, ChallengeConstants::MAX_PLAYERS);
}
} // namespace

const char* ChallengeKindToText(ChallengeKind kind)
{
    switch (kind)
    {
        case ChallengeKind::Daily: return "daily";
        case ChallengeKind::Weekly: return "weekly";
        default: return "daily";
    }
}

ChallengeSchedule::ChallengeSchedule(const LevelGenerator& generator, core::JobSystem* jobs)
    : m_generator(generator)
    , m_jobs(jobs)
{
}

std::uint32_t ChallengeSchedule::DailySeed(const std::chrono::year_month_day& date, int playerCount)
{
    const auto year = static_cast<std::int64_t>(static_cast<int>(date.year()));
    const auto month = static_cast<std::int64_t>(static_cast<unsigned>(date.month()));
    const auto day = static_cast<std::int64_t>(static_cast<unsigned>(date.day()));
    const std::int64_t dateSeed = year * 10000 + month * 100 + day;
    return static_cast<std::uint32_t>(dateSeed * 10 + ClampPlayers(playerCount));
}

std::uint32_t ChallengeSchedule::WeeklySeed(int year, int week, int playerCount)
{
    const std::int64_t seed =
        static_cast<std::int64_t>(year) * 100 + static_cast<std::int64_t>(week) * 10 + ClampPlayers(playerCount);
    return static_cast<std::uint32_t>(seed);
}

std::uint32_t ChallengeSchedule::WeeklySeed(const std::chrono::year_month_day& date, int playerCount)
{
    return WeeklySeed(static_cast<int>(date.year()), WeekOfYear(date), playerCount);
}

int ChallengeSchedule::WeekOfYear(const std::chrono::year_month_day& date)
{
    using namespace std::chrono;
    const sys_days day{date};
    const sys_days firstOfYear{date.year() / January / 1};
    return static_cast<int>((day - firstOfYear).count() / 7);
}

GenerationRequest ChallengeSchedule::MakeRequest(
    ChallengeKind kind,
    const std::chrono::year_month_day& date,
    int playerCount,
    const DifficultyModifiers& modifiers
)
{
    GenerationRequest request;
    request.config.playerCount = ClampPlayers(playerCount);
    request.modifiers = modifiers;

    if (kind == ChallengeKind::Daily)
    {
        request.seed = DailySeed(date, request.config.playerCount);
        request.config.difficultyScale = ChallengeConstants::DAILY_DIFFICULTY;
        request.profile.profileId = "daily-challenge";
    }
    else
    {
        request.seed = WeeklySeed(date, request.config.playerCount);
        request.config.difficultyScale = ChallengeConstants::WEEKLY_DIFFICULTY;
        request.profile.profileId = "weekly-elite";
    }
    return request;
}

std::vector<ChallengeLevel> ChallengeSchedule::PregenerateChallenges(
    ChallengeKind kind,
    const std::chrono::year_month_day& date,
    const DifficultyModifiers& modifiers,
    int maxPlayers
) const
{
    std::vector<ChallengeLevel> results;
    if (!date.ok())
    {
        std::cerr << "[Challenges] ERROR - Invalid challenge date\n";
        return results;
    }

    const int playerSlots = ClampPlayers(maxPlayers);
    results.resize(static_cast<std::size_t>(playerSlots));

    // Each slot is written by exactly one job; the generator itself is const.
    auto generateSlot = [this, kind, &date, &modifiers, &results](std::size_t index) {
        ChallengeLevel& slot = results[index];
        slot.kind = kind;
        slot.playerCount = static_cast<int>(index) + 1;
        slot.request = MakeRequest(kind, date, slot.playerCount, modifiers);
        slot.level = m_generator.Generate(slot.request);
    };

    if (m_jobs == nullptr)
    {
        for (std::size_t i = 0; i < results.size(); ++i)
        {
            generateSlot(i);
        }
    }
    else
    {
        core::JobCounter counter;
        m_jobs->ParallelFor(results.size(), 1, generateSlot, &counter);
        m_jobs->WaitForCounter(counter);
    }

    std::cout << "[Challenges] Pregenerated " << results.size() << " " << ChallengeKindToText(kind)
              << " challenge(s) for " << static_cast<int>(date.year()) << "-"
              << static_cast<unsigned>(date.month()) << "-" << static_cast<unsigned>(date.day()) << "\n";
    return results;
}

std::chrono::year_month_day ChallengeSchedule::TodayUtc()
{
    return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}
} // namespace dimforge::levelgen
