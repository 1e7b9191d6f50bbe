#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "dimforge/levelgen/LevelGenerator.hpp"
#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::core
{
class JobSystem;
}

namespace dimforge::levelgen
{
namespace ChallengeConstants
{
    constexpr int MIN_PLAYERS = 1;
    constexpr int MAX_PLAYERS = 4;
    constexpr double DAILY_DIFFICULTY = 0.75;
    constexpr double WEEKLY_DIFFICULTY = 0.9;
}

enum class ChallengeKind
{
    Daily,
    Weekly
};

const char* ChallengeKindToText(ChallengeKind kind);

struct ChallengeLevel
{
    ChallengeKind kind = ChallengeKind::Daily;
    int playerCount = 1;
    GenerationRequest request;
    GeneratedLevel level;
};

/**
 * Date-keyed challenge seeds shared by every player on the same calendar day
 * (or week), one level per player count.
 *
 * Dates are civil dates in UTC; a day boundary in another time zone is the
 * caller's business.
 */
class ChallengeSchedule
{
public:
    // `jobs` may be null; pregeneration then runs on the calling thread.
    ChallengeSchedule(const LevelGenerator& generator, core::JobSystem* jobs);

    // (Y*10000 + M*100 + D)*10 + players
    [[nodiscard]] static std::uint32_t DailySeed(const std::chrono::year_month_day& date, int playerCount);
    // Y*100 + week*10 + players
    [[nodiscard]] static std::uint32_t WeeklySeed(int year, int week, int playerCount);
    [[nodiscard]] static std::uint32_t WeeklySeed(const std::chrono::year_month_day& date, int playerCount);

    // Whole weeks elapsed since January 1st, first week is 0.
    [[nodiscard]] static int WeekOfYear(const std::chrono::year_month_day& date);

    [[nodiscard]] static GenerationRequest MakeRequest(
        ChallengeKind kind,
        const std::chrono::year_month_day& date,
        int playerCount,
        const DifficultyModifiers& modifiers
    );

    /**
     * Generates the challenge for every player count in [1, maxPlayers],
     * concurrently when a job system is attached. Results are ordered by player
     * count regardless of completion order. Returns empty for an invalid date.
     */
    [[nodiscard]] std::vector<ChallengeLevel> PregenerateChallenges(
        ChallengeKind kind,
        const std::chrono::year_month_day& date,
        const DifficultyModifiers& modifiers,
        int maxPlayers = ChallengeConstants::MAX_PLAYERS
    ) const;

    [[nodiscard]] static std::chrono::year_month_day TodayUtc();

private:
    const LevelGenerator& m_generator;
    core::JobSystem* m_jobs;
};
} // namespace dimforge::levelgen
