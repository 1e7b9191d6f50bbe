#pragma once

#include <cstdint>
#include <functional>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
// Everything one generation call consumes. Identical requests give identical
// levels apart from fingerprint.createdAtMs.
struct GenerationRequest
{
    std::uint32_t seed = 0;
    GeneratorConfig config;
    DifficultyModifiers modifiers;
    ProfileContext profile;
};

class LevelGenerator
{
public:
    // Milliseconds since the Unix epoch.
    using Clock = std::function<std::int64_t()>;

    LevelGenerator();
    explicit LevelGenerator(Clock clock);

    // Pass an empty function to restore the system clock.
    void SetClock(Clock clock);

    [[nodiscard]] GeneratedLevel Generate(const GenerationRequest& request) const;
    [[nodiscard]] GeneratedLevel Generate(
        std::uint32_t seed,
        const GeneratorConfig& config,
        const DifficultyModifiers& modifiers,
        const ProfileContext& profile = {}
    ) const;

    [[nodiscard]] static std::int64_t SystemClockMs();

    static constexpr double DEFAULT_EXIT_X = 10.0;
    static constexpr double DEFAULT_EXIT_Y = 10.0;

private:
    Clock m_clock;
};
} // namespace dimforge::levelgen
