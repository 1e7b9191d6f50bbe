#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
namespace FingerprintConstants
{
    constexpr std::string_view ID_PREFIX = "lvl-";
    constexpr std::string_view SHORT_CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
    constexpr int SHORT_CODE_LENGTH = 8;
    constexpr int SHORT_CODE_GROUP = 4;
    constexpr double MAX_RATING = 100.0;
}

// Structural + skill + adaptation terms, clamped to [0, 100].
[[nodiscard]] double ComputeDifficultyRating(const GenerationParameters& params);
[[nodiscard]] DifficultyTier RatingToTier(double rating);

/**
 * Compact JSON over the parameter subset that identifies a level:
 * {"nc","ec","pc","dl","cs","pd","tp","cd","gs","ps"} in that order, fractional
 * scores as integer percent (half rounds up). Key order and formatting are part
 * of the fingerprint and must not change.
 */
[[nodiscard]] std::string CanonicalParameterString(const GenerationParameters& params);

// "lvl-" + base-36 of |RollingHash32(canonical)|.
[[nodiscard]] std::string HashLevelParameters(const GenerationParameters& params);

// XXXX-XXXX over the 32-symbol alphabet, derived from the level id.
[[nodiscard]] std::string GenerateShortCode(std::string_view levelId);

[[nodiscard]] LevelFingerprint GenerateLevelFingerprint(const GenerationParameters& params, std::int64_t createdAtMs);

[[nodiscard]] std::string ToBase36(std::uint64_t value);
} // namespace dimforge::levelgen
