#include "dimforge/levelgen/LevelFingerprint.hpp"

#include <cstdlib>

#include <glm/common.hpp>
#include <nlohmann/json.hpp>

#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
namespace
{
[[nodiscard]] std::int64_t Percent(double fraction)
{
    return static_cast<std::int64_t>(RoundHalfUp(fraction * 100.0));
}
} // namespace

double ComputeDifficultyRating(const GenerationParameters& params)
{
    const double structural =
        (static_cast<double>(params.nodeCount) / 50.0) * 15.0 +
        (static_cast<double>(params.edgeCount) / 100.0) * 15.0 +
        (static_cast<double>(params.dimensionLayers) / 5.0) * 10.0;

    const double skill =
        params.complexityScore * 20.0 +
        params.perceptionDemand * 15.0 +
        params.timePressure * 15.0;

    // Negative adaptation eases the level.
    const double adaptation = params.adaptationLevel * 10.0;

    return glm::clamp(structural + skill + adaptation, 0.0, FingerprintConstants::MAX_RATING);
}

DifficultyTier RatingToTier(double rating)
{
    if (rating < 20.0) return DifficultyTier::Beginner;
    if (rating < 40.0) return DifficultyTier::Intermediate;
    if (rating < 60.0) return DifficultyTier::Advanced;
    if (rating < 80.0) return DifficultyTier::Expert;
    return DifficultyTier::Transcendent;
}

std::string CanonicalParameterString(const GenerationParameters& params)
{
    nlohmann::ordered_json canonical;
    canonical["nc"] = params.nodeCount;
    canonical["ec"] = params.edgeCount;
    canonical["pc"] = params.portalCount;
    canonical["dl"] = params.dimensionLayers;
    canonical["cs"] = Percent(params.complexityScore);
    canonical["pd"] = Percent(params.perceptionDemand);
    canonical["tp"] = Percent(params.timePressure);
    canonical["cd"] = Percent(params.coordinationDemand);
    canonical["gs"] = params.geometrySeed;
    canonical["ps"] = params.patternSeed;
    return canonical.dump();
}

std::string ToBase36(std::uint64_t value)
{
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0)
    {
        return "0";
    }

    std::string text;
    while (value > 0)
    {
        text.insert(text.begin(), kDigits[value % 36U]);
        value /= 36U;
    }
    return text;
}

std::string HashLevelParameters(const GenerationParameters& params)
{
    const std::int32_t hash = RollingHash32(CanonicalParameterString(params));
    const auto magnitude = static_cast<std::uint64_t>(std::llabs(static_cast<long long>(hash)));
    return std::string(FingerprintConstants::ID_PREFIX) + ToBase36(magnitude);
}

std::string GenerateShortCode(std::string_view levelId)
{
    const std::string_view alphabet = FingerprintConstants::SHORT_CODE_ALPHABET;
    const std::int32_t hash = RollingHash32(levelId);

    std::string code;
    code.reserve(FingerprintConstants::SHORT_CODE_LENGTH + 1);
    for (int i = 0; i < FingerprintConstants::SHORT_CODE_LENGTH; ++i)
    {
        if (i == FingerprintConstants::SHORT_CODE_GROUP)
        {
            code.push_back('-');
        }
        // Arithmetic shift on the signed hash.
        const long long shifted = static_cast<long long>(hash >> (i * 4));
        const auto index = static_cast<std::size_t>(std::llabs(shifted)) % alphabet.size();
        code.push_back(alphabet[index]);
    }
    return code;
}

LevelFingerprint GenerateLevelFingerprint(const GenerationParameters& params, std::int64_t createdAtMs)
{
    LevelFingerprint fingerprint;
    fingerprint.id = HashLevelParameters(params);
    fingerprint.shortCode = GenerateShortCode(fingerprint.id);
    fingerprint.difficultyRating = ComputeDifficultyRating(params);
    fingerprint.difficultyTier = RatingToTier(fingerprint.difficultyRating);
    fingerprint.createdAtMs = createdAtMs;
    return fingerprint;
}
} // namespace dimforge::levelgen
