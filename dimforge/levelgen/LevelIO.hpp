#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "dimforge/levelgen/LevelGenerator.hpp"
#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
constexpr int kRequestAssetVersion = 1;

/**
 * JSON export of generated levels and import of generation requests.
 *
 * Export is one-way: renderers and backends consume the level JSON, nothing
 * reads it back. Requests round-trip so a level can be recreated from a file.
 */
class LevelIO
{
public:
    [[nodiscard]] static nlohmann::json LevelToJson(const GeneratedLevel& level);
    [[nodiscard]] static nlohmann::json ParametersToJson(const GenerationParameters& params);
    [[nodiscard]] static nlohmann::json FingerprintToJson(const LevelFingerprint& fingerprint);

    [[nodiscard]] static nlohmann::json RequestToJson(const GenerationRequest& request);
    // Missing keys keep their defaults; range clamping is left to the calculator.
    [[nodiscard]] static bool RequestFromJson(const nlohmann::json& root, GenerationRequest* outRequest, std::string* outError = nullptr);

    // Serialized level text; false when a string field is not valid UTF-8.
    [[nodiscard]] static bool LevelToJsonText(const GeneratedLevel& level, int indent, std::string* outText, std::string* outError = nullptr);

    // Accepts [INT32_MIN, UINT32_MAX]; negative values wrap to their 32-bit pattern.
    [[nodiscard]] static bool SeedFromInteger(std::int64_t value, std::uint32_t* outSeed);
    [[nodiscard]] static bool IsValidUtf8(const std::string& text);

    [[nodiscard]] static bool WriteLevelFile(const std::filesystem::path& path, const GeneratedLevel& level, std::string* outError = nullptr);
    [[nodiscard]] static bool WriteGenerationRequestFile(const std::filesystem::path& path, const GenerationRequest& request, std::string* outError = nullptr);
    [[nodiscard]] static bool ReadGenerationRequestFile(const std::filesystem::path& path, GenerationRequest* outRequest, std::string* outError = nullptr);

    // "#rrggbb"
    [[nodiscard]] static std::string ColorToHexString(const glm::dvec3& color);
};
} // namespace dimforge::levelgen
