#include <doctest/doctest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "dimforge/levelgen/LevelGenerator.hpp"
#include "dimforge/levelgen/LevelIO.hpp"

using namespace dimforge::levelgen;
using json = nlohmann::json;

namespace
{
class ScratchDirectory
{
public:
    explicit ScratchDirectory(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~ScratchDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

GeneratedLevel MakeLevel(std::uint32_t seed, int playerCount)
{
    const LevelGenerator generator([] { return std::int64_t{1234}; });
    GeneratorConfig config;
    config.playerCount = playerCount;
    return generator.Generate(seed, config, DifficultyModifiers{});
}
} // namespace

TEST_CASE("LevelIO: level JSON carries the full document")
{
    const GeneratedLevel level = MakeLevel(42, 1);
    const json root = LevelIO::LevelToJson(level);

    CHECK(root["fingerprint"]["id"] == "lvl-853aau");
    CHECK(root["fingerprint"]["short_code"] == "YE7Q-RZ2C");
    CHECK(root["fingerprint"]["difficulty_tier"] == "intermediate");
    CHECK(root["fingerprint"]["created_at_ms"] == 1234);

    CHECK(root["parameters"]["node_count"] == 15);
    CHECK(root["parameters"]["geometry_seed"] == 1052623204U);

    REQUIRE(root["graph"]["nodes"].size() == 15);
    REQUIRE(root["graph"]["edges"].size() == 23);
    REQUIRE(root["graph"]["portals"].size() == 4);

    const json& node = root["graph"]["nodes"][0];
    CHECK(node["position"].is_array());
    CHECK(node["position"].size() == 3);
    CHECK(node["layer"] == "dimension-0");
    CHECK(node["data"].is_object());

    for (const json& entry : root["graph"]["nodes"])
    {
        if (entry["role"] == "puzzle")
        {
            CHECK(entry["data"]["kind"] == "puzzle");
            CHECK(entry["data"].contains("puzzle_type"));
        }
        if (entry["role"] == "transit")
        {
            CHECK(entry["data"].empty());
        }
    }

    CHECK(root["graph"]["portals"][0]["type"] == "inter-dimension");
    CHECK(root["layers"][0]["visual_style"]["primary_color"] == "#667eea");
    CHECK(root["layers"][0]["visual_style"]["geometry_style"] == "crystalline");
    CHECK(root["objectives"][0]["type"] == "reach");
    CHECK(root["spawn_point"].size() == 3);
    CHECK_FALSE(root.contains("multiplayer_zones"));
    CHECK(root["diagnostics"]["connected"] == true);
}

TEST_CASE("LevelIO: multiplayer zones are emitted even when empty")
{
    const json root = LevelIO::LevelToJson(MakeLevel(7, 2));
    REQUIRE(root.contains("multiplayer_zones"));
    CHECK(root["multiplayer_zones"].is_array());
    CHECK(root["multiplayer_zones"].empty());
}

TEST_CASE("LevelIO: hex color strings")
{
    CHECK(LevelIO::ColorToHexString(glm::dvec3(0.0)) == "#000000");
    CHECK(LevelIO::ColorToHexString(glm::dvec3(1.0)) == "#ffffff");
    CHECK(LevelIO::ColorToHexString(glm::dvec3(1.0, 0.0, 0.0)) == "#ff0000");
}

TEST_CASE("LevelIO: request files round-trip through disk")
{
    ScratchDirectory scratch("dimforge_level_io_test");

    GenerationRequest request;
    request.seed = 4000000000U;
    request.config.baseNodeCount = 22;
    request.config.playerCount = 3;
    request.modifiers.witnessAffinity = 0.8;
    request.profile.profileId = "player-77";
    request.profile.adaptationLevel = -0.25;

    const std::filesystem::path path = scratch.Path() / "request.json";
    std::string error;
    REQUIRE(LevelIO::WriteGenerationRequestFile(path, request, &error));

    GenerationRequest loaded;
    REQUIRE(LevelIO::ReadGenerationRequestFile(path, &loaded, &error));
    CHECK(loaded.seed == 4000000000U);
    CHECK(loaded.config.baseNodeCount == 22);
    CHECK(loaded.config.playerCount == 3);
    CHECK(loaded.modifiers.witnessAffinity == 0.8);
    CHECK(loaded.profile.profileId == "player-77");
    CHECK(loaded.profile.adaptationLevel == -0.25);
}

TEST_CASE("LevelIO: level file is written as JSON")
{
    ScratchDirectory scratch("dimforge_level_file_test");
    const GeneratedLevel level = MakeLevel(42, 1);
    const std::filesystem::path path = scratch.Path() / "level.json";

    std::string error;
    REQUIRE(LevelIO::WriteLevelFile(path, level, &error));

    std::ifstream stream(path);
    REQUIRE(stream.is_open());
    const json parsed = json::parse(stream);
    CHECK(parsed["fingerprint"]["id"] == "lvl-853aau");
}

TEST_CASE("LevelIO: missing request keys keep their defaults")
{
    const json root = {{"asset_version", kRequestAssetVersion}, {"seed", 9}};
    GenerationRequest loaded;
    std::string error;
    REQUIRE(LevelIO::RequestFromJson(root, &loaded, &error));
    CHECK(loaded.seed == 9);
    CHECK(loaded.config.baseNodeCount == 15);
    CHECK(loaded.modifiers.timePressure == 0.5);
    CHECK(loaded.profile.profileId == "default");
}

TEST_CASE("LevelIO: negative request seeds wrap to their 32-bit pattern")
{
    GenerationRequest loaded;
    std::string error;

    REQUIRE(LevelIO::RequestFromJson(json{{"asset_version", kRequestAssetVersion}, {"seed", -4}}, &loaded, &error));
    CHECK(loaded.seed == 4294967292U);

    REQUIRE(LevelIO::RequestFromJson(json{{"asset_version", kRequestAssetVersion}, {"seed", -2147483648LL}}, &loaded, &error));
    CHECK(loaded.seed == 2147483648U);

    std::uint32_t seed = 0;
    CHECK(LevelIO::SeedFromInteger(4294967295LL, &seed));
    CHECK(seed == 4294967295U);
    CHECK_FALSE(LevelIO::SeedFromInteger(4294967296LL, &seed));
    CHECK_FALSE(LevelIO::SeedFromInteger(-2147483649LL, &seed));
}

TEST_CASE("LevelIO: a profile id that is not UTF-8 fails serialization without throwing")
{
    ScratchDirectory scratch("dimforge_level_utf8_test");

    GenerationRequest request;
    request.seed = 5;
    request.profile.profileId = "\xff\xfe";
    CHECK_FALSE(LevelIO::IsValidUtf8(request.profile.profileId));
    CHECK(LevelIO::IsValidUtf8("caf\xc3\xa9"));

    const LevelGenerator generator([] { return std::int64_t{1234}; });
    const GeneratedLevel level = generator.Generate(request);

    std::string text;
    std::string error;
    CHECK_FALSE(LevelIO::LevelToJsonText(level, 2, &text, &error));
    CHECK(error.find("UTF-8") != std::string::npos);

    const std::filesystem::path path = scratch.Path() / "level.json";
    error.clear();
    CHECK_FALSE(LevelIO::WriteLevelFile(path, level, &error));
    CHECK_FALSE(error.empty());
    CHECK_FALSE(std::filesystem::exists(path));

    request.profile.profileId = "player-5";
    const GeneratedLevel clean = generator.Generate(request);
    REQUIRE(LevelIO::LevelToJsonText(clean, -1, &text, &error));
    CHECK(json::parse(text)["parameters"]["profile_seed"].is_string());
}

TEST_CASE("LevelIO: bad requests are rejected with a message")
{
    GenerationRequest loaded;
    std::string error;

    SUBCASE("Wrong version")
    {
        const json root = {{"asset_version", 99}, {"seed", 1}};
        CHECK_FALSE(LevelIO::RequestFromJson(root, &loaded, &error));
        CHECK(error.find("version") != std::string::npos);
    }

    SUBCASE("Seed below 32 bits")
    {
        const json root = {{"asset_version", kRequestAssetVersion}, {"seed", -2147483649LL}};
        CHECK_FALSE(LevelIO::RequestFromJson(root, &loaded, &error));
        CHECK(error.find("Seed") != std::string::npos);
    }

    SUBCASE("Seed above 32 bits")
    {
        const json root = {{"asset_version", kRequestAssetVersion}, {"seed", 5000000000LL}};
        CHECK_FALSE(LevelIO::RequestFromJson(root, &loaded, &error));
    }

    SUBCASE("Wrong value type")
    {
        json root = {{"asset_version", kRequestAssetVersion}, {"seed", 1}};
        root["config"] = {{"player_count", "two"}};
        CHECK_FALSE(LevelIO::RequestFromJson(root, &loaded, &error));
        CHECK(error.find("Malformed") != std::string::npos);
    }

    SUBCASE("Not an object")
    {
        CHECK_FALSE(LevelIO::RequestFromJson(json::array({1, 2}), &loaded, &error));
    }

    SUBCASE("Missing file")
    {
        CHECK_FALSE(LevelIO::ReadGenerationRequestFile("/nonexistent/dimforge/request.json", &loaded, &error));
        CHECK(error.find("Unable to open") != std::string::npos);
    }
}
