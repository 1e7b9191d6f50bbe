#include <doctest/doctest.h>

#include <thread>
#include <vector>

#include "dimforge/levelgen/LevelFingerprint.hpp"
#include "dimforge/levelgen/LevelRegistry.hpp"
#include "dimforge/levelgen/ParameterCalculator.hpp"
#include "dimforge/levelgen/SeededRandom.hpp"

using namespace dimforge::levelgen;

namespace
{
struct RegisteredLevel
{
    GenerationParameters parameters;
    LevelFingerprint fingerprint;
};

RegisteredLevel MakeLevel(std::uint32_t seed)
{
    const SeededRandom rng(seed);
    RegisteredLevel level;
    level.parameters = ParameterCalculator::Calculate(GeneratorConfig{}, DifficultyModifiers{}, ProfileContext{}, rng);
    level.fingerprint = GenerateLevelFingerprint(level.parameters, 100);
    return level;
}
} // namespace

TEST_CASE("Registry: register is idempotent")
{
    InMemoryLevelRegistry registry;
    const RegisteredLevel level = MakeLevel(42);

    const LevelFingerprint first = registry.Register(level.fingerprint, level.parameters);
    CHECK(registry.RecordAttempt(first.id, true, 90.0));

    LevelFingerprint again = level.fingerprint;
    again.createdAtMs = 999;
    const LevelFingerprint stored = registry.Register(again, level.parameters);

    CHECK(registry.Size() == 1);
    CHECK(stored.createdAtMs == 100);
    CHECK(stored.playCount == 1);
}

TEST_CASE("Registry: lookup by id and by short code")
{
    InMemoryLevelRegistry registry;
    const RegisteredLevel level = MakeLevel(42);
    registry.Register(level.fingerprint, level.parameters);

    REQUIRE(registry.Find("lvl-853aau").has_value());
    CHECK(registry.FindParameters("lvl-853aau")->nodeCount == 15);

    const auto exact = registry.FindByShortCode("YE7Q-RZ2C");
    REQUIRE(exact.has_value());
    CHECK(exact->id == "lvl-853aau");

    const auto lower = registry.FindByShortCode("ye7q-rz2c");
    REQUIRE(lower.has_value());
    CHECK(lower->id == "lvl-853aau");

    CHECK_FALSE(registry.Find("lvl-unknown").has_value());
    CHECK_FALSE(registry.FindParameters("lvl-unknown").has_value());
    CHECK_FALSE(registry.FindByShortCode("AAAA-AAAA").has_value());
}

TEST_CASE("Registry: attempt statistics")
{
    InMemoryLevelRegistry registry;
    const RegisteredLevel level = MakeLevel(7);
    const std::string id = registry.Register(level.fingerprint, level.parameters).id;

    CHECK(registry.RecordAttempt(id, true, 60.0));
    CHECK(registry.Find(id)->averageCompletionTime == doctest::Approx(60.0));
    CHECK(registry.Find(id)->completionRate == doctest::Approx(1.0));

    CHECK(registry.RecordAttempt(id, false, 200.0));
    LevelFingerprint stats = *registry.Find(id);
    CHECK(stats.playCount == 2);
    CHECK(stats.completionRate == doctest::Approx(0.5));
    CHECK(stats.averageCompletionTime == doctest::Approx(60.0)); // Failed runs are not timed

    CHECK(registry.RecordAttempt(id, true, 30.0));
    stats = *registry.Find(id);
    CHECK(stats.playCount == 3);
    CHECK(stats.completionRate == doctest::Approx(2.0 / 3.0));
    CHECK(stats.averageCompletionTime == doctest::Approx(45.0));

    CHECK(registry.RecordAttempt(id, true));
    stats = *registry.Find(id);
    CHECK(stats.playCount == 4);
    CHECK(stats.completionRate == doctest::Approx(0.75));
    CHECK(stats.averageCompletionTime == doctest::Approx(45.0));
}

TEST_CASE("Registry: unknown ids are reported")
{
    InMemoryLevelRegistry registry;
    CHECK_FALSE(registry.RecordAttempt("lvl-missing", true, 10.0));
    CHECK(registry.Size() == 0);
}

TEST_CASE("Registry: attempts from several threads are all counted")
{
    InMemoryLevelRegistry registry;
    const RegisteredLevel level = MakeLevel(1);
    const std::string id = registry.Register(level.fingerprint, level.parameters).id;

    constexpr int kThreads = 4;
    constexpr int kAttemptsPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&registry, &id] {
            for (int i = 0; i < kAttemptsPerThread; ++i)
            {
                registry.RecordAttempt(id, false);
            }
        });
    }
    for (std::thread& thread : threads)
    {
        thread.join();
    }

    CHECK(registry.Find(id)->playCount == kThreads * kAttemptsPerThread);
    CHECK(registry.Find(id)->completionRate == 0.0);
}

TEST_CASE("ApplyAttempt: first timed completion sets the average")
{
    LevelFingerprint fingerprint;
    ApplyAttempt(fingerprint, false, 0.0);
    CHECK(fingerprint.playCount == 1);
    CHECK(fingerprint.completionRate == 0.0);
    CHECK(fingerprint.averageCompletionTime == 0.0);

    ApplyAttempt(fingerprint, true, 12.5);
    CHECK(fingerprint.completionRate == doctest::Approx(0.5));
    CHECK(fingerprint.averageCompletionTime == doctest::Approx(12.5));
}
