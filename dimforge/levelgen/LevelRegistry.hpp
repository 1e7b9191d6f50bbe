#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
// Folds one play into the running statistics. completionTimeSeconds <= 0 means
// "not timed" and leaves the average untouched.
void ApplyAttempt(LevelFingerprint& fingerprint, bool completed, double completionTimeSeconds);

/**
 * Persistence boundary for fingerprints and play statistics.
 *
 * Generation never talks to a registry; callers register the fingerprint after
 * a level is built. Implementations must be safe to call from worker threads.
 */
class LevelRegistry
{
public:
    virtual ~LevelRegistry() = default;

    // Registering an id that already exists returns the stored entry unchanged.
    virtual LevelFingerprint Register(const LevelFingerprint& fingerprint, const GenerationParameters& params) = 0;

    [[nodiscard]] virtual std::optional<LevelFingerprint> Find(const std::string& id) const = 0;
    [[nodiscard]] virtual std::optional<GenerationParameters> FindParameters(const std::string& id) const = 0;

    // Case-insensitive.
    [[nodiscard]] virtual std::optional<LevelFingerprint> FindByShortCode(std::string_view shortCode) const = 0;

    // Returns false for an unknown id.
    virtual bool RecordAttempt(const std::string& id, bool completed, double completionTimeSeconds = 0.0) = 0;

    [[nodiscard]] virtual std::size_t Size() const = 0;
};

class InMemoryLevelRegistry final : public LevelRegistry
{
public:
    LevelFingerprint Register(const LevelFingerprint& fingerprint, const GenerationParameters& params) override;

    [[nodiscard]] std::optional<LevelFingerprint> Find(const std::string& id) const override;
    [[nodiscard]] std::optional<GenerationParameters> FindParameters(const std::string& id) const override;
    [[nodiscard]] std::optional<LevelFingerprint> FindByShortCode(std::string_view shortCode) const override;

    bool RecordAttempt(const std::string& id, bool completed, double completionTimeSeconds = 0.0) override;

    [[nodiscard]] std::size_t Size() const override;

private:
    struct Entry
    {
        LevelFingerprint fingerprint;
        GenerationParameters parameters;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
    std::unordered_map<std::string, std::string> m_idByShortCode;
};
} // namespace dimforge::levelgen
