#include "dimforge/levelgen/LevelRegistry.hpp"

#include <cctype>
#include <iostream>

#include "dimforge/levelgen/LevelFingerprint.hpp"
#include "dimforge/levelgen/SeededRandom.hpp"

namespace dimforge::levelgen
{
namespace
{
std::string ToUpper(std::string_view text)
{
    std::string result(text);
    for (char& c : result)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}
} // namespace

void ApplyAttempt(LevelFingerprint& fingerprint, bool completed, double completionTimeSeconds)
{
    const int previousPlays = fingerprint.playCount;
    const int plays = previousPlays + 1;

    // The rate is the only stored trace of past completions.
    const int previousCompleted = static_cast<int>(RoundHalfUp(fingerprint.completionRate * static_cast<double>(previousPlays)));
    const int completedCount = previousCompleted + (completed ? 1 : 0);

    if (completed && completionTimeSeconds > 0.0)
    {
        fingerprint.averageCompletionTime = fingerprint.averageCompletionTime > 0.0
            ? (fingerprint.averageCompletionTime * static_cast<double>(previousCompleted) + completionTimeSeconds) /
                static_cast<double>(completedCount)
            : completionTimeSeconds;
    }

    fingerprint.playCount = plays;
    fingerprint.completionRate = static_cast<double>(completedCount) / static_cast<double>(plays);
}

LevelFingerprint InMemoryLevelRegistry::Register(const LevelFingerprint& fingerprint, const GenerationParameters& params)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto existing = m_entries.find(fingerprint.id);
    if (existing != m_entries.end())
    {
        if (CanonicalParameterString(existing->second.parameters) != CanonicalParameterString(params))
        {
            std::cout << "[LevelRegistry] WARNING - Fingerprint collision on " << fingerprint.id
                      << ", keeping the first registration\n";
        }
        return existing->second.fingerprint;
    }

    const std::string code = ToUpper(fingerprint.shortCode);
    const auto [slot, inserted] = m_idByShortCode.emplace(code, fingerprint.id);
    if (!inserted)
    {
        std::cout << "[LevelRegistry] WARNING - Short code " << code << " already maps to " << slot->second
                  << ", " << fingerprint.id << " is only reachable by id\n";
    }

    m_entries.emplace(fingerprint.id, Entry{fingerprint, params});
    return fingerprint;
}

std::optional<LevelFingerprint> InMemoryLevelRegistry::Find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_entries.find(id);
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return it->second.fingerprint;
}

std::optional<GenerationParameters> InMemoryLevelRegistry::FindParameters(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_entries.find(id);
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return it->second.parameters;
}

std::optional<LevelFingerprint> InMemoryLevelRegistry::FindByShortCode(std::string_view shortCode) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto code = m_idByShortCode.find(ToUpper(shortCode));
    if (code == m_idByShortCode.end())
    {
        return std::nullopt;
    }
    const auto it = m_entries.find(code->second);
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return it->second.fingerprint;
}

bool InMemoryLevelRegistry::RecordAttempt(const std::string& id, bool completed, double completionTimeSeconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_entries.find(id);
    if (it == m_entries.end())
    {
        std::cout << "[LevelRegistry] WARNING - Attempt recorded for unknown level " << id << "\n";
        return false;
    }
    ApplyAttempt(it->second.fingerprint, completed, completionTimeSeconds);
    return true;
}

std::size_t InMemoryLevelRegistry::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}
} // namespace dimforge::levelgen
