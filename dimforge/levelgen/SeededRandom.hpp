#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace dimforge::levelgen
{
/**
 * Mulberry32 pseudo-random source.
 *
 * Every derived helper is expressed through Next() so that two instances built
 * from the same seed and driven by the same call sequence agree bit for bit on
 * any platform. One instance per generation call; never share across threads.
 */
class SeededRandom
{
public:
    explicit SeededRandom(std::uint32_t seed) : m_state(seed) {}

    // Uniform double in [0,1).
    double Next();

    // min + Next() * (max - min)
    double Range(double min, double max);

    // Inclusive on both ends.
    int Int(int min, int max);

    [[nodiscard]] std::size_t PickIndex(std::size_t count);

    // Caller guarantees a non-empty container.
    template <typename Container>
    const auto& Pick(const Container& items)
    {
        return items[PickIndex(std::size(items))];
    }

    // Fisher-Yates, returns a shuffled copy.
    template <typename T>
    [[nodiscard]] std::vector<T> Shuffle(const std::vector<T>& items)
    {
        std::vector<T> result = items;
        for (std::size_t i = result.size(); i-- > 1;)
        {
            const auto j = static_cast<std::size_t>(std::floor(Next() * static_cast<double>(i + 1)));
            std::swap(result[i], result[j]);
        }
        return result;
    }

    // Box-Muller.
    double Gaussian(double mean = 0.0, double stddev = 1.0);

    // Derives a decorrelated seed from the current state. Does not advance the state.
    [[nodiscard]] std::uint32_t SubSeed(std::string_view salt) const;

    [[nodiscard]] std::uint32_t State() const { return m_state; }

private:
    std::uint32_t m_state;
};

// Rolling hash shared by sub-seed derivation and level fingerprinting:
// hash = hash * 31 + code, wrapped to signed 32 bits.
[[nodiscard]] std::int32_t RollingHash32(std::string_view text, std::int32_t initial = 0);

// Math.round semantics: halves round toward positive infinity.
[[nodiscard]] double RoundHalfUp(double value);
} // namespace dimforge::levelgen
