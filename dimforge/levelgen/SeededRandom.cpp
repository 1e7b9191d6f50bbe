#include "dimforge/levelgen/SeededRandom.hpp"

#include <cstdlib>

#include <glm/gtc/constants.hpp>

namespace dimforge::levelgen
{
namespace
{
constexpr std::uint32_t kMulberryIncrement = 0x6D2B79F5U;
constexpr double kTwoPow32 = 4294967296.0;
} // namespace

double SeededRandom::Next()
{
    m_state += kMulberryIncrement;
    std::uint32_t t = m_state;
    t = (t ^ (t >> 15U)) * (t | 1U);
    t ^= t + (t ^ (t >> 7U)) * (t | 61U);
    return static_cast<double>(t ^ (t >> 14U)) / kTwoPow32;
}

double SeededRandom::Range(double min, double max)
{
    return min + Next() * (max - min);
}

int SeededRandom::Int(int min, int max)
{
    return static_cast<int>(std::floor(Range(static_cast<double>(min), static_cast<double>(max) + 1.0)));
}

std::size_t SeededRandom::PickIndex(std::size_t count)
{
    return static_cast<std::size_t>(std::floor(Next() * static_cast<double>(count)));
}

double SeededRandom::Gaussian(double mean, double stddev)
{
    const double u = 1.0 - Next();
    const double v = Next();
    const double z = std::sqrt(-2.0 * std::log(u)) * std::cos(2.0 * glm::pi<double>() * v);
    return z * stddev + mean;
}

std::uint32_t SeededRandom::SubSeed(std::string_view salt) const
{
    const std::int32_t hash = RollingHash32(salt, static_cast<std::int32_t>(m_state));
    return static_cast<std::uint32_t>(std::llabs(static_cast<long long>(hash)));
}

std::int32_t RollingHash32(std::string_view text, std::int32_t initial)
{
    // Unsigned arithmetic gives the two's-complement wrap without signed overflow.
    std::uint32_t hash = static_cast<std::uint32_t>(initial);
    for (const char c : text)
    {
        hash = hash * 31U + static_cast<std::uint32_t>(static_cast<unsigned char>(c));
    }
    return static_cast<std::int32_t>(hash);
}

double RoundHalfUp(double value)
{
    return std::floor(value + 0.5);
}
} // namespace dimforge::levelgen
