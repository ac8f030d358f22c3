#pragma once

/// @file random_source.hpp
/// @brief Injectable random number source for reproducible combat rolls.

#include <cstdint>
#include <random>

namespace duel::foundation {

/// Source of every random draw the engine makes.
///
/// A match pulls all of its randomness from one injected source, so a
/// fixed seed (or a scripted source in tests) reproduces a whole match.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform real in [0, 1).
    virtual double nextUnit() = 0;

    /// Uniform integer in [lo, hi], both inclusive. Requires lo <= hi.
    virtual int32_t nextInt(int32_t lo, int32_t hi) = 0;
};

/// Mersenne-twister backed source.
///
/// Not thread-safe; give each concurrently running match its own instance.
class SeededRandomSource final : public RandomSource {
public:
    /// Seed from std::random_device.
    SeededRandomSource();

    explicit SeededRandomSource(uint64_t seed);

    double nextUnit() override;
    int32_t nextInt(int32_t lo, int32_t hi) override;

    /// Restart the sequence from @p seed.
    void reseed(uint64_t seed);

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_ = 0;
    std::mt19937_64 engine_;
};

} // namespace duel::foundation
