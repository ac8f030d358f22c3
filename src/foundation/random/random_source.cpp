/// @file random_source.cpp
/// @brief SeededRandomSource implementation.

#include "duel/foundation/random_source.hpp"

namespace duel::foundation {

namespace {

uint64_t entropySeed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

SeededRandomSource::SeededRandomSource()
    : SeededRandomSource(entropySeed()) {}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : seed_(seed), engine_(seed) {}

double SeededRandomSource::nextUnit() {
    // generate_canonical may round up to 1.0 on some implementations.
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    double value = dist(engine_);
    return value < 1.0 ? value : 0.0;
}

int32_t SeededRandomSource::nextInt(int32_t lo, int32_t hi) {
    std::uniform_int_distribution<int32_t> dist(lo, hi);
    return dist(engine_);
}

void SeededRandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

} // namespace duel::foundation
