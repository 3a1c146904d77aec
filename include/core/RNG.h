#pragma once
#include <cstdint>
#include <random>

// Random source shared by one engine run. Owned by the engine and seeded once,
// so independent engines never share state.
using Rng = std::mt19937_64;

inline double uniformReal(Rng& rng, double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

// Fresh seed for runs that did not specify one.
inline std::uint64_t generateSeed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}
