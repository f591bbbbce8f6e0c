#pragma once

#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <string_view>

// Source of the simulation's pseudo-random values: opaque ids and small jitter.
class RandomSource {
public:
    RandomSource() : rng_(std::random_device{}()) {}
    explicit RandomSource(uint32_t seed) : rng_(seed) {}

    // Returns e.g. "thread-1a2b3c4d" for prefix "thread".
    std::string hex_id(std::string_view prefix) {
        std::uniform_int_distribution<uint32_t> dist;
        return std::format("{}-{:08x}", prefix, dist(rng_));
    }

    // Uniform integer in [lo, hi].
    int uniform(int lo, int hi) {
        if (hi < lo) return lo;
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

private:
    std::mt19937 rng_;
};
