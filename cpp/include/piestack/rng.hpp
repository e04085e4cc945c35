#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace ps {

// Single stochastic stream of a run. Every random decision of the simulation
// draws from one instance so a recorded seed replays the whole run.
class DeterministicRng {
  public:
    explicit DeterministicRng(uint64_t seed = 0) : seed_(seed), eng_(seed) {}

    uint64_t seed() const { return seed_; }

    void reseed(uint64_t seed) {
        seed_ = seed;
        eng_.seed(seed);
    }

    float uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(eng_);
    }

    int uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(eng_);
    }

    float unit() { return uniform(0.0f, 1.0f); }

    bool chance(float p) { return unit() < p; }

    template <typename T, size_t N>
    const T& choice(const std::array<T, N>& items) {
        static_assert(N > 0, "choice over an empty array");
        return items[static_cast<size_t>(uniform_int(0, static_cast<int>(N) - 1))];
    }

    size_t weighted_index(const std::vector<int>& weights) {
        std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
        return dist(eng_);
    }

  private:
    uint64_t seed_ = 0;
    std::mt19937_64 eng_;
};

} // namespace ps
