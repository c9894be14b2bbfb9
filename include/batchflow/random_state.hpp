#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace batchflow {

/**
 * @brief Seedable pseudo random source owned by a single iterator.
 *
 * Every iterator that draws random numbers holds its own RandomState so two
 * pipelines never influence each other. The stored seed allows the sequence
 * to be restarted with reset(), which is how callers reproduce an epoch.
 * When no seed is given one is drawn from std::random_device.
 */
class RandomState {
  public:
    using Seed = std::uint32_t;

    explicit RandomState(std::optional<Seed> seed = std::nullopt)
        : seed_{seed ? *seed : std::random_device{}()}, rng_{seed_} {}

    Seed get_seed() const { return seed_; }

    /// Re-seed and restart the sequence from the beginning.
    void set_seed(Seed seed) {
        seed_ = seed;
        rng_.seed(seed_);
    }

    /// Restart the sequence from the stored seed.
    void reset() { rng_.seed(seed_); }

    /// Draw a seed suitable for a child generator.
    Seed generate_seed() {
        std::uniform_int_distribution<Seed> dist(0, std::numeric_limits<Seed>::max());
        return dist(rng_);
    }

    /// Create an independent RandomState seeded from this one unless a seed is given.
    RandomState create_random_state(std::optional<Seed> seed = std::nullopt) {
        return RandomState{seed ? *seed : generate_seed()};
    }

    /// Uniform sample in [0, 1).
    double random_sample() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng_);
    }

    /// Uniform integer in the closed interval [low, high].
    std::size_t random_integer(std::size_t low, std::size_t high) {
        std::uniform_int_distribution<std::size_t> dist(low, high);
        return dist(rng_);
    }

    /// @p count uniform integers in [low, high].
    std::vector<std::size_t> random_integers(std::size_t low, std::size_t high, std::size_t count) {
        std::uniform_int_distribution<std::size_t> dist(low, high);
        std::vector<std::size_t> out(count);
        for (auto& v : out)
            v = dist(rng_);
        return out;
    }

    /// Zero mean, unit variance Gaussian samples.
    std::vector<double> standard_normal(std::size_t count) {
        std::normal_distribution<double> dist(0.0, 1.0);
        std::vector<double> out(count);
        for (auto& v : out)
            v = dist(rng_);
        return out;
    }

    template <typename T> void shuffle(std::vector<T>& values) {
        std::shuffle(values.begin(), values.end(), rng_);
    }

  private:
    Seed seed_;
    std::mt19937 rng_;
};

} // namespace batchflow
