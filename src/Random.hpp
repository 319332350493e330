#pragma once

#include <random>
#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>

// Process-wide generator shared by the twirling pass and MPS initialization.
class Random {
  public:
    static Random& get_instance() {
      static Random instance;
      return instance;
    }

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    static void seed_rng(uint32_t s) {
      Random& instance = get_instance();
      instance.seed = s;
      instance.rng.seed(s);
    }

    static uint32_t get_seed() {
      return get_instance().seed;
    }

    static std::mt19937& get_rng() {
      return get_instance().rng;
    }

  private:
    uint32_t seed;
    std::mt19937 rng;

    Random() {
      thread_local std::random_device rd;
      seed = rd();
      rng.seed(seed);
    }
};

static inline uint32_t randi() {
  return Random::get_rng()();
}

// Uniform integer in [min, max)
static inline uint32_t randi(uint32_t min, uint32_t max) {
  if (max <= min) {
    throw std::invalid_argument(fmt::format("Invalid range [{}, {}) passed to randi.", min, max));
  }

  std::uniform_int_distribution<uint32_t> dist(min, max - 1);
  return dist(Random::get_rng());
}

static inline double randf() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(Random::get_rng());
}

static inline double randn() {
  std::normal_distribution<double> dist(0.0, 1.0);
  return dist(Random::get_rng());
}
